#include "repository.hxx"

#include "utility.hxx"

#include <git2/errors.h>
#include <git2/repository.h>

#include <format>

NoRepository::NoRepository(const std::filesystem::path& location)
	: std::runtime_error(std::format("no git repo exists here: {}", location.string()))
	, location_{location}
{
}

RepositoryPtr discoverRepository(const std::filesystem::path& location)
{
	git_repository* result{};
	int error = git_repository_open_ext(&result, location.c_str(), 0, nullptr);
	if (error == GIT_ENOTFOUND) {
		return {};
	}
	LibgitError::check(error);
	return RepositoryPtr{result};
}

RepositoryPtr openRepository(const std::filesystem::path& location)
{
	RepositoryPtr repo{discoverRepository(location)};
	if (!repo) {
		throw NoRepository(location);
	}
	return repo;
}
