#pragma once

#include <git2/types.h>

#include <filesystem>
#include <memory>
#include <stdexcept>

struct git_repo_deleter {
	void operator()(git_repository* repo)
	{
		if (repo) {
			git_repository_free(repo);
		}
	}
};

using RepositoryPtr = std::unique_ptr<git_repository, git_repo_deleter>;

class NoRepository: public std::runtime_error {
public:
	NoRepository(const std::filesystem::path& location);

	const std::filesystem::path& location() const { return location_; }

private:
	std::filesystem::path location_;
};

/**
 * @brief Opens the repository containing @p location, searching parent directories
 *
 * @return null if @p location is not inside a git repository
 */
RepositoryPtr discoverRepository(const std::filesystem::path& location);

RepositoryPtr openRepository(const std::filesystem::path& location);
