#include "utility.hxx"

#include <git2/global.h>

#include <algorithm>
#include <cctype>
#include <format>

namespace {
	std::string describe(int errorCode, const git_error* error)
	{
		if (!error) {
			return std::format("libgit2 error {}", errorCode);
		}
		return std::format("libgit2 error {}/{}: {}", errorCode, error->klass, error->message);
	}
} // namespace

void toLower(std::string& s)
{
	std::ranges::transform(s, s.begin(), ::tolower);
}

std::string toLowerCopy(std::string_view s)
{
	std::string result{s};
	toLower(result);
	return result;
}

LibgitError::LibgitError(int errorCode, const git_error* error)
	: std::runtime_error(describe(errorCode, error))
	, code_{errorCode}
{
}

LibgitError::LibgitError(int error)
	: LibgitError(error, git_error_last())
{
}

void LibgitError::check(int error)
{
	if (error < 0) {
		throw LibgitError(error);
	}
}

LibGit2Session::LibGit2Session()
{
	LibgitError::check(git_libgit2_init());
}

LibGit2Session::~LibGit2Session()
{
	git_libgit2_shutdown();
}
