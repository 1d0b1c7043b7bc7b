#pragma once

#include <git2/errors.h>

#include <stdexcept>
#include <string>
#include <string_view>

void toLower(std::string& s);
std::string toLowerCopy(std::string_view s);

class LibgitError: public std::runtime_error {
public:
	LibgitError(int errorCode, const git_error* error);
	LibgitError(int error);

	int code() const { return code_; }

	static void check(int error);

private:
	int code_;
};

struct LibGit2Session {
	LibGit2Session();
	~LibGit2Session();

	LibGit2Session(const LibGit2Session&) = delete;
	LibGit2Session& operator=(const LibGit2Session&) = delete;
};
