#pragma once

#include "config.hxx"

#include <git2/types.h>

#include <iosfwd>
#include <optional>
#include <string_view>

enum class ConfigScope {
	/// global overridden by local, read only
	DeFacto,
	Local,
	Global,
};

std::string_view toString(ConfigScope scope);
ConfigScope parseScope(std::string_view name);

struct ConfigSources {
	std::optional<Config> local;
	std::optional<Config> global;
};

ConfigSources resolveSources(ConfigScope scope, git_repository* repo);

/**
 * @brief The scope a write at @p scope goes to. DeFacto is redirected to Local, which
 * is reported on @p notices.
 */
ConfigScope resolveWriteScope(ConfigScope scope, std::ostream& notices);
