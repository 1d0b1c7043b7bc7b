#include "scope.hxx"

#include "variable.hxx"

#include <format>
#include <ostream>
#include <stdexcept>

namespace {
	namespace names {
		constexpr std::string_view deFacto{"de_facto"};
		constexpr std::string_view local{"local"};
		constexpr std::string_view global{"global"};
	}
} // namespace

std::string_view toString(ConfigScope scope)
{
	switch (scope) {
		case ConfigScope::DeFacto:
			return names::deFacto;
		case ConfigScope::Local:
			return names::local;
		case ConfigScope::Global:
			return names::global;
	}
	throw std::invalid_argument("Unknown config scope");
}

ConfigScope parseScope(std::string_view name)
{
	if (name == names::deFacto) {
		return ConfigScope::DeFacto;
	}
	if (name == names::local) {
		return ConfigScope::Local;
	}
	if (name == names::global) {
		return ConfigScope::Global;
	}
	throw UsageError{std::format("Unknown config scope '{}', expected de_facto, local or global", name)};
}

ConfigSources resolveSources(ConfigScope scope, git_repository* repo)
{
	ConfigSources result;
	if (scope != ConfigScope::Global && repo) {
		result.local = Config::openLocal(*repo);
	}
	if (scope != ConfigScope::Local) {
		result.global = Config::openGlobal();
	}
	return result;
}

ConfigScope resolveWriteScope(ConfigScope scope, std::ostream& notices)
{
	if (scope != ConfigScope::DeFacto) {
		return scope;
	}
	notices << "setting where = \"" << names::local << '"' << std::endl;
	return ConfigScope::Local;
}
