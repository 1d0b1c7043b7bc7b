#include "git-config.hxx"

#include "reader.hxx"
#include "writer.hxx"

ConfigSnapshot gitConfig(
	const std::vector<Argument>& args,
	ConfigScope scope,
	const std::filesystem::path& location,
	std::ostream& notices)
{
	return applyArguments(normalize(args), scope, location, notices);
}

ConfigSnapshot applyArguments(
	const NormalizedArguments& normalized,
	ConfigScope scope,
	const std::filesystem::path& location,
	std::ostream& notices)
{
	if (normalized.isQuery) {
		return readConfig(normalized.names(), scope, location);
	}

	// the previous values come from the store that is written, so that they can restore it
	scope = resolveWriteScope(scope, notices);
	ConfigSnapshot previous{readConfig(normalized.names(), scope, location)};
	writeConfig(collapseAssignments(normalized.variables), scope, location, notices);
	return previous;
}

ConfigSnapshot gitConfigLocal(const std::vector<Argument>& args, const std::filesystem::path& location)
{
	return gitConfig(args, ConfigScope::Local, location);
}

ConfigSnapshot gitConfigGlobal(const std::vector<Argument>& args, const std::filesystem::path& location)
{
	return gitConfig(args, ConfigScope::Global, location);
}
