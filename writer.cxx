#include "writer.hxx"

#include "repository.hxx"

#include <format>
#include <set>
#include <string>

void validateAssignments(const std::vector<Variable>& variables)
{
	if (variables.empty()) {
		throw UsageError{"No config variables to set"};
	}

	std::set<std::string> seen;
	for (const Variable& variable: variables) {
		if (variable.mode == Variable::Mode::Query) {
			throw UsageError{std::format("Config variable '{}' has no value to set", variable.name)};
		}
		if (!seen.insert(canonicalVariableName(variable.name)).second) {
			throw UsageError{std::format("Config variable '{}' is given more than once", variable.name)};
		}
	}
}

void applyVariables(Config& config, const std::vector<Variable>& variables)
{
	for (const Variable& variable: variables) {
		if (variable.mode == Variable::Mode::Set) {
			config.setString(variable.name, variable.value);
		} else {
			config.remove(variable.name);
		}
	}
}

void writeConfig(
	const std::vector<Variable>& variables,
	ConfigScope scope,
	const std::filesystem::path& location,
	std::ostream& notices)
{
	validateAssignments(variables);
	scope = resolveWriteScope(scope, notices);

	RepositoryPtr repo;
	if (scope == ConfigScope::Local) {
		repo = openRepository(location);
	}
	Config config{scope == ConfigScope::Global ? Config::openGlobalForWriting() : Config::openLocal(*repo)};

	ConfigTransaction transaction{config};
	applyVariables(config, variables);
	transaction.commit();
}
