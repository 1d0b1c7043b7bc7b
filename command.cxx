#include "command.hxx"

#include "git-config.hxx"

#include <exception>

namespace {
	Argument toArgument(const std::string& variable)
	{
		std::string::size_type separator = variable.find('=');
		if (separator == std::string::npos) {
			return Argument{variable};
		}
		return Argument::assign(variable.substr(0, separator), variable.substr(separator + 1));
	}
} // namespace

std::vector<Argument> toArguments(const Options& opts)
{
	std::vector<Argument> args;
	for (const std::string& variable: opts.variables) {
		args.push_back(toArgument(variable));
	}
	for (const std::string& name: opts.unset) {
		args.push_back(Argument::unset(name));
	}
	return args;
}

ConfigScope selectedScope(const Options& opts)
{
	if (opts.local) {
		return ConfigScope::Local;
	}
	if (opts.global) {
		return ConfigScope::Global;
	}
	return parseScope(opts.where);
}

int runCommand(const Options& opts, std::ostream& out, std::ostream& err)
{
	try {
		NormalizedArguments normalized{normalize(toArguments(opts))};
		ConfigSnapshot snapshot{applyArguments(normalized, selectedScope(opts), opts.repo_path, err)};
		if (normalized.isQuery || opts.show_previous) {
			out << snapshot;
		}
	} catch (const std::exception& e) {
		err << e.what() << std::endl;
		return 1;
	}
	return 0;
}
