#include "command.hxx"
#include "utility.hxx"

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Validators.hpp>

#include <string>

struct VariableNameValidator: CLI::Validator {
	VariableNameValidator()
		: CLI::Validator("NAME[=VALUE]")
	{
		func_ = [](std::string& value) {
			try {
				canonicalVariableName(value.substr(0, value.find('=')));
			} catch (const UsageError& e) {
				return std::string{e.what()};
			}
			return std::string{};
		};
	}
};

int main(int argc, char** argv)
{
	Options opts;
	CLI::App app{"Get and set git configuration variables of the local and global scopes"};

	app.add_option(
		   "variables", opts.variables,
		   "Variables to query, or to set when given as name=value. Without any, all variables are listed")
		->check(VariableNameValidator());
	app.add_option("--repo,-r", opts.repo_path, "Path inside the git repo")
		->capture_default_str()
		->check(CLI::ExistingPath);
	app.add_option("--unset", opts.unset, "Remove a variable")->check(VariableNameValidator());
	app.add_flag(
		"--show-previous", opts.show_previous,
		"When setting, print the previous values, which can be passed back to restore them");

	CLI::Option* optWhere = app.add_option(
								   "--where", opts.where,
								   "Scope: de_facto (local overrides global, read only), local or global")
								->capture_default_str()
								->check(CLI::IsMember({"de_facto", "local", "global"}));
	CLI::Option* optLocal = app.add_flag("--local", opts.local, "Use the repository config file");
	CLI::Option* optGlobal = app.add_flag("--global", opts.global, "Use the user config file");

	optWhere->excludes(optLocal)->excludes(optGlobal);
	optLocal->excludes(optWhere)->excludes(optGlobal);
	optGlobal->excludes(optWhere)->excludes(optLocal);

	CLI11_PARSE(app, argc, argv);

	LibGit2Session libgit;
	return runCommand(opts);
}
