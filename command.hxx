#pragma once

#include "scope.hxx"
#include "variable.hxx"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

struct Options {
	std::filesystem::path repo_path{"."};
	std::string where{"de_facto"};
	bool local{false};
	bool global{false};
	bool show_previous{false};
	std::vector<std::string> variables;
	std::vector<std::string> unset;
};

std::vector<Argument> toArguments(const Options& opts);
ConfigScope selectedScope(const Options& opts);

/**
 * @brief Runs the command line request in @p opts
 *
 * Query results, and with show_previous the values a write replaced, are printed to
 * @p out. Notices and errors go to @p err.
 *
 * @returns the process exit status
 */
int runCommand(const Options& opts, std::ostream& out = std::cout, std::ostream& err = std::cerr);
