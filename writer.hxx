#pragma once

#include "config.hxx"
#include "scope.hxx"
#include "variable.hxx"

#include <filesystem>
#include <iostream>
#include <vector>

/**
 * @brief Throws UsageError unless @p variables is a non-empty list of assignments and
 * unsets with unique names
 */
void validateAssignments(const std::vector<Variable>& variables);

void applyVariables(Config& config, const std::vector<Variable>& variables);

/**
 * @brief Sets and unsets @p variables in the store of @p scope
 *
 * DeFacto writes go to the local store. Writing the local store requires a repository
 * at @p location, NoRepository is thrown otherwise. The variables are written under one
 * config lock: either all of them reach the file or none.
 */
void writeConfig(
	const std::vector<Variable>& variables,
	ConfigScope scope,
	const std::filesystem::path& location,
	std::ostream& notices = std::clog);
