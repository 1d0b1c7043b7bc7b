#pragma once

#include "scope.hxx"
#include "snapshot.hxx"
#include "variable.hxx"

#include <filesystem>
#include <iostream>
#include <vector>

/**
 * @brief Gets or sets git config variables
 *
 * If @p args only name variables (or are empty), returns their values at @p scope
 * (all variables if empty). Variables that are not set get an entry without value.
 *
 * If any argument assigns or unsets a variable, the assignments are written to the
 * store of @p scope (the local one for DeFacto) and the values all named variables had
 * there before are returned. Passing that snapshot back restores the previous state.
 */
ConfigSnapshot gitConfig(
	const std::vector<Argument>& args,
	ConfigScope scope = ConfigScope::DeFacto,
	const std::filesystem::path& location = ".",
	std::ostream& notices = std::clog);

ConfigSnapshot applyArguments(
	const NormalizedArguments& normalized,
	ConfigScope scope,
	const std::filesystem::path& location,
	std::ostream& notices = std::clog);

ConfigSnapshot gitConfigLocal(const std::vector<Argument>& args, const std::filesystem::path& location = ".");

ConfigSnapshot gitConfigGlobal(const std::vector<Argument>& args, const std::filesystem::path& location = ".");
