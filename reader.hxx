#pragma once

#include "config.hxx"
#include "scope.hxx"
#include "snapshot.hxx"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

class MultiValuedVariable: public std::runtime_error {
public:
	MultiValuedVariable(const std::string& name, std::size_t count);
};

struct VariableValues {
	std::string name;
	std::vector<std::string> values;
};

/// Contents of a store, one element per variable in order of first appearance
using StoreContents = std::vector<VariableValues>;

StoreContents groupEntries(const std::vector<ConfigEntry>& entries);

/**
 * @brief Overlays @p local on @p global: local values replace global ones, variables only
 * present locally are appended
 */
StoreContents mergeScopes(StoreContents global, const StoreContents& local);

ConfigSnapshot requireScalar(const StoreContents& contents);

/**
 * @brief Selects @p names from @p all, in the order given, one entry per distinct name.
 * Names missing from @p all get an entry without value. An empty @p names selects everything.
 */
ConfigSnapshot screen(const ConfigSnapshot& all, const std::vector<std::string>& names);

/**
 * @brief Reads the variables @p names (all variables if empty) at @p scope
 *
 * Outside of a repository the local store reads as empty.
 */
ConfigSnapshot readConfig(
	const std::vector<std::string>& names, ConfigScope scope, const std::filesystem::path& location);
