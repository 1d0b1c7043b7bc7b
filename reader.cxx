#include "reader.hxx"

#include "repository.hxx"
#include "variable.hxx"

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

MultiValuedVariable::MultiValuedVariable(const std::string& name, std::size_t count)
	: std::runtime_error(
		  std::format("Config variable '{}' has {} values, multivars are not supported", name, count))
{
}

StoreContents groupEntries(const std::vector<ConfigEntry>& entries)
{
	StoreContents result;
	for (const ConfigEntry& entry: entries) {
		auto it = std::ranges::find(result, entry.name, &VariableValues::name);
		if (it == result.end()) {
			result.push_back(VariableValues{.name = entry.name, .values = {entry.value}});
		} else {
			it->values.push_back(entry.value);
		}
	}
	return result;
}

StoreContents mergeScopes(StoreContents global, const StoreContents& local)
{
	for (const VariableValues& variable: local) {
		auto it = std::ranges::find(global, variable.name, &VariableValues::name);
		if (it == global.end()) {
			global.push_back(variable);
		} else {
			it->values = variable.values;
		}
	}
	return global;
}

ConfigSnapshot requireScalar(const StoreContents& contents)
{
	ConfigSnapshot result;
	for (const VariableValues& variable: contents) {
		if (variable.values.size() > 1) {
			throw MultiValuedVariable{variable.name, variable.values.size()};
		}
		result.set(
			variable.name,
			variable.values.empty() ? std::nullopt : std::optional<std::string>{variable.values.front()});
	}
	return result;
}

ConfigSnapshot screen(const ConfigSnapshot& all, const std::vector<std::string>& names)
{
	if (names.empty()) {
		return all;
	}

	ConfigSnapshot result;
	for (const std::string& name: names) {
		if (result.find(name)) {
			continue;
		}
		const ConfigSnapshot::Entry* entry = all.find(name);
		result.set(name, entry ? entry->value : std::nullopt);
	}
	return result;
}

ConfigSnapshot readConfig(
	const std::vector<std::string>& names, ConfigScope scope, const std::filesystem::path& location)
{
	std::vector<std::string> canonicalNames;
	canonicalNames.reserve(names.size());
	std::ranges::transform(names, std::back_inserter(canonicalNames), &canonicalVariableName);

	RepositoryPtr repo{discoverRepository(location)};
	ConfigSources sources{resolveSources(scope, repo.get())};

	StoreContents global = sources.global ? groupEntries(sources.global->entries()) : StoreContents{};
	StoreContents local = sources.local ? groupEntries(sources.local->entries()) : StoreContents{};

	return screen(requireScalar(mergeScopes(std::move(global), local)), canonicalNames);
}
