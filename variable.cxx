#include "variable.hxx"

#include "snapshot.hxx"
#include "utility.hxx"

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

Variable Variable::query(std::string name)
{
	return Variable{.name = std::move(name), .mode = Mode::Query, .value = {}};
}

Variable Variable::set(std::string name, std::string value)
{
	return Variable{.name = std::move(name), .mode = Mode::Set, .value = std::move(value)};
}

Variable Variable::unset(std::string name)
{
	return Variable{.name = std::move(name), .mode = Mode::Unset, .value = {}};
}

Argument::Argument(std::string name)
	: variable_{Variable::query(std::move(name))}
{
}

Argument::Argument(const char* name)
	: Argument(std::string{name})
{
}

Argument::Argument(Variable variable)
	: variable_{std::move(variable)}
{
}

Argument::Argument(const ConfigSnapshot& snapshot)
	: isList_{true}
{
	elements_.reserve(snapshot.size());
	for (const ConfigSnapshot::Entry& entry: snapshot) {
		elements_.push_back(entry.value ? assign(entry.name, *entry.value) : unset(entry.name));
	}
}

Argument Argument::assign(std::string name, std::string value)
{
	return Argument{Variable::set(std::move(name), std::move(value))};
}

Argument Argument::unset(std::string name)
{
	return Argument{Variable::unset(std::move(name))};
}

Argument Argument::list(std::vector<Argument> elements)
{
	Argument result;
	result.isList_ = true;
	result.elements_ = std::move(elements);
	return result;
}

std::vector<std::string> NormalizedArguments::names() const
{
	std::vector<std::string> result;
	result.reserve(variables.size());
	std::ranges::transform(variables, std::back_inserter(result), &Variable::name);
	return result;
}

std::string canonicalVariableName(std::string_view name)
{
	std::string_view::size_type firstDot = name.find('.');
	std::string_view::size_type lastDot = name.rfind('.');
	if (firstDot == std::string_view::npos || firstDot == 0 || lastDot + 1 == name.size()) {
		throw UsageError{std::format("Invalid config variable name '{}', expected section.key", name)};
	}

	// the subsection, if any, is case sensitive
	std::string result{toLowerCopy(name.substr(0, firstDot))};
	result += name.substr(firstDot, lastDot - firstDot);
	result += toLowerCopy(name.substr(lastDot));
	return result;
}

NormalizedArguments normalize(const std::vector<Argument>& args)
{
	NormalizedArguments result;

	auto append = [&result](const Variable& variable) {
		Variable& added = result.variables.emplace_back(variable);
		added.name = canonicalVariableName(variable.name);
		if (variable.mode != Variable::Mode::Query) {
			result.isQuery = false;
		}
	};

	for (const Argument& arg: args) {
		if (!arg.isList()) {
			append(arg.variable());
			continue;
		}
		for (const Argument& element: arg.elements()) {
			if (element.isList()) {
				throw UsageError{"Nested lists of config variables are not supported"};
			}
			append(element.variable());
		}
	}
	return result;
}

std::vector<Variable> collapseAssignments(const std::vector<Variable>& variables)
{
	std::vector<Variable> result;
	for (const Variable& variable: variables) {
		if (variable.mode == Variable::Mode::Query) {
			continue;
		}
		auto it = std::ranges::find(result, variable.name, &Variable::name);
		if (it == result.end()) {
			result.push_back(variable);
		} else {
			*it = variable;
		}
	}
	return result;
}
