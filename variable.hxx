#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class ConfigSnapshot;

class UsageError: public std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct Variable {
	enum class Mode { Query, Set, Unset };

	std::string name;
	Mode mode{Mode::Query};
	std::string value;

	static Variable query(std::string name);
	static Variable set(std::string name, std::string value);
	static Variable unset(std::string name);

	bool operator==(const Variable&) const = default;
};

/**
 * @brief One argument of a get-or-set call
 *
 * Either a variable (a bare name to query, an assignment or an unset) or a list of
 * variables. Lists may not contain other lists.
 */
class Argument {
public:
	Argument(std::string name);
	Argument(const char* name);
	Argument(Variable variable);

	/**
	 * @brief Turns every entry of @p snapshot into an assignment, or into an unset for
	 * entries without value, so that passing it back restores the captured state
	 */
	Argument(const ConfigSnapshot& snapshot);

	static Argument assign(std::string name, std::string value);
	static Argument unset(std::string name);
	static Argument list(std::vector<Argument> elements);

	bool isList() const { return isList_; }
	const Variable& variable() const { return variable_; }
	const std::vector<Argument>& elements() const { return elements_; }

private:
	Argument() = default;

	bool isList_{false};
	Variable variable_;
	std::vector<Argument> elements_;
};

struct NormalizedArguments {
	std::vector<Variable> variables;
	bool isQuery{true};

	std::vector<std::string> names() const;
};

/**
 * @brief Flattens @p args into one ordered list of variables with canonical names
 *
 * Throws UsageError for nested lists and malformed variable names.
 */
NormalizedArguments normalize(const std::vector<Argument>& args);

/**
 * @brief Selects the assignments and unsets from @p variables, one per name
 *
 * The last occurrence of a name decides its value, the first one its position.
 */
std::vector<Variable> collapseAssignments(const std::vector<Variable>& variables);

/// Lower-cases section and key of a "section[.subsection].key" name, as git stores them
std::string canonicalVariableName(std::string_view name);
