#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Ordered list of configuration variables and their values at one point in time
 *
 * Names are unique. An entry without a value stands for a variable that is not set.
 */
class ConfigSnapshot {
public:
	struct Entry {
		std::string name;
		std::optional<std::string> value;

		bool operator==(const Entry&) const = default;
	};

	using const_iterator = std::vector<Entry>::const_iterator;

	ConfigSnapshot() = default;

	void set(std::string name, std::optional<std::string> value);

	const Entry* find(std::string_view name) const;

	std::size_t size() const { return entries_.size(); }
	bool empty() const { return entries_.empty(); }

	const_iterator begin() const { return entries_.begin(); }
	const_iterator end() const { return entries_.end(); }

	bool operator==(const ConfigSnapshot&) const = default;

private:
	std::vector<Entry> entries_;
};

std::ostream& operator<<(std::ostream& os, const ConfigSnapshot& snapshot);
