#include "snapshot.hxx"

#include <algorithm>
#include <ostream>

void ConfigSnapshot::set(std::string name, std::optional<std::string> value)
{
	auto it = std::ranges::find(entries_, name, &Entry::name);
	if (it != entries_.end()) {
		it->value = std::move(value);
		return;
	}
	entries_.push_back(Entry{.name = std::move(name), .value = std::move(value)});
}

const ConfigSnapshot::Entry* ConfigSnapshot::find(std::string_view name) const
{
	auto it = std::ranges::find(entries_, name, &Entry::name);
	return it == entries_.end() ? nullptr : &*it;
}

std::ostream& operator<<(std::ostream& os, const ConfigSnapshot& snapshot)
{
	for (const ConfigSnapshot::Entry& entry: snapshot) {
		os << entry.name << '=' << entry.value.value_or("<unset>") << '\n';
	}
	return os;
}
