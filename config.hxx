#pragma once

#include <git2/types.h>

#include <optional>
#include <string>
#include <vector>

struct ConfigEntry {
	std::string name;
	std::string value;
};

class Config {
public:
	Config(Config&& other) noexcept;
	Config& operator=(Config&&) noexcept;
	~Config();

	Config(const Config&) = delete;
	Config& operator=(const Config&) = delete;

	static Config openLocal(git_repository& repo);
	static std::optional<Config> openGlobal();

	/**
	 * @brief The user-level configuration file. If it does not exist yet, it will be
	 * created in the first directory of the global search path when written to.
	 */
	static Config openGlobalForWriting();

	// file order, one entry per value of a multivar
	std::vector<ConfigEntry> entries() const;

	void setString(const std::string& key, const std::string& value);
	void remove(const std::string& key);

private:
	explicit Config(git_config* config);

	friend class ConfigTransaction;

	git_config* config_;
};

/**
 * @brief Locks a Config for writing. Changes made through the config while the
 * transaction is alive reach the file only on commit(); they are discarded otherwise.
 */
class ConfigTransaction {
public:
	explicit ConfigTransaction(Config& config);
	~ConfigTransaction();

	ConfigTransaction(const ConfigTransaction&) = delete;
	ConfigTransaction& operator=(const ConfigTransaction&) = delete;

	void commit();

private:
	git_transaction* transaction_{};
};
