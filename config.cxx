#include "config.hxx"

#include "utility.hxx"

#include <git2/buffer.h>
#include <git2/common.h>
#include <git2/config.h>
#include <git2/errors.h>
#include <git2/repository.h>
#include <git2/transaction.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace {
	struct git_config_deleter {
		void operator()(git_config* config)
		{
			if (config) {
				git_config_free(config);
			}
		}
	};

	using ConfigPtr = std::unique_ptr<git_config, git_config_deleter>;

	struct GitBuf: git_buf {
		GitBuf()
			: git_buf{}
		{
		}

		~GitBuf() { git_buf_dispose(this); }

		std::string_view view() const { return ptr ? std::string_view{ptr, size} : std::string_view{}; }
	};

	std::filesystem::path defaultGlobalConfigPath()
	{
		GitBuf searchPath;
		LibgitError::check(
			git_libgit2_opts(GIT_OPT_GET_SEARCH_PATH, GIT_CONFIG_LEVEL_GLOBAL, static_cast<git_buf*>(&searchPath)));

		std::string_view directories{searchPath.view()};
		std::string_view first{directories.substr(0, directories.find(GIT_PATH_LIST_SEPARATOR))};
		if (first.empty()) {
			throw std::runtime_error("Could not determine the location of the global git config file");
		}
		return std::filesystem::path{first} / ".gitconfig";
	}

	int collectEntryCallback(const git_config_entry* entry, void* payload)
	{
		// an entry without '=' has no value and means true, the value that writes it back
		static_cast<std::vector<ConfigEntry>*>(payload)->push_back(
			ConfigEntry{.name = entry->name, .value = entry->value ? entry->value : "true"});
		return 0;
	}
} // namespace

Config::Config(git_config* config)
	: config_{config}
{
}

Config::Config(Config&& other) noexcept
	: config_{std::exchange(other.config_, nullptr)}
{
}

Config& Config::operator=(Config&& other) noexcept
{
	if (config_) {
		git_config_free(config_);
	}
	config_ = other.config_;
	other.config_ = nullptr;
	return *this;
}

Config::~Config()
{
	if (config_) {
		git_config_free(config_);
	}
}

Config Config::openLocal(git_repository& repo)
{
	git_config* repoConfig;
	LibgitError::check(git_repository_config(&repoConfig, &repo));
	ConfigPtr repoConfigGuard{repoConfig};

	git_config* local;
	LibgitError::check(git_config_open_level(&local, repoConfig, GIT_CONFIG_LEVEL_LOCAL));
	return Config{local};
}

std::optional<Config> Config::openGlobal()
{
	git_config* defaultConfig;
	LibgitError::check(git_config_open_default(&defaultConfig));
	ConfigPtr defaultConfigGuard{defaultConfig};

	git_config* global;
	int error = git_config_open_level(&global, defaultConfig, GIT_CONFIG_LEVEL_GLOBAL);
	if (error == GIT_ENOTFOUND) {
		return std::nullopt;
	}
	LibgitError::check(error);
	return Config{global};
}

Config Config::openGlobalForWriting()
{
	if (std::optional<Config> existing = openGlobal(); existing.has_value()) {
		return std::move(*existing);
	}

	git_config* global;
	LibgitError::check(git_config_open_ondisk(&global, defaultGlobalConfigPath().c_str()));
	return Config{global};
}

std::vector<ConfigEntry> Config::entries() const
{
	std::vector<ConfigEntry> res;
	LibgitError::check(git_config_foreach(config_, &collectEntryCallback, &res));
	return res;
}

void Config::setString(const std::string& key, const std::string& value)
{
	LibgitError::check(git_config_set_string(config_, key.c_str(), value.c_str()));
}

void Config::remove(const std::string& key)
{
	int error = git_config_delete_entry(config_, key.c_str());
	if (error == GIT_ENOTFOUND) {
		return;
	}
	LibgitError::check(error);
}

ConfigTransaction::ConfigTransaction(Config& config)
{
	LibgitError::check(git_config_lock(&transaction_, config.config_));
}

ConfigTransaction::~ConfigTransaction()
{
	if (transaction_) {
		git_transaction_free(transaction_);
	}
}

void ConfigTransaction::commit()
{
	LibgitError::check(git_transaction_commit(transaction_));
}
