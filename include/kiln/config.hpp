#pragma once

#include <kiln/result.hpp>
#include <kiln/log.hpp>
#include <kiln/repo.hpp>
#include <string>
#include <optional>

namespace kiln {

// [keys] section
struct KeyConfig {
    int bits = kDefaultKeyBits;
};

// [repo] section: defaults for newly created repositories
struct RepoConfig {
    int64_t timeout = 0;
    bool privileged = false;
};

// [log] section
struct LogConfig {
    log::Level level = log::Info;
};

// [store] section
struct StoreConfig {
    std::string path;   // empty = RepoStore::default_db_path()
};

// Layered configuration: global < local
// Later layers override only the fields they set explicitly.
struct Config {
    KeyConfig keys;
    RepoConfig repo;
    LogConfig logging;
    StoreConfig store;
    // Track which fields were explicitly set (for merge)
    bool keys_bits_set = false;
    bool repo_timeout_set = false;
    bool repo_privileged_set = false;
    bool log_level_set = false;
    bool store_path_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    ProvisionOptions provision_options() const;

    // store.path, or RepoStore::default_db_path() when unset
    std::string store_path() const;
};

// Discover the global config file path: ~/.kiln/config.toml
std::string global_config_path();

} // namespace kiln
