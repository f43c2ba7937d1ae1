#include <kiln/config.hpp>
#include <kiln/repo_store.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace kiln {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return KilnError{KilnError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [keys] section
    if (auto keys = doc["keys"].as_table()) {
        if (auto v = (*keys)["bits"].value<int64_t>()) {
            if (*v < kMinKeyBits || *v > kMaxKeyBits) {
                return KilnError{KilnError::Config,
                    "keys.bits = " + std::to_string(*v) + " is out of range",
                    "RSA key size must be between " + std::to_string(kMinKeyBits) +
                    " and " + std::to_string(kMaxKeyBits)};
            }
            cfg.keys.bits = static_cast<int>(*v);
            cfg.keys_bits_set = true;
        }
    }

    // [repo] section
    if (auto repo = doc["repo"].as_table()) {
        if (auto v = (*repo)["timeout"].value<int64_t>()) {
            if (*v < 0) {
                return KilnError{KilnError::Config,
                    "repo.timeout must not be negative"};
            }
            cfg.repo.timeout = *v;
            cfg.repo_timeout_set = true;
        }
        if (auto v = (*repo)["privileged"].value<bool>()) {
            cfg.repo.privileged = *v;
            cfg.repo_privileged_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            KILN_TRY(lvl);
            cfg.logging.level = lvl.value();
            cfg.log_level_set = true;
        }
    }

    // [store] section
    if (auto store = doc["store"].as_table()) {
        if (auto v = (*store)["path"].value<std::string>()) {
            cfg.store.path = std::string(*v);
            cfg.store_path_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KilnError{KilnError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.keys_bits_set) {
        keys.bits = other.keys.bits;
        keys_bits_set = true;
    }
    if (other.repo_timeout_set) {
        repo.timeout = other.repo.timeout;
        repo_timeout_set = true;
    }
    if (other.repo_privileged_set) {
        repo.privileged = other.repo.privileged;
        repo_privileged_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.store_path_set) {
        store.path = other.store.path;
        store_path_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                          const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

ProvisionOptions Config::provision_options() const {
    ProvisionOptions opts;
    opts.key_bits = keys.bits;
    opts.timeout = repo.timeout;
    opts.privileged = repo.privileged;
    return opts;
}

std::string Config::store_path() const {
    if (!store.path.empty()) return store.path;
    return RepoStore::default_db_path();
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.kiln/config.toml";
}

} // namespace kiln
