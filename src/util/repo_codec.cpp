#include <kiln/repo_codec.hpp>
#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <ctime>
#include <sstream>

namespace kiln {

std::string to_api_json(const Repo& repo, int indent) {
    nlohmann::ordered_json j;
    j["id"] = repo.id;
    j["slug"] = repo.slug;
    j["host"] = repo.host;
    j["owner"] = repo.owner;
    j["name"] = repo.name;
    j["private"] = repo.is_private;
    j["disabled"] = repo.disabled;
    j["disabled_pr"] = repo.disabled_pr;
    j["scm"] = repo.scm;
    j["url"] = repo.url;
    j["public_key"] = repo.public_key;
    j["timeout"] = repo.timeout;
    j["priveleged"] = repo.privileged;
    j["user_id"] = repo.user_id;
    j["team_id"] = repo.team_id;
    j["created"] = format_utc(repo.created);
    j["updated"] = format_utc(repo.updated);
    return j.dump(indent);
}

std::string encode_params(const ParamMap& params) {
    toml::table tbl;
    for (const auto& [k, v] : params) {
        tbl.insert_or_assign(k, v);
    }
    std::ostringstream ss;
    ss << tbl;
    return ss.str();
}

Result<ParamMap> decode_params(const std::string& text) {
    toml::table doc;
    try {
        doc = toml::parse(text);
    } catch (const toml::parse_error& e) {
        return KilnError{KilnError::Parse,
            std::string("params TOML parse error: ") + e.what()};
    }

    ParamMap params;
    for (const auto& [key, val] : doc) {
        auto s = val.value<std::string>();
        if (!val.is_string() || !s) {
            return KilnError{KilnError::Parse,
                "param '" + std::string(key.str()) + "' is not a string"};
        }
        params[std::string(key.str())] = std::move(*s);
    }
    return Result<ParamMap>::ok(std::move(params));
}

std::string format_utc(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

int64_t to_unix_seconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(
        ts.time_since_epoch()).count();
}

Timestamp from_unix_seconds(int64_t secs) {
    return Timestamp(std::chrono::seconds(secs));
}

} // namespace kiln
