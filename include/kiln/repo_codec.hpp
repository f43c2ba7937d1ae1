#pragma once

#include <kiln/repo.hpp>
#include <string>

namespace kiln {

// API-facing JSON. Credentials (username, password, private_key) and the
// build parameters are never part of this representation.
// indent < 0 renders compact JSON.
std::string to_api_json(const Repo& repo, int indent = -1);

// Persisted encoding of Repo::params: a flat TOML table of strings.
std::string encode_params(const ParamMap& params);
Result<ParamMap> decode_params(const std::string& text);

// 2026-10-17T14:09:00Z
std::string format_utc(Timestamp ts);

int64_t to_unix_seconds(Timestamp ts);
Timestamp from_unix_seconds(int64_t secs);

} // namespace kiln
