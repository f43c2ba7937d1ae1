#pragma once

#include <kiln/result.hpp>
#include <string>

namespace kiln {

// Canonical repository identifier: host/owner/name
//   github.com/octocat/hello-world
// Components are joined verbatim; no case folding or trimming.
std::string make_slug(const std::string& host,
                      const std::string& owner,
                      const std::string& name);

struct SlugParts {
    std::string host;
    std::string owner;
    std::string name;
};

// Split at the first two '/'. The name keeps any further separators, so
// make_slug(host, owner, name) reproduces the input exactly.
Result<SlugParts> parse_slug(const std::string& slug);

} // namespace kiln
