#include <kiln/slug.hpp>

namespace kiln {

std::string make_slug(const std::string& host,
                      const std::string& owner,
                      const std::string& name) {
    std::string slug;
    slug.reserve(host.size() + owner.size() + name.size() + 2);
    slug += host;
    slug += '/';
    slug += owner;
    slug += '/';
    slug += name;
    return slug;
}

Result<SlugParts> parse_slug(const std::string& slug) {
    auto first = slug.find('/');
    if (first == std::string::npos) {
        return KilnError{KilnError::Parse,
            "invalid repository slug '" + slug + "'",
            "expected host/owner/name"};
    }
    auto second = slug.find('/', first + 1);
    if (second == std::string::npos) {
        return KilnError{KilnError::Parse,
            "invalid repository slug '" + slug + "'",
            "expected host/owner/name"};
    }

    SlugParts parts;
    parts.host = slug.substr(0, first);
    parts.owner = slug.substr(first + 1, second - first - 1);
    parts.name = slug.substr(second + 1);

    if (parts.host.empty() || parts.owner.empty() || parts.name.empty()) {
        return KilnError{KilnError::Parse,
            "repository slug '" + slug + "' has an empty component",
            "host, owner and name must all be non-empty"};
    }

    return Result<SlugParts>::ok(std::move(parts));
}

} // namespace kiln
