#include <kiln/clone_url.hpp>
#include <cstring>

namespace kiln {

namespace {

struct UrlTemplate {
    HostKind host;
    const char* public_url;
    const char* private_url;
};

constexpr UrlTemplate URL_TABLE[] = {
    {HostKind::GitHub,
     "git://github.com/%s/%s.git",
     "git@github.com:%s/%s.git"},
    {HostKind::Bitbucket,
     "https://bitbucket.org/%s/%s.git",
     "git@bitbucket.org:%s/%s.git"},
};

// Substitute args into successive "%s" placeholders. The template is data,
// so it is never handed to printf.
std::string substitute(const char* tmpl, const std::string& first,
                       const std::string& second) {
    const std::string* args[] = {&first, &second};
    size_t next = 0;

    std::string out;
    out.reserve(std::strlen(tmpl) + first.size() + second.size());
    for (const char* p = tmpl; *p; ++p) {
        if (p[0] == '%' && p[1] == 's' && next < 2) {
            out += *args[next++];
            ++p;
        } else {
            out += *p;
        }
    }
    return out;
}

} // namespace

const char* clone_url_template(HostKind host, bool is_private) {
    for (const auto& t : URL_TABLE) {
        if (t.host == host) {
            return is_private ? t.private_url : t.public_url;
        }
    }
    return nullptr;
}

std::optional<std::string> render_clone_url(HostKind host,
                                            const std::string& owner,
                                            const std::string& name,
                                            bool is_private) {
    const char* tmpl = clone_url_template(host, is_private);
    if (!tmpl) return std::nullopt;
    return substitute(tmpl, owner, name);
}

} // namespace kiln
