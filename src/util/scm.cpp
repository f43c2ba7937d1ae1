#include <kiln/scm.hpp>

namespace kiln {

namespace {

struct ScmEntry {
    ScmKind kind;
    const char* name;
    const char* branch;
};

constexpr ScmEntry SCM_TABLE[] = {
    {ScmKind::Git, "git", "master"},
    {ScmKind::Hg,  "hg",  "default"},
    {ScmKind::Svn, "svn", "trunk"},
};

struct HostEntry {
    HostKind kind;
    const char* tag;
};

constexpr HostEntry HOST_TABLE[] = {
    {HostKind::GitHub,     "github.com"},
    {HostKind::Bitbucket,  "bitbucket.org"},
    {HostKind::GoogleCode, "code.google.com"},
    {HostKind::Custom,     "custom"},
};

const ScmEntry& scm_entry(ScmKind kind) {
    for (const auto& e : SCM_TABLE) {
        if (e.kind == kind) return e;
    }
    return SCM_TABLE[0];
}

} // namespace

const char* scm_name(ScmKind kind) {
    return scm_entry(kind).name;
}

std::optional<ScmKind> parse_scm(const std::string& name) {
    for (const auto& e : SCM_TABLE) {
        if (name == e.name) return e.kind;
    }
    return std::nullopt;
}

const char* host_tag(HostKind host) {
    for (const auto& e : HOST_TABLE) {
        if (e.kind == host) return e.tag;
    }
    return "custom";
}

std::optional<HostKind> parse_host(const std::string& tag) {
    for (const auto& e : HOST_TABLE) {
        if (tag == e.tag) return e.kind;
    }
    return std::nullopt;
}

const char* default_branch(ScmKind kind) {
    return scm_entry(kind).branch;
}

std::string default_branch_for(const std::string& scm) {
    auto kind = parse_scm(scm);
    if (!kind.has_value()) {
        return default_branch(ScmKind::Git);
    }
    return default_branch(*kind);
}

} // namespace kiln
