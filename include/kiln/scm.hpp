#pragma once

#include <optional>
#include <string>

namespace kiln {

// Source-control systems a repository can use. Persisted as scm_name().
enum class ScmKind {
    Git,
    Hg,
    Svn
};

// Hosting providers. Persisted as host_tag().
enum class HostKind {
    GitHub,      // github.com
    Bitbucket,   // bitbucket.org
    GoogleCode,  // code.google.com (legacy)
    Custom       // self-hosted, clone URL supplied by the caller
};

const char* scm_name(ScmKind kind);
std::optional<ScmKind> parse_scm(const std::string& name);

const char* host_tag(HostKind host);
std::optional<HostKind> parse_host(const std::string& tag);

// Conventional default branch: git -> master, hg -> default, svn -> trunk
const char* default_branch(ScmKind kind);

// String form used on persisted records. Unrecognized kinds resolve to the
// git default ("master") instead of failing.
std::string default_branch_for(const std::string& scm);

} // namespace kiln
