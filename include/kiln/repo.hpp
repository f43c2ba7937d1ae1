#pragma once

#include <kiln/result.hpp>
#include <kiln/keypair.hpp>
#include <kiln/scm.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace kiln {

using Timestamp = std::chrono::system_clock::time_point;
using ParamMap = std::map<std::string, std::string>;

// Defaults applied by the Repo::create* factories (see Config).
struct ProvisionOptions {
    int key_bits = kDefaultKeyBits;
    int64_t timeout = 0;       // seconds, 0 = platform default
    bool privileged = false;
};

// A repository registered with the CI platform.
//
// Identity and credential fields (slug, host, owner, name, scm, url and the
// key pair) are populated once by the create* factories and never re-derived.
// The disabled flags, timeout, params and timestamps are mutated externally.
struct Repo {
    int64_t id = 0;                 // assigned by RepoStore::insert

    // github.com/octocat/hello-world
    std::string slug;
    // host tag, e.g. "github.com" or "custom"
    std::string host;
    std::string owner;
    std::string name;

    bool is_private = false;
    // no builds are executed
    bool disabled = false;
    // no builds are executed for pull requests
    bool disabled_pr = false;

    std::string scm;                // "git", "hg" or "svn"
    std::string url;                // clone URL
    std::string username;
    std::string password;

    // Injected as .ssh/id_rsa.pub and .ssh/id_rsa
    std::string public_key;
    std::string private_key;

    // Build parameters injected into the build configuration at runtime
    ParamMap params;

    int64_t timeout = 0;
    bool privileged = false;

    int64_t user_id = 0;
    int64_t team_id = 0;

    Timestamp created{};
    Timestamp updated{};

    // Generic constructor: slug from (host, owner, name), fresh key pair.
    // Fails only with KeyGeneration (including an out-of-range
    // opts.key_bits); no Repo is produced then.
    static Result<Repo> create(const std::string& host,
                               const std::string& owner,
                               const std::string& name,
                               const std::string& scm,
                               const std::string& url,
                               const ProvisionOptions& opts = {});

    // Host-specific constructor: clone URL from the (host, visibility)
    // template table, then create(). InvalidArg for hosts without a template.
    static Result<Repo> create_hosted(HostKind host,
                                      const std::string& owner,
                                      const std::string& name,
                                      bool is_private,
                                      const ProvisionOptions& opts = {});

    static Result<Repo> create_github(const std::string& owner,
                                      const std::string& name,
                                      bool is_private,
                                      const ProvisionOptions& opts = {});

    static Result<Repo> create_bitbucket(const std::string& owner,
                                         const std::string& name,
                                         bool is_private,
                                         const ProvisionOptions& opts = {});

    std::optional<HostKind> host_kind() const;
    std::optional<ScmKind> scm_kind() const;

    // master / default / trunk; unknown SCM kinds get the git default
    std::string default_branch() const;
};

} // namespace kiln
