#include <kiln/repo.hpp>
#include <kiln/clone_url.hpp>
#include <kiln/log.hpp>
#include <kiln/slug.hpp>

namespace kiln {

namespace {

// Factory table for host-specific construction. Each entry names the host
// tag recorded on the repository and the SCM its clone URLs speak.
struct HostedFactory {
    HostKind host;
    HostKind record_as;
    ScmKind scm;
};

constexpr HostedFactory HOSTED_FACTORIES[] = {
    {HostKind::GitHub,    HostKind::GitHub,    ScmKind::Git},
    {HostKind::Bitbucket, HostKind::Bitbucket, ScmKind::Git},
};

const HostedFactory* find_factory(HostKind host) {
    for (const auto& f : HOSTED_FACTORIES) {
        if (f.host == host) return &f;
    }
    return nullptr;
}

} // namespace

Result<Repo> Repo::create(const std::string& host,
                          const std::string& owner,
                          const std::string& name,
                          const std::string& scm,
                          const std::string& url,
                          const ProvisionOptions& opts) {
    Repo repo;
    repo.host = host;
    repo.owner = owner;
    repo.name = name;
    repo.scm = scm;
    repo.url = url;
    repo.slug = make_slug(host, owner, name);
    repo.timeout = opts.timeout;
    repo.privileged = opts.privileged;

    auto keys = generate_keypair(opts.key_bits);
    if (keys.is_err()) {
        // Creation fails only with KeyGeneration; an unusable key size
        // is a failure to provision the key like any other.
        KilnError e = std::move(keys).error();
        e.code = KilnError::KeyGeneration;
        log::debug("key provisioning failed for %s", repo.slug.c_str());
        return e;
    }
    repo.public_key = std::move(keys.value().public_key);
    repo.private_key = std::move(keys.value().private_key);

    log::debug("created repository %s (%s)", repo.slug.c_str(), repo.scm.c_str());
    if (log::get_level() <= log::Trace) {
        auto fp = key_fingerprint(repo.public_key);
        if (fp.is_ok()) {
            log::trace("deploy key for %s: %s", repo.slug.c_str(), fp.value().c_str());
        }
    }

    return Result<Repo>::ok(std::move(repo));
}

Result<Repo> Repo::create_hosted(HostKind host,
                                 const std::string& owner,
                                 const std::string& name,
                                 bool is_private,
                                 const ProvisionOptions& opts) {
    const HostedFactory* factory = find_factory(host);
    auto url = render_clone_url(host, owner, name, is_private);
    if (!factory || !url.has_value()) {
        return KilnError{KilnError::InvalidArg,
            std::string("no clone URL template for host '") + host_tag(host) + "'",
            "use Repo::create with an explicit clone URL"};
    }

    auto repo = create(host_tag(factory->record_as), owner, name,
                       scm_name(factory->scm), *url, opts);
    KILN_TRY(repo);
    repo.value().is_private = is_private;
    return repo;
}

Result<Repo> Repo::create_github(const std::string& owner,
                                 const std::string& name,
                                 bool is_private,
                                 const ProvisionOptions& opts) {
    return create_hosted(HostKind::GitHub, owner, name, is_private, opts);
}

Result<Repo> Repo::create_bitbucket(const std::string& owner,
                                    const std::string& name,
                                    bool is_private,
                                    const ProvisionOptions& opts) {
    return create_hosted(HostKind::Bitbucket, owner, name, is_private, opts);
}

std::optional<HostKind> Repo::host_kind() const {
    return parse_host(host);
}

std::optional<ScmKind> Repo::scm_kind() const {
    return parse_scm(scm);
}

std::string Repo::default_branch() const {
    return default_branch_for(scm);
}

} // namespace kiln
