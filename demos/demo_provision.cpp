// demo_provision.cpp
//
// Register a repository and print its API representation.
//
//     ./demo_provision github.com octocat hello-world
//     ./demo_provision bitbucket.org acme widgets --private
//     ./demo_provision custom me tools --url https://git.example.com/me/tools.git --scm hg
//     ./demo_provision github.com octocat hello-world --db /tmp/kiln.db
//     ./demo_provision github.com octocat hello-world --no-store
//
// Configuration is read from ~/.kiln/config.toml and then --config <path>.
// The repository is stored in --db, else [store] path, else ~/.kiln/kiln.db.
// KILN_LOG=debug overrides the configured log level.

#include <kiln/clone_url.hpp>
#include <kiln/config.hpp>
#include <kiln/keypair.hpp>
#include <kiln/log.hpp>
#include <kiln/repo.hpp>
#include <kiln/repo_codec.hpp>
#include <kiln/repo_store.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace kiln;

struct Args {
    std::string host;
    std::string owner;
    std::string name;
    bool is_private = false;
    std::string url;
    std::string scm = "git";
    std::string db;
    bool no_store = false;
    std::string config;
};

static const char USAGE[] =
    "usage: demo_provision <host> <owner> <name> [--private] [--url URL]\n"
    "                      [--scm git|hg|svn] [--db PATH | --no-store]\n"
    "                      [--config PATH]";

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return KilnError{KilnError::InvalidArg,
                    flag + " requires a value", USAGE};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (a == "--private") {
            args.is_private = true;
        } else if (a == "--no-store") {
            args.no_store = true;
        } else if (a == "--url" || a == "--scm" || a == "--db" || a == "--config") {
            auto v = next(a);
            KILN_TRY(v);
            if (a == "--url") args.url = v.value();
            else if (a == "--scm") args.scm = v.value();
            else if (a == "--db") args.db = v.value();
            else args.config = v.value();
        } else if (a.rfind("--", 0) == 0) {
            return KilnError{KilnError::InvalidArg, "unknown flag " + a, USAGE};
        } else {
            switch (positional++) {
                case 0: args.host = a; break;
                case 1: args.owner = a; break;
                case 2: args.name = a; break;
                default:
                    return KilnError{KilnError::InvalidArg,
                        "unexpected argument " + a, USAGE};
            }
        }
    }

    if (args.no_store && !args.db.empty()) {
        return KilnError{KilnError::InvalidArg,
            "--db and --no-store are mutually exclusive", USAGE};
    }
    if (positional < 3) {
        return KilnError{KilnError::InvalidArg,
            "host, owner and name are required", USAGE};
    }
    return Result<Args>::ok(std::move(args));
}

Result<Config> load_config(const Args& args) {
    std::optional<Config> global;
    std::optional<Config> local;

    auto gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath)) {
        auto g = Config::load(gpath);
        KILN_TRY(g);
        global = std::move(g).value();
    }
    if (!args.config.empty()) {
        auto l = Config::load(args.config);
        KILN_TRY(l);
        local = std::move(l).value();
    }
    return Result<Config>::ok(Config::effective(global, local));
}

Result<Repo> provision(const Args& args, const Config& cfg) {
    auto opts = cfg.provision_options();
    auto host = parse_host(args.host);

    bool templated = host.has_value() &&
                     clone_url_template(*host, args.is_private) != nullptr;
    if (templated && args.url.empty()) {
        return Repo::create_hosted(*host, args.owner, args.name,
                                   args.is_private, opts);
    }

    if (args.url.empty()) {
        return KilnError{KilnError::InvalidArg,
            "no clone URL template for host '" + args.host + "'",
            "pass --url for custom hosts"};
    }
    if (!parse_scm(args.scm).has_value()) {
        log::warn("unrecognized scm '%s', default branch falls back to %s",
                  args.scm.c_str(), default_branch(ScmKind::Git));
    }

    auto repo = Repo::create(args.host, args.owner, args.name, args.scm,
                             args.url, opts);
    KILN_TRY(repo);
    repo.value().is_private = args.is_private;
    return repo;
}

Result<std::string> run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    KILN_TRY(args);

    auto cfg = load_config(args.value());
    KILN_TRY(cfg);
    log::set_level(cfg.value().logging.level);
    KILN_TRY(log::init_from_env());

    auto repo = provision(args.value(), cfg.value());
    KILN_TRY(repo);

    if (!args.value().no_store) {
        std::string db = args.value().db.empty() ? cfg.value().store_path()
                                                 : args.value().db;
        RepoStore store;
        KILN_TRY(store.open(db));
        KILN_TRY(store.insert(repo.value()));
    }

    auto fp = key_fingerprint(repo.value().public_key);
    KILN_TRY(fp);
    log::info("default branch: %s", repo.value().default_branch().c_str());
    log::info("deploy key: %s", fp.value().c_str());

    return Result<std::string>::ok(to_api_json(repo.value(), 2));
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        log::error("%s", result.error().format().c_str());
        return 1;
    }
    std::cout << result.value() << "\n";
    return 0;
}
