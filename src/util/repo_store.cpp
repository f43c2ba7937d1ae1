#include <kiln/repo_store.hpp>
#include <kiln/log.hpp>
#include <kiln/repo_codec.hpp>
#include <sqlite3.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace kiln {

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

// Column order shared by every SELECT; see read_row()
static const char REPO_COLUMNS[] =
    "id, slug, host, owner, name, private, disabled, disabled_pr, scm, url, "
    "username, password, public_key, private_key, params, timeout, priveleged, "
    "user_id, team_id, created, updated";

struct RepoStore::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_insert = nullptr;
    sqlite3_stmt* stmt_update = nullptr;
    sqlite3_stmt* stmt_find_id = nullptr;
    sqlite3_stmt* stmt_find_slug = nullptr;
    sqlite3_stmt* stmt_list_user = nullptr;
    sqlite3_stmt* stmt_remove = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_insert);
        fin(stmt_update);
        fin(stmt_find_id);
        fin(stmt_find_slug);
        fin(stmt_list_user);
        fin(stmt_remove);
    }

    Status prepare(const std::string& sql, sqlite3_stmt*& out) {
        if (!db) {
            return KilnError(KilnError::Database, "repository store is not open");
        }
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return KilnError(KilnError::Database,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return KilnError(KilnError::Database, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status init_schema() {
        KILN_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS repos ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  slug TEXT NOT NULL UNIQUE,"
            "  host TEXT,"
            "  owner TEXT,"
            "  name TEXT,"
            "  private INTEGER,"
            "  disabled INTEGER,"
            "  disabled_pr INTEGER,"
            "  scm TEXT,"
            "  url TEXT,"
            "  username TEXT,"
            "  password TEXT,"
            "  public_key TEXT,"
            "  private_key TEXT,"
            "  params TEXT,"
            "  timeout INTEGER,"
            "  priveleged INTEGER,"
            "  user_id INTEGER,"
            "  team_id INTEGER,"
            "  created INTEGER,"
            "  updated INTEGER"
            ");"
            "CREATE INDEX IF NOT EXISTS repos_user_id ON repos (user_id);"
        ));

        std::string ver_sql = "INSERT OR IGNORE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        KILN_TRY(exec(ver_sql.c_str()));
        return ok_status();
    }

    static void bind_text(sqlite3_stmt* stmt, int idx, const std::string& s) {
        sqlite3_bind_text(stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT);
    }

    static std::string column_text(sqlite3_stmt* stmt, int col) {
        auto p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        return p ? std::string(p) : std::string();
    }

    // Row in REPO_COLUMNS order
    static Result<Repo> read_row(sqlite3_stmt* stmt) {
        Repo r;
        r.id = sqlite3_column_int64(stmt, 0);
        r.slug = column_text(stmt, 1);
        r.host = column_text(stmt, 2);
        r.owner = column_text(stmt, 3);
        r.name = column_text(stmt, 4);
        r.is_private = sqlite3_column_int(stmt, 5) != 0;
        r.disabled = sqlite3_column_int(stmt, 6) != 0;
        r.disabled_pr = sqlite3_column_int(stmt, 7) != 0;
        r.scm = column_text(stmt, 8);
        r.url = column_text(stmt, 9);
        r.username = column_text(stmt, 10);
        r.password = column_text(stmt, 11);
        r.public_key = column_text(stmt, 12);
        r.private_key = column_text(stmt, 13);

        auto params = decode_params(column_text(stmt, 14));
        if (params.is_err()) {
            KilnError e = std::move(params).error();
            e.message = "repository '" + r.slug + "': " + e.message;
            return e;
        }
        r.params = std::move(params).value();

        r.timeout = sqlite3_column_int64(stmt, 15);
        r.privileged = sqlite3_column_int(stmt, 16) != 0;
        r.user_id = sqlite3_column_int64(stmt, 17);
        r.team_id = sqlite3_column_int64(stmt, 18);
        r.created = from_unix_seconds(sqlite3_column_int64(stmt, 19));
        r.updated = from_unix_seconds(sqlite3_column_int64(stmt, 20));
        return Result<Repo>::ok(std::move(r));
    }

    Result<Repo> find_one(sqlite3_stmt* stmt, const std::string& what) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            auto r = read_row(stmt);
            sqlite3_reset(stmt);
            return r;
        }
        sqlite3_reset(stmt);
        if (rc == SQLITE_DONE) {
            return KilnError(KilnError::NotFound, "repository not found: " + what);
        }
        return KilnError(KilnError::Database,
            std::string("Failed to read repository: ") + sqlite3_errmsg(db));
    }
};

static int64_t now_seconds() {
    return to_unix_seconds(std::chrono::system_clock::now());
}

// ---------------------------------------------------------------------------
// RepoStore public interface
// ---------------------------------------------------------------------------

RepoStore::RepoStore() : impl_(std::make_unique<Impl>()) {}
RepoStore::~RepoStore() = default;
RepoStore::RepoStore(RepoStore&&) noexcept = default;
RepoStore& RepoStore::operator=(RepoStore&&) noexcept = default;

std::string RepoStore::default_db_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.kiln/kiln.db";
}

Status RepoStore::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return KilnError(KilnError::IO,
                "Failed to create database directory: " + parent.string());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return KilnError(KilnError::Database,
            "Failed to open repository database: " + err_msg,
            "", db_path, 0);
    }

    auto setup = impl_->exec(
        "PRAGMA journal_mode=WAL;"
        "PRAGMA synchronous=NORMAL;"
        "PRAGMA foreign_keys=ON;"
    );
    if (setup.is_ok()) setup = impl_->init_schema();
    if (setup.is_err()) {
        close();
        return setup;
    }

    log::debug("opened repository store %s", db_path.c_str());
    return ok_status();
}

void RepoStore::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool RepoStore::is_open() const {
    return impl_->db != nullptr;
}

Status RepoStore::insert(Repo& repo) {
    KILN_TRY(impl_->prepare(
        "INSERT INTO repos (slug, host, owner, name, private, disabled, "
        "disabled_pr, scm, url, username, password, public_key, private_key, "
        "params, timeout, priveleged, user_id, team_id, created, updated) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        impl_->stmt_insert));

    int64_t now = now_seconds();
    sqlite3_stmt* s = impl_->stmt_insert;
    sqlite3_reset(s);
    Impl::bind_text(s, 1, repo.slug);
    Impl::bind_text(s, 2, repo.host);
    Impl::bind_text(s, 3, repo.owner);
    Impl::bind_text(s, 4, repo.name);
    sqlite3_bind_int(s, 5, repo.is_private ? 1 : 0);
    sqlite3_bind_int(s, 6, repo.disabled ? 1 : 0);
    sqlite3_bind_int(s, 7, repo.disabled_pr ? 1 : 0);
    Impl::bind_text(s, 8, repo.scm);
    Impl::bind_text(s, 9, repo.url);
    Impl::bind_text(s, 10, repo.username);
    Impl::bind_text(s, 11, repo.password);
    Impl::bind_text(s, 12, repo.public_key);
    Impl::bind_text(s, 13, repo.private_key);
    Impl::bind_text(s, 14, encode_params(repo.params));
    sqlite3_bind_int64(s, 15, repo.timeout);
    sqlite3_bind_int(s, 16, repo.privileged ? 1 : 0);
    sqlite3_bind_int64(s, 17, repo.user_id);
    sqlite3_bind_int64(s, 18, repo.team_id);
    sqlite3_bind_int64(s, 19, now);
    sqlite3_bind_int64(s, 20, now);

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        int ext = sqlite3_extended_errcode(impl_->db);
        std::string msg = sqlite3_errmsg(impl_->db);
        sqlite3_reset(s);
        if (ext == SQLITE_CONSTRAINT_UNIQUE) {
            return KilnError(KilnError::Duplicate,
                "repository already registered: " + repo.slug);
        }
        return KilnError(KilnError::Database, "Failed to insert repository: " + msg);
    }
    sqlite3_reset(s);

    repo.id = sqlite3_last_insert_rowid(impl_->db);
    repo.created = from_unix_seconds(now);
    repo.updated = repo.created;
    log::info("registered repository %s (id %lld)",
              repo.slug.c_str(), static_cast<long long>(repo.id));
    return ok_status();
}

Status RepoStore::update(Repo& repo) {
    KILN_TRY(impl_->prepare(
        "UPDATE repos SET disabled=?, disabled_pr=?, username=?, password=?, "
        "params=?, timeout=?, priveleged=?, user_id=?, team_id=?, updated=? "
        "WHERE id=?",
        impl_->stmt_update));

    int64_t now = now_seconds();
    sqlite3_stmt* s = impl_->stmt_update;
    sqlite3_reset(s);
    sqlite3_bind_int(s, 1, repo.disabled ? 1 : 0);
    sqlite3_bind_int(s, 2, repo.disabled_pr ? 1 : 0);
    Impl::bind_text(s, 3, repo.username);
    Impl::bind_text(s, 4, repo.password);
    Impl::bind_text(s, 5, encode_params(repo.params));
    sqlite3_bind_int64(s, 6, repo.timeout);
    sqlite3_bind_int(s, 7, repo.privileged ? 1 : 0);
    sqlite3_bind_int64(s, 8, repo.user_id);
    sqlite3_bind_int64(s, 9, repo.team_id);
    sqlite3_bind_int64(s, 10, now);
    sqlite3_bind_int64(s, 11, repo.id);

    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return KilnError(KilnError::Database,
            std::string("Failed to update repository: ") + sqlite3_errmsg(impl_->db));
    }
    if (sqlite3_changes(impl_->db) == 0) {
        return KilnError(KilnError::NotFound,
            "repository not found: id " + std::to_string(repo.id));
    }

    repo.updated = from_unix_seconds(now);
    return ok_status();
}

Result<Repo> RepoStore::find_by_id(int64_t id) {
    KILN_TRY(impl_->prepare(
        std::string("SELECT ") + REPO_COLUMNS + " FROM repos WHERE id=?",
        impl_->stmt_find_id));

    sqlite3_reset(impl_->stmt_find_id);
    sqlite3_bind_int64(impl_->stmt_find_id, 1, id);
    return impl_->find_one(impl_->stmt_find_id, "id " + std::to_string(id));
}

Result<Repo> RepoStore::find_by_slug(const std::string& slug) {
    KILN_TRY(impl_->prepare(
        std::string("SELECT ") + REPO_COLUMNS + " FROM repos WHERE slug=?",
        impl_->stmt_find_slug));

    sqlite3_reset(impl_->stmt_find_slug);
    Impl::bind_text(impl_->stmt_find_slug, 1, slug);
    return impl_->find_one(impl_->stmt_find_slug, slug);
}

Result<std::vector<Repo>> RepoStore::list_for_user(int64_t user_id) {
    KILN_TRY(impl_->prepare(
        std::string("SELECT ") + REPO_COLUMNS +
        " FROM repos WHERE user_id=? ORDER BY slug",
        impl_->stmt_list_user));

    sqlite3_stmt* s = impl_->stmt_list_user;
    sqlite3_reset(s);
    sqlite3_bind_int64(s, 1, user_id);

    std::vector<Repo> repos;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        auto r = Impl::read_row(s);
        if (r.is_err()) {
            sqlite3_reset(s);
            return std::move(r).error();
        }
        repos.push_back(std::move(r).value());
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return KilnError(KilnError::Database,
            std::string("Failed to list repositories: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<std::vector<Repo>>::ok(std::move(repos));
}

Status RepoStore::remove(int64_t id) {
    KILN_TRY(impl_->prepare("DELETE FROM repos WHERE id=?", impl_->stmt_remove));

    sqlite3_reset(impl_->stmt_remove);
    sqlite3_bind_int64(impl_->stmt_remove, 1, id);
    int rc = sqlite3_step(impl_->stmt_remove);
    sqlite3_reset(impl_->stmt_remove);
    if (rc != SQLITE_DONE) {
        return KilnError(KilnError::Database,
            std::string("Failed to remove repository: ") + sqlite3_errmsg(impl_->db));
    }
    if (sqlite3_changes(impl_->db) == 0) {
        return KilnError(KilnError::NotFound,
            "repository not found: id " + std::to_string(id));
    }
    return ok_status();
}

} // namespace kiln
