#pragma once

#include <kiln/result.hpp>
#include <kiln/repo.hpp>
#include <memory>
#include <string>
#include <vector>

namespace kiln {

// SQLite-backed persisted form of Repo. Unlike the API representation the
// `repos` table carries credentials and build parameters.
//
// One store owns one connection; use a separate store per thread.
class RepoStore {
public:
    RepoStore();
    ~RepoStore();
    RepoStore(RepoStore&&) noexcept;
    RepoStore& operator=(RepoStore&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;
    static std::string default_db_path();

    // Assigns repo.id and stamps created/updated.
    // Duplicate if the slug is already registered.
    Status insert(Repo& repo);

    // Writes the externally mutable fields and stamps updated.
    // Identity and key material are left as stored.
    Status update(Repo& repo);

    Result<Repo> find_by_id(int64_t id);
    Result<Repo> find_by_slug(const std::string& slug);
    Result<std::vector<Repo>> list_for_user(int64_t user_id);
    Status remove(int64_t id);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kiln
