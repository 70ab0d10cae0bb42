#pragma once

#include "stow/errors.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace stow {

// One persisted entry; data is the JSON text of the value
struct MirrorRow {
    EntryId id;
    std::string name;
    std::string data;
};

/*
 * Durable shadow of a store's entries.
 * Every method either completes or throws PersistenceError.
 */
class Mirror {
public:
    virtual ~Mirror() = default;

    virtual bool is_open() const noexcept = 0;

    // Rows in ascending id order
    virtual std::vector<MirrorRow> load() = 0;

    virtual void insert(const MirrorRow& row) = 0;
    virtual void replace(const MirrorRow& row) = 0;
    virtual void erase_id(EntryId id) = 0;
    virtual void erase_name(std::string_view name) = 0;
    // Inclusive on both ends
    virtual void erase_range(EntryId first, EntryId last) = 0;
    virtual void clear() = 0;

    virtual void close() = 0;
};

/*
 * Mirror of a store that is not persisted: accepts every write and keeps nothing.
 */
class NullMirror final : public Mirror {
public:
    bool is_open() const noexcept override { return false; }
    std::vector<MirrorRow> load() override { return {}; }
    void insert(const MirrorRow&) override {}
    void replace(const MirrorRow&) override {}
    void erase_id(EntryId) override {}
    void erase_name(std::string_view) override {}
    void erase_range(EntryId, EntryId) override {}
    void clear() override {}
    void close() override {}
};

/*
 * SQLite-backed mirror, one "stowrage" table per database file.
 * Owns the connection and its prepared statements; move-only.
 */
class SqliteMirror final : public Mirror {
public:
    // Opens or creates the file and ensures the schema.
    // Throws PersistenceError on failure.
    explicit SqliteMirror(const std::filesystem::path& file);
    ~SqliteMirror() override;

    SqliteMirror(const SqliteMirror&) = delete;
    SqliteMirror& operator=(const SqliteMirror&) = delete;

    SqliteMirror(SqliteMirror&& other) noexcept;
    SqliteMirror& operator=(SqliteMirror&& other) noexcept;

    bool is_open() const noexcept override;
    std::vector<MirrorRow> load() override;
    void insert(const MirrorRow& row) override;
    void replace(const MirrorRow& row) override;
    void erase_id(EntryId id) override;
    void erase_name(std::string_view name) override;
    void erase_range(EntryId first, EntryId last) override;
    void clear() override;
    void close() override;

    const std::filesystem::path& file() const noexcept { return file_; }

private:
    struct Connection;

    Connection& connection();

    std::filesystem::path file_;
    std::unique_ptr<Connection> conn_;
};

// Builds the mirror a store opens in init(); arguments are the directory and store name
using MirrorFactory =
    std::function<std::unique_ptr<Mirror>(const std::filesystem::path& dir, const std::string& name)>;

// Default factory: SqliteMirror at <dir>/<name>.db
std::unique_ptr<Mirror> open_sqlite_mirror(const std::filesystem::path& dir, const std::string& name);

} // namespace stow
