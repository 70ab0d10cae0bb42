#include "stow/mirror.hpp"
#include "stow/logger.hpp"

#include <sqlite3.h>

namespace stow {

namespace {

constexpr std::string_view kCreateTable =
    "CREATE TABLE IF NOT EXISTS stowrage (id INTEGER, name TEXT, data TEXT)";
// REPLACE INTO only replaces on a uniqueness conflict
constexpr std::string_view kCreateIdIndex =
    "CREATE UNIQUE INDEX IF NOT EXISTS stowrage_id ON stowrage (id)";

constexpr std::string_view kSelectAll   = "SELECT id, name, data FROM stowrage ORDER BY id";
constexpr std::string_view kInsert      = "INSERT INTO stowrage (id, name, data) VALUES (?, ?, ?)";
constexpr std::string_view kReplace     = "REPLACE INTO stowrage (id, name, data) VALUES (?, ?, ?)";
constexpr std::string_view kDeleteId    = "DELETE FROM stowrage WHERE id = ?";
constexpr std::string_view kDeleteName  = "DELETE FROM stowrage WHERE name = ?";
constexpr std::string_view kDeleteRange = "DELETE FROM stowrage WHERE id BETWEEN ? AND ?";
constexpr std::string_view kDeleteAll   = "DELETE FROM stowrage";

struct DbCloser {
    void operator()(sqlite3* db) const noexcept { sqlite3_close(db); }
};

struct StmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

/*
 * Prepared statement bound to one connection.
 * reset() must be called before rebinding; step() reports rows until SQLITE_DONE.
 */
class Statement {
public:
    Statement(sqlite3* db, std::string_view sql) : db_(db) {
        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
        stmt_.reset(raw);
        if (rc != SQLITE_OK)
            throw PersistenceError{"failed to prepare \"" + std::string{sql} + "\": " + sqlite3_errmsg(db)};
    }

    void reset() noexcept {
        sqlite3_reset(stmt_.get());
        sqlite3_clear_bindings(stmt_.get());
    }

    void bind(int index, EntryId value) {
        check(sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value)));
    }

    void bind(int index, std::string_view text) {
        check(sqlite3_bind_text(stmt_.get(), index, text.data(), static_cast<int>(text.size()),
                                SQLITE_TRANSIENT));
    }

    // true while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_.get());
        if (rc == SQLITE_ROW)
            return true;
        if (rc == SQLITE_DONE)
            return false;
        std::string msg = sqlite3_errmsg(db_);
        reset();
        throw PersistenceError{"sqlite step failed: " + msg};
    }

    void run() {
        while (step()) {
        }
    }

    EntryId column_id(int col) const {
        return static_cast<EntryId>(sqlite3_column_int64(stmt_.get(), col));
    }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_.get(), col);
        if (!text)
            return {};
        return std::string{reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), col))};
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK)
            throw PersistenceError{std::string{"sqlite bind failed: "} + sqlite3_errmsg(db_)};
    }

    sqlite3* db_;
    std::unique_ptr<sqlite3_stmt, StmtFinalizer> stmt_;
};

DbHandle open_database(const std::filesystem::path& file) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(file.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    DbHandle db{raw};
    if (rc != SQLITE_OK) {
        std::string msg = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        throw PersistenceError{"failed to open " + file.string() + ": " + msg};
    }
    return db;
}

void exec(sqlite3* db, std::string_view sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, std::string{sql}.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw PersistenceError{"\"" + std::string{sql} + "\" failed: " + msg};
    }
}

void write_row(Statement& stmt, const MirrorRow& row) {
    stmt.reset();
    stmt.bind(1, row.id);
    stmt.bind(2, row.name);
    stmt.bind(3, row.data);
    stmt.run();
}

} // namespace

// Declaration order matters: statements are finalized before the handle closes.
struct SqliteMirror::Connection {
    DbHandle db;
    Statement select_all;
    Statement insert;
    Statement replace;
    Statement delete_id;
    Statement delete_name;
    Statement delete_range;
    Statement delete_all;

    explicit Connection(DbHandle handle)
        : db(std::move(handle)),
          select_all(db.get(), kSelectAll),
          insert(db.get(), kInsert),
          replace(db.get(), kReplace),
          delete_id(db.get(), kDeleteId),
          delete_name(db.get(), kDeleteName),
          delete_range(db.get(), kDeleteRange),
          delete_all(db.get(), kDeleteAll) {}
};

SqliteMirror::SqliteMirror(const std::filesystem::path& file) : file_(file) {
    DbHandle db = open_database(file_);
    exec(db.get(), kCreateTable);
    exec(db.get(), kCreateIdIndex);
    conn_ = std::make_unique<Connection>(std::move(db));
    Logger::instance().debug("opened mirror " + file_.string());
}

SqliteMirror::~SqliteMirror() = default;

SqliteMirror::SqliteMirror(SqliteMirror&& other) noexcept = default;
SqliteMirror& SqliteMirror::operator=(SqliteMirror&& other) noexcept = default;

bool SqliteMirror::is_open() const noexcept {
    return conn_ != nullptr;
}

SqliteMirror::Connection& SqliteMirror::connection() {
    if (!conn_)
        throw PersistenceError{"mirror " + file_.string() + " is closed"};
    return *conn_;
}

std::vector<MirrorRow> SqliteMirror::load() {
    Statement& stmt = connection().select_all;
    stmt.reset();

    std::vector<MirrorRow> rows;
    while (stmt.step())
        rows.push_back(MirrorRow{stmt.column_id(0), stmt.column_text(1), stmt.column_text(2)});
    stmt.reset();
    return rows;
}

void SqliteMirror::insert(const MirrorRow& row) {
    write_row(connection().insert, row);
}

void SqliteMirror::replace(const MirrorRow& row) {
    write_row(connection().replace, row);
}

void SqliteMirror::erase_id(EntryId id) {
    Statement& stmt = connection().delete_id;
    stmt.reset();
    stmt.bind(1, id);
    stmt.run();
}

void SqliteMirror::erase_name(std::string_view name) {
    Statement& stmt = connection().delete_name;
    stmt.reset();
    stmt.bind(1, name);
    stmt.run();
}

void SqliteMirror::erase_range(EntryId first, EntryId last) {
    Statement& stmt = connection().delete_range;
    stmt.reset();
    stmt.bind(1, first);
    stmt.bind(2, last);
    stmt.run();
}

void SqliteMirror::clear() {
    Statement& stmt = connection().delete_all;
    stmt.reset();
    stmt.run();
}

void SqliteMirror::close() {
    if (!conn_)
        return;
    conn_.reset();
    Logger::instance().debug("closed mirror " + file_.string());
}

std::unique_ptr<Mirror> open_sqlite_mirror(const std::filesystem::path& dir, const std::string& name) {
    return std::make_unique<SqliteMirror>(dir / (name + ".db"));
}

} // namespace stow
