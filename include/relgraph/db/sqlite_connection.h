#pragma once

#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace relgraph {
namespace db {

class SQLiteConnection;

/*
 * A prepared statement bound to one connection. Finalized on destruction.
 * Every failure throws std::runtime_error carrying the SQLite message.
 */
class Statement {
public:
    Statement(SQLiteConnection& conn, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // 1-based parameter index, as in sqlite3_bind_*.
    void bindText(int index, const std::string& value);

    // True while a result row is available, false once the statement is done.
    bool step();

    // Column of the current row; nullopt for SQL NULL.
    std::optional<std::string> columnText(int column) const;

private:
    [[noreturn]] void fail(const std::string& what) const;

    SQLiteConnection& m_conn;
    sqlite3_stmt* m_stmt = nullptr;
};

/*
 * Owns the relgraph settings database. Opens (and migrates) the file at
 * defaultDatabasePath() or at the given path; ":memory:" works for tests.
 */
class SQLiteConnection {
public:
    static constexpr int kSchemaVersion = 1;

    SQLiteConnection();
    explicit SQLiteConnection(const std::string& path);
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    void exec(const std::string& sql);

    sqlite3* getDbHandle() { return m_db; }
    const std::string& getPath() const { return m_path; }

    // PRAGMA user_version of the open database.
    int schemaVersion();

    // ~/.relgraph/relgraph.db, or relgraph.db in the working directory when
    // the home directory is unknown or not writable.
    static std::string defaultDatabasePath();

private:
    void open(const std::string& path);
    void migrate();

    sqlite3* m_db = nullptr;
    std::string m_path;
};

} // namespace db
} // namespace relgraph
