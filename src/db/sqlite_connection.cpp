#include <relgraph/db/sqlite_connection.h>

#include <sqlite3.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace relgraph {
namespace db {

namespace {
constexpr const char* kDatabaseFileName = "relgraph.db";
constexpr const char* kDataDirName = ".relgraph";

// Version 1: key/value settings.
constexpr const char* kSchemaV1 = R"(
    CREATE TABLE IF NOT EXISTS settings (
        key TEXT PRIMARY KEY NOT NULL,
        value TEXT
    );
)";
} // namespace

Statement::Statement(SQLiteConnection& conn, const char* sql) : m_conn(conn) {
    if (sqlite3_prepare_v2(m_conn.getDbHandle(), sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        fail(std::string("cannot prepare '") + sql + "'");
    }
}

Statement::~Statement() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

void Statement::fail(const std::string& what) const {
    throw std::runtime_error("SQLite error (" + m_conn.getPath() + "): " + what + ": " +
                             sqlite3_errmsg(m_conn.getDbHandle()));
}

void Statement::bindText(int index, const std::string& value) {
    if (sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
        SQLITE_OK) {
        fail("cannot bind parameter " + std::to_string(index));
    }
}

bool Statement::step() {
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    fail("step failed");
}

std::optional<std::string> Statement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(m_stmt, column);
    if (!text) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(m_stmt, column)));
}

std::string SQLiteConnection::defaultDatabasePath() {
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0') {
        std::cerr << "Warning: HOME is not set, keeping settings in ./" << kDatabaseFileName << std::endl;
        return kDatabaseFileName;
    }
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::path(home) / kDataDirName;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Warning: Cannot create " << dir.string() << " (" << ec.message() << "), keeping settings in ./"
                  << kDatabaseFileName << std::endl;
        return kDatabaseFileName;
    }
    return (dir / kDatabaseFileName).string();
}

SQLiteConnection::SQLiteConnection() {
    open(defaultDatabasePath());
}

SQLiteConnection::SQLiteConnection(const std::string& path) {
    open(path);
}

SQLiteConnection::~SQLiteConnection() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void SQLiteConnection::open(const std::string& path) {
    m_path = path;
    if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
        std::string reason = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("Cannot open settings database '" + path + "': " + reason);
    }
    if (path != ":memory:") {
        exec("PRAGMA journal_mode=WAL");
    }
    migrate();
}

void SQLiteConnection::migrate() {
    int version = schemaVersion();
    if (version > kSchemaVersion) {
        throw std::runtime_error("Settings database '" + m_path + "' has schema version " +
                                 std::to_string(version) + ", newer than supported " +
                                 std::to_string(kSchemaVersion));
    }
    if (version < 1) {
        exec(kSchemaV1);
    }
    exec("PRAGMA user_version = " + std::to_string(kSchemaVersion));
}

int SQLiteConnection::schemaVersion() {
    Statement stmt(*this, "PRAGMA user_version");
    if (!stmt.step()) return 0;
    return std::stoi(stmt.columnText(0).value_or("0"));
}

void SQLiteConnection::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string reason = err ? err : sqlite3_errmsg(m_db);
        sqlite3_free(err);
        throw std::runtime_error("SQL error executing '" + sql + "': " + reason);
    }
}

} // namespace db
} // namespace relgraph
