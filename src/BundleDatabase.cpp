// src/BundleDatabase.cpp
#include "BundleDatabase.hpp"
#include "VaultError.hpp"
#include "Log.hpp"

#include <sqlite3.h>
#include <filesystem>
#include <memory>     // std::unique_ptr
#include <string>
#include <vector>
#include <cstdint>

// Helper: RAII closer for sqlite3_stmt* + small helpers
namespace {
    struct StmtCloser {
        void operator()(sqlite3_stmt* stmt) const {
            if (stmt) sqlite3_finalize(stmt);
        }
    };
    using Stmt = std::unique_ptr<sqlite3_stmt, StmtCloser>;

    // TEXT columns by byte count, so embedded NULs survive; NULL reads as ""
    inline std::string read_text_nullable(sqlite3_stmt* st, int col) {
        const unsigned char* p = sqlite3_column_text(st, col);
        const int n = sqlite3_column_bytes(st, col);
        return p ? std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(n)) : std::string{};
    }

    inline int bind_text(sqlite3_stmt* st, int idx, const std::string& s) {
        return sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }

    inline std::vector<std::uint8_t> read_blob(sqlite3_stmt* st, int col) {
        std::vector<std::uint8_t> out;
        const void* ptr = sqlite3_column_blob(st, col);
        int n = sqlite3_column_bytes(st, col);
        if (ptr && n > 0) {
            const auto* b = static_cast<const std::uint8_t*>(ptr);
            out.assign(b, b + n);
        }
        return out;
    }

    // sqlite binds a null pointer as NULL, so empty blobs go in as zeroblob(0)
    inline int bind_blob(sqlite3_stmt* st, int idx, const std::vector<std::uint8_t>& v) {
        if (v.empty()) return sqlite3_bind_zeroblob(st, idx, 0);
        return sqlite3_bind_blob(st, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }

    bool is_in_memory(const std::string& path) {
        return path.empty() || path == ":memory:" || path.rfind("file:", 0) == 0;
    }
}

// ---- Persistent-connection ctor/dtor ----
BundleDatabase::BundleDatabase(const std::string& dbPath, OpenMode mode)
    : m_dbPath(dbPath), m_mode(mode), m_db(nullptr)
{
    if (m_mode == OpenMode::ReadOnly && !is_in_memory(m_dbPath)) {
        std::error_code ec;
        if (!std::filesystem::exists(m_dbPath, ec)) {
            if (ec) {
                throw VaultError(ErrorCode::PersistenceError,
                                 "cannot stat store " + m_dbPath + ": " + ec.message());
            }
            Log::info("store " + m_dbPath + " does not exist yet");
            return;
        }
    }

    const int flags = (m_mode == OpenMode::ReadOnly)
        ? SQLITE_OPEN_READONLY
        : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int rc = sqlite3_open_v2(m_dbPath.c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK || !m_db) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "unknown";
        if (m_db) sqlite3_close(m_db);
        m_db = nullptr;
        throw VaultError(ErrorCode::PersistenceError,
                         "cannot open store " + m_dbPath + ": " + msg);
    }

    // Another yksec process may hold the write lock while waiting on a touch
    sqlite3_busy_timeout(m_db, 30000);
    exec("PRAGMA foreign_keys = ON;");
}

BundleDatabase::~BundleDatabase() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

void BundleDatabase::fail(const std::string& what) const {
    throw VaultError(ErrorCode::PersistenceError,
                     what + ": " + (m_db ? sqlite3_errmsg(m_db) : "no connection"));
}

// Run raw SQL (no parameters) on the same connection
void BundleDatabase::exec(const std::string& sql) const {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown";
        sqlite3_free(errMsg);
        throw VaultError(ErrorCode::PersistenceError, "sqlite3_exec failed: " + msg);
    }
}

void BundleDatabase::requireWritable(const char* op) const {
    if (m_mode == OpenMode::ReadOnly) {
        throw VaultError(ErrorCode::PersistenceError,
                         std::string(op) + ": store " + m_dbPath + " is open read-only");
    }
}

int BundleDatabase::formatVersion() const {
    if (!m_db) return 0;
    sqlite3_stmt* stmtRaw = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA user_version;", -1, &stmtRaw, nullptr) != SQLITE_OK) {
        fail("prepare user_version");
    }
    Stmt stmt(stmtRaw);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) fail("read user_version");
    return sqlite3_column_int(stmt.get(), 0);
}

void BundleDatabase::init() {
    const int version = formatVersion();
    if (version > FORMAT_VERSION) {
        throw VaultError(ErrorCode::PersistenceError,
                         "store " + m_dbPath + " uses format version " + std::to_string(version)
                         + ", this build understands up to " + std::to_string(FORMAT_VERSION));
    }
}

bool BundleDatabase::hasSchema() const {
    if (!m_db) return false;
    sqlite3_stmt* stmtRaw = nullptr;
    if (sqlite3_prepare_v2(m_db,
            "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'envelopes';",
            -1, &stmtRaw, nullptr) != SQLITE_OK) {
        fail("prepare schema check");
    }
    Stmt stmt(stmtRaw);
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return true;
    if (rc != SQLITE_DONE) fail("schema check");
    return false;
}

// Runs inside save()'s savepoint, so a failed first save leaves no tables behind
void BundleDatabase::createSchema() {
    static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS devices (
  id     INTEGER PRIMARY KEY AUTOINCREMENT,
  serial TEXT NOT NULL UNIQUE
);

CREATE TABLE IF NOT EXISTS envelopes (
  id         INTEGER PRIMARY KEY AUTOINCREMENT,
  device_id  INTEGER NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
  position   INTEGER NOT NULL,
  context    TEXT NOT NULL DEFAULT '',
  passphrase INTEGER NOT NULL DEFAULT 0,
  salt       BLOB NOT NULL,
  nonce      BLOB NOT NULL,
  ciphertext BLOB NOT NULL,
  tag        BLOB NOT NULL,
  created_at TEXT NOT NULL,
  UNIQUE (device_id, position)
);
CREATE INDEX IF NOT EXISTS idx_envelopes_device_context ON envelopes(device_id, context);
)SQL";

    exec(kSchema);
    exec("PRAGMA user_version = " + std::to_string(FORMAT_VERSION) + ";");
}

void BundleDatabase::restrictPermissions() const {
    if (is_in_memory(m_dbPath)) return;
    std::error_code ec;
    std::filesystem::permissions(m_dbPath,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) Log::warn("could not restrict permissions on " + m_dbPath + ": " + ec.message());
}

BundleStore BundleDatabase::load() const {
    const char* sql = R"SQL(
        SELECT d.serial, e.context, e.passphrase, e.salt, e.nonce, e.ciphertext, e.tag, e.created_at
        FROM envelopes e JOIN devices d ON d.id = e.device_id
        ORDER BY d.serial, e.position;
    )SQL";

    // Absent or never-saved store
    if (!hasSchema()) return BundleStore{};

    sqlite3_stmt* stmtRaw = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql, -1, &stmtRaw, nullptr);
    if (rc != SQLITE_OK) fail("prepare load");
    Stmt stmt(stmtRaw);

    BundleStore store;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const std::string serial = read_text_nullable(stmt.get(), 0);
        Envelope e;
        e.context    = read_text_nullable(stmt.get(), 1);
        e.passphrase = sqlite3_column_int(stmt.get(), 2) != 0;
        e.salt       = read_blob(stmt.get(), 3);
        e.nonce      = read_blob(stmt.get(), 4);
        e.ciphertext = read_blob(stmt.get(), 5);
        e.tag        = read_blob(stmt.get(), 6);
        e.createdAt  = read_text_nullable(stmt.get(), 7);
        store.insert(serial, std::move(e));
    }
    if (rc != SQLITE_DONE) fail("step load");

    return store;
}

void BundleDatabase::save(const BundleStore& store) {
    requireWritable("save");

    // SAVEPOINT nests inside an outer Transaction and acts as BEGIN otherwise
    exec("SAVEPOINT save_store;");
    try {
        if (!hasSchema()) createSchema();
        exec("DELETE FROM envelopes; DELETE FROM devices;");

        sqlite3_stmt* devRaw = nullptr;
        if (sqlite3_prepare_v2(m_db, "INSERT INTO devices(serial) VALUES(?);", -1, &devRaw, nullptr) != SQLITE_OK)
            fail("prepare insert device");
        Stmt devStmt(devRaw);

        const char* envSql = R"SQL(
            INSERT INTO envelopes(device_id, position, context, passphrase,
                                  salt, nonce, ciphertext, tag, created_at)
            VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?);
        )SQL";
        sqlite3_stmt* envRaw = nullptr;
        if (sqlite3_prepare_v2(m_db, envSql, -1, &envRaw, nullptr) != SQLITE_OK)
            fail("prepare insert envelope");
        Stmt envStmt(envRaw);

        auto bind_ok = [&](int code, const char* what) {
            if (code != SQLITE_OK) fail(what);
        };

        for (const auto& [serial, envs] : store.devices()) {
            sqlite3_reset(devStmt.get());
            bind_ok(bind_text(devStmt.get(), 1, serial), "bind serial");
            if (sqlite3_step(devStmt.get()) != SQLITE_DONE) fail("insert device");
            const sqlite3_int64 deviceRow = sqlite3_last_insert_rowid(m_db);

            int position = 0;
            for (const auto& e : envs) {
                sqlite3_reset(envStmt.get());
                bind_ok(sqlite3_bind_int64(envStmt.get(), 1, deviceRow), "bind device_id");
                bind_ok(sqlite3_bind_int  (envStmt.get(), 2, position++), "bind position");
                bind_ok(bind_text(envStmt.get(), 3, e.context), "bind context");
                bind_ok(sqlite3_bind_int  (envStmt.get(), 4, e.passphrase ? 1 : 0), "bind passphrase");
                bind_ok(bind_blob(envStmt.get(), 5, e.salt),       "bind salt");
                bind_ok(bind_blob(envStmt.get(), 6, e.nonce),      "bind nonce");
                bind_ok(bind_blob(envStmt.get(), 7, e.ciphertext), "bind ciphertext");
                bind_ok(bind_blob(envStmt.get(), 8, e.tag),        "bind tag");
                bind_ok(bind_text(envStmt.get(), 9, e.createdAt), "bind created_at");
                if (sqlite3_step(envStmt.get()) != SQLITE_DONE) fail("insert envelope");
            }
        }

        exec("RELEASE save_store;");
    } catch (...) {
        // Undo the partial rewrite, then drop the savepoint itself
        if (sqlite3_exec(m_db, "ROLLBACK TO save_store; RELEASE save_store;",
                         nullptr, nullptr, nullptr) != SQLITE_OK) {
            Log::warn(std::string("could not roll back store rewrite: ") + sqlite3_errmsg(m_db));
        }
        throw;
    }

    // Outside a Transaction the savepoint was the whole write
    if (sqlite3_get_autocommit(m_db)) restrictPermissions();
}

// ---- Transactions ----

BundleDatabase::Transaction::Transaction(BundleDatabase& db)
    : m_db(db)
{
    m_db.requireWritable("transaction");
    m_db.exec("BEGIN IMMEDIATE;");
    m_active = true;
}

void BundleDatabase::Transaction::commit() {
    m_db.exec("COMMIT;");
    m_active = false;
    m_db.restrictPermissions();
}

BundleDatabase::Transaction::~Transaction() {
    if (!m_active) return;
    char* errMsg = nullptr;
    if (sqlite3_exec(m_db.m_db, "ROLLBACK;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        Log::warn(std::string("rollback failed: ") + (errMsg ? errMsg : "unknown"));
    }
    sqlite3_free(errMsg);
}
