#pragma once
#include "BundleStore.hpp"

#include <string>

// Forward-declare sqlite3 so consumers of this header don't need sqlite3.h
struct sqlite3;

// SQLite-backed persistence for a BundleStore.
//
// Layout (user_version = FORMAT_VERSION):
//   devices(id, serial UNIQUE)
//   envelopes(id, device_id -> devices, position, context, passphrase,
//             salt, nonce, ciphertext, tag, created_at)
//
// The schema is written by the first save(), so opening and reading never
// changes anything on disk. ReadOnly never creates the file: an absent store
// simply loads as empty.
//
// All failures surface as VaultError(PersistenceError).
class BundleDatabase {
public:
    enum class OpenMode { ReadOnly, ReadWrite };

    explicit BundleDatabase(const std::string& dbPath, OpenMode mode = OpenMode::ReadWrite);
    ~BundleDatabase();

    BundleDatabase(const BundleDatabase&) = delete;
    BundleDatabase& operator=(const BundleDatabase&) = delete;

    // Rejects stores written by a newer format. Writes nothing.
    void init();

    // A fresh (never saved) database loads as an empty store.
    BundleStore load() const;

    // Replaces the persisted contents with `store` in one transaction,
    // creating the schema on first use. On failure nothing is changed.
    void save(const BundleStore& store);

    // 0 for a store that has never been saved
    int formatVersion() const;

    bool readOnly() const { return m_mode == OpenMode::ReadOnly; }

    // Exclusive write transaction around load-mutate-save, so two processes
    // enrolling at once serialize on SQLite's file lock instead of losing updates.
    class Transaction {
    public:
        explicit Transaction(BundleDatabase& db);
        ~Transaction();
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        BundleDatabase& m_db;
        bool m_active = false;
    };

    static constexpr int FORMAT_VERSION = 1;

private:
    std::string m_dbPath;
    OpenMode    m_mode;
    sqlite3*    m_db = nullptr; // persistent DB connection; null for an absent read-only store

    // helper to run raw SQL without parameters on m_db
    void exec(const std::string& sql) const;
    bool hasSchema() const;
    void createSchema();
    void restrictPermissions() const;
    void requireWritable(const char* op) const;
    [[noreturn]] void fail(const std::string& what) const;
};
