#pragma once
// SQLite: thin RAII wrappers over the C API
//
// Every failing call becomes a StorageError carrying sqlite3_errmsg.

#include "errors.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace sutra {
namespace sqlite {

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError("prepare failed: " + std::string(sqlite3_errmsg(db)) +
                               " [" + sql + "]");
        }
    }

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.data(),
                                static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value));
        return *this;
    }

    Statement& bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }

    Statement& bind_blob(int index, const void* data, size_t size) {
        check(sqlite3_bind_blob(stmt_, index, data, static_cast<int>(size), SQLITE_TRANSIENT));
        return *this;
    }

    // True while rows remain; false when done
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError("step failed: " + std::string(sqlite3_errmsg(db_)));
    }

    // Run a statement that returns no rows
    void run() {
        while (step()) {}
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::string text(int col) const {
        const unsigned char* s = sqlite3_column_text(stmt_, col);
        int n = sqlite3_column_bytes(stmt_, col);
        return s ? std::string(reinterpret_cast<const char*>(s), static_cast<size_t>(n)) : "";
    }

    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    int64_t integer(int col) const { return sqlite3_column_int64(stmt_, col); }
    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::vector<uint8_t> blob(int col) const {
        const void* p = sqlite3_column_blob(stmt_, col);
        int n = sqlite3_column_bytes(stmt_, col);
        if (!p || n <= 0) return {};
        const auto* bytes = static_cast<const uint8_t*>(p);
        return std::vector<uint8_t>(bytes, bytes + n);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError("bind failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

class Database {
public:
    Database() = default;

    explicit Database(const std::string& path) { open(path); }

    ~Database() { close(); }

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void open(const std::string& path) {
        close();
        if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            close();
            throw StorageError("cannot open " + path + ": " + msg);
        }
        path_ = path;
    }

    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool is_open() const { return db_ != nullptr; }
    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    void exec(const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw StorageError("exec failed: " + msg);
        }
    }

    Statement prepare(const std::string& sql) const {
        return Statement(db_, sql);
    }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

// BEGIN IMMEDIATE .. COMMIT; rolls back unless committed
class Transaction {
public:
    explicit Transaction(Database& db) : db_(db) {
        db_.exec("BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!done_) {
            char* err = nullptr;
            if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
                std::cerr << "[GraphStore] rollback failed: "
                          << (err ? err : "unknown") << "\n";
            }
            sqlite3_free(err);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        db_.exec("COMMIT");
        done_ = true;
    }

private:
    Database& db_;
    bool done_ = false;
};

} // namespace sqlite
} // namespace sutra
