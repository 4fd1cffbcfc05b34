#include "anamnesis/store/sqlite_store.hpp"

#include <sqlite3.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "anamnesis/core/log.hpp"
#include "anamnesis/rdf/ntriples.hpp"

namespace anamnesis::store {
    namespace {
        using core::StatusCode;

        constexpr const char* kSchemaSQL = R"SQL(
            CREATE TABLE IF NOT EXISTS triples (
                graph TEXT NOT NULL,
                subject TEXT NOT NULL,
                predicate TEXT NOT NULL,
                object TEXT NOT NULL,
                PRIMARY KEY (graph, subject, predicate, object)
            );
            CREATE INDEX IF NOT EXISTS idx_triples_predicate ON triples(graph, predicate);
            CREATE INDEX IF NOT EXISTS idx_triples_object ON triples(graph, object);
        )SQL";

        Status store_status(StatusCode code, core::u32 aux = 0) noexcept {
            return core::make_status(core::StatusDomain::Store, code, aux);
        }

        [[nodiscard]] bool exec_sql(sqlite3* db, const char* sql) noexcept {
            char* err_msg = nullptr;
            const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
            if (err_msg) {
                core::log_warn("store", "%s", err_msg);
                sqlite3_free(err_msg);
            }
            return rc == SQLITE_OK;
        }

        // Binds every column of one row; false on the first failed bind.
        [[nodiscard]] bool bind_row(sqlite3_stmt* stmt, const std::string& graph, const core::Triple& t) noexcept {
            return sqlite3_bind_text(stmt, 1, graph.c_str(), -1, SQLITE_STATIC) == SQLITE_OK &&
                   sqlite3_bind_text(stmt, 2, t.subject.c_str(), -1, SQLITE_STATIC) == SQLITE_OK &&
                   sqlite3_bind_text(stmt, 3, t.predicate.c_str(), -1, SQLITE_STATIC) == SQLITE_OK &&
                   sqlite3_bind_text(stmt, 4, t.object.c_str(), -1, SQLITE_STATIC) == SQLITE_OK;
        }
    } // namespace

    Status SqliteTripleStore::open(const std::string& path, std::unique_ptr<SqliteTripleStore>* out) {
        if (out == nullptr || path.empty()) {
            return store_status(StatusCode::Invalid);
        }

        sqlite3* db = nullptr;
        const int rc = sqlite3_open(path.c_str(), &db);
        if (rc != SQLITE_OK) {
            core::log_error("store", "cannot open %s: %s", path.c_str(), db ? sqlite3_errmsg(db) : "out of memory");
            sqlite3_close(db);
            return store_status(StatusCode::Network);
        }

        if (path != ":memory:") {
            (void)exec_sql(db, "PRAGMA journal_mode=WAL");
        }
        (void)exec_sql(db, "PRAGMA synchronous=NORMAL");
        sqlite3_busy_timeout(db, 5000);

        if (!exec_sql(db, kSchemaSQL)) {
            sqlite3_close(db);
            return store_status(StatusCode::Remote);
        }

        *out = std::make_unique<SqliteTripleStore>(Passkey{}, db);
        return core::ok_status();
    }

    SqliteTripleStore::~SqliteTripleStore() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    Status SqliteTripleStore::insert(const std::string& endpoint, std::string_view ntriples) {
        if (endpoint.empty()) {
            return store_status(StatusCode::Invalid);
        }

        std::vector<core::Triple> triples;
        const Status parsed = rdf::parse_ntriples(ntriples, &triples);
        if (!core::is_ok(parsed)) {
            return store_status(StatusCode::Invalid, parsed.aux);
        }

        std::lock_guard<std::mutex> lock(mu_);

        if (!exec_sql(db_, "BEGIN IMMEDIATE TRANSACTION")) {
            return store_status(StatusCode::Remote);
        }

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_,
            "INSERT OR IGNORE INTO triples (graph, subject, predicate, object) VALUES (?, ?, ?, ?)",
            -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            (void)exec_sql(db_, "ROLLBACK");
            return store_status(StatusCode::Remote);
        }

        for (const core::Triple& t : triples) {
            rc = bind_row(stmt, endpoint, t) ? sqlite3_step(stmt) : SQLITE_RANGE;
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
            if (rc != SQLITE_DONE) {
                core::log_error("store", "insert into %s failed: %s", endpoint.c_str(), sqlite3_errmsg(db_));
                sqlite3_finalize(stmt);
                (void)exec_sql(db_, "ROLLBACK");
                return store_status(StatusCode::Remote);
            }
        }
        sqlite3_finalize(stmt);

        if (!exec_sql(db_, "COMMIT")) {
            (void)exec_sql(db_, "ROLLBACK");
            return store_status(StatusCode::Remote);
        }

        core::log_debug("store", "%zu triples into %s", triples.size(), endpoint.c_str());
        return core::ok_status();
    }

    Status SqliteTripleStore::query(const std::string& endpoint, std::string_view, QueryResult* out) {
        if (out == nullptr || endpoint.empty()) {
            return store_status(StatusCode::Invalid);
        }
        return store_status(StatusCode::Unsupported);
    }

    Status SqliteTripleStore::count(const std::string& endpoint, core::u64* out) {
        if (out == nullptr) {
            return store_status(StatusCode::Invalid);
        }

        std::lock_guard<std::mutex> lock(mu_);

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM triples WHERE graph = ?", -1, &stmt, nullptr) != SQLITE_OK) {
            return store_status(StatusCode::Remote);
        }
        if (sqlite3_bind_text(stmt, 1, endpoint.c_str(), -1, SQLITE_STATIC) != SQLITE_OK) {
            sqlite3_finalize(stmt);
            return store_status(StatusCode::Remote);
        }
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            *out = static_cast<core::u64>(sqlite3_column_int64(stmt, 0));
        }
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW ? core::ok_status() : store_status(StatusCode::Remote);
    }

} // namespace anamnesis::store
