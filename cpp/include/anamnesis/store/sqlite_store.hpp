#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "anamnesis/core/types.hpp"
#include "anamnesis/store/triple_store.hpp"

struct sqlite3;

namespace anamnesis::store {

    // Local development sink: one graph per endpoint in a SQLite database.
    // Queries belong to the remote endpoint, so query() is Unsupported.
    class SqliteTripleStore final : public TripleStore {
        struct Passkey {
            explicit Passkey() = default;
        };

    public:
        // path may be ":memory:". Network when the database cannot be opened.
        [[nodiscard]] static Status open(const std::string& path, std::unique_ptr<SqliteTripleStore>* out);
        ~SqliteTripleStore() override;

        SqliteTripleStore(const SqliteTripleStore&) = delete;
        SqliteTripleStore& operator=(const SqliteTripleStore&) = delete;

        // Duplicate triples are ignored. One transaction per call.
        [[nodiscard]] Status insert(const std::string& endpoint, std::string_view ntriples) override;
        [[nodiscard]] Status query(const std::string& endpoint, std::string_view sparql, QueryResult* out) override;

        // Triples held for endpoint.
        [[nodiscard]] Status count(const std::string& endpoint, core::u64* out);

        // Only open() can name the key.
        SqliteTripleStore(Passkey, sqlite3* db) noexcept : db_(db) {}

    private:
        sqlite3* db_{nullptr};
        std::mutex mu_;
    };

} // namespace anamnesis::store
