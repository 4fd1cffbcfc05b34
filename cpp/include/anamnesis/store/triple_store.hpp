#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "anamnesis/core/errors.hpp"

namespace anamnesis::store {
    using anamnesis::core::Status;

    // Bindings in N-Triples term syntax: "<iri>" or a serialized literal.
    struct QueryResult {
        std::vector<std::string> variables;
        std::vector<std::vector<std::string>> rows;
    };

    // Destination of generated triples and the SPARQL endpoint behind it.
    // Failures use domain Store with Network, Remote, Invalid or Unsupported;
    // an adapter that only accepts writes answers query() with Unsupported.
    class TripleStore {
    public:
        virtual ~TripleStore() = default;

        [[nodiscard]] virtual Status insert(const std::string& endpoint, std::string_view ntriples) = 0;
        [[nodiscard]] virtual Status query(const std::string& endpoint, std::string_view sparql, QueryResult* out) = 0;
    };

} // namespace anamnesis::store
