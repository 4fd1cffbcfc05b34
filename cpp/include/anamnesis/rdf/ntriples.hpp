#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

namespace anamnesis::rdf {
    using anamnesis::core::Triple;

    // '"' -> \"  newline -> \n  '\' -> \\  CR -> \r  TAB -> \t
    // other control characters -> \u00XX
    [[nodiscard]] std::string escape_literal(std::string_view s);

    // "escaped"
    [[nodiscard]] std::string make_literal(std::string_view s);
    // "escaped"^^<datatype>
    [[nodiscard]] std::string make_typed_literal(std::string_view lexical, std::string_view datatype);

    // Absolute http(s) URIs pass through; "prefix:rest" becomes base + "rest";
    // anything else is returned unchanged.
    [[nodiscard]] std::string expand_name(std::string_view name);

    // Percent-encodes everything but RFC 3986 unreserved characters.
    [[nodiscard]] std::string encode_resource_id(std::string_view id);

    // "<s> <p> o ." without the trailing newline.
    [[nodiscard]] std::string canonical_triple(const Triple& t);

    // One canonical_triple per line, each terminated by '\n'.
    [[nodiscard]] std::string to_ntriples(const std::vector<Triple>& triples);

    // Reads N-Triples back. Subjects and predicates come back as full IRIs,
    // IRI objects as full IRIs and literal objects in serialized form, so
    // canonical_triple() of a parsed triple equals the line it came from.
    // Invalid (domain Rdf, aux = 1-based line) on a malformed line.
    [[nodiscard]] core::Status parse_ntriples(std::string_view text, std::vector<Triple>* out);

} // namespace anamnesis::rdf
