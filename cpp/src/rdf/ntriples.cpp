#include "anamnesis/rdf/ntriples.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

#include "anamnesis/rdf/schema.hpp"

namespace anamnesis::rdf {
    namespace {
        bool starts_with(std::string_view s, std::string_view prefix) noexcept {
            return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
        }

        bool absolute_uri(std::string_view s) noexcept {
            return starts_with(s, "http://") || starts_with(s, "https://");
        }

        std::string bracket(std::string_view name) {
            std::string out;
            out.reserve(name.size() + 48);
            out.push_back('<');
            out += expand_name(name);
            out.push_back('>');
            return out;
        }

        std::string render_object(std::string_view obj) {
            if (!obj.empty() && obj.front() == '"') {
                return std::string(obj);
            }
            if (absolute_uri(obj) || obj.find(':') != std::string_view::npos) {
                return bracket(obj);
            }
            return make_literal(obj);
        }

        bool is_space(char c) noexcept {
            return c == ' ' || c == '\t';
        }

        void skip_space(std::string_view line, size_t* pos) noexcept {
            while (*pos < line.size() && is_space(line[*pos])) ++*pos;
        }

        bool read_iri(std::string_view line, size_t* pos, std::string* out) {
            if (*pos >= line.size() || line[*pos] != '<') return false;
            const size_t close = line.find('>', *pos + 1);
            if (close == std::string_view::npos) return false;
            const std::string_view iri = line.substr(*pos + 1, close - *pos - 1);
            for (char c : iri) {
                if (is_space(c) || c == '<' || c == '"') return false;
            }
            *out = std::string(iri);
            *pos = close + 1;
            return true;
        }

        // Keeps the literal in serialized form, including any datatype or
        // language suffix.
        bool read_literal(std::string_view line, size_t* pos, std::string* out) {
            const size_t start = *pos;
            if (start >= line.size() || line[start] != '"') return false;

            size_t i = start + 1;
            bool closed = false;
            while (i < line.size()) {
                const char c = line[i];
                if (c == '\\') {
                    if (i + 1 >= line.size()) return false;
                    i += 2;
                    continue;
                }
                if (c == '"') {
                    closed = true;
                    ++i;
                    break;
                }
                ++i;
            }
            if (!closed) return false;

            if (i + 1 < line.size() && line[i] == '^' && line[i + 1] == '^') {
                i += 2;
                std::string dt;
                if (!read_iri(line, &i, &dt)) return false;
            } else if (i < line.size() && line[i] == '@') {
                ++i;
                const size_t tag = i;
                while (i < line.size() && (std::isalnum(static_cast<unsigned char>(line[i])) || line[i] == '-')) ++i;
                if (i == tag) return false;
            }

            *out = std::string(line.substr(start, i - start));
            *pos = i;
            return true;
        }
    } // namespace

    std::string escape_literal(std::string_view s) {
        std::string out;
        out.reserve(s.size() + 8);
        for (char ch : s) {
            const unsigned char c = static_cast<unsigned char>(ch);
            switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(ch);
                }
                break;
            }
        }
        return out;
    }

    std::string make_literal(std::string_view s) {
        std::string out = "\"";
        out += escape_literal(s);
        out.push_back('"');
        return out;
    }

    std::string make_typed_literal(std::string_view lexical, std::string_view datatype) {
        std::string out = make_literal(lexical);
        out += "^^<";
        out += datatype;
        out.push_back('>');
        return out;
    }

    std::string expand_name(std::string_view name) {
        if (absolute_uri(name)) {
            return std::string(name);
        }
        const size_t colon = name.find(':');
        if (colon == std::string_view::npos) {
            return std::string(name);
        }
        std::string out(schema::kBase);
        out += name.substr(colon + 1);
        return out;
    }

    std::string encode_resource_id(std::string_view id) {
        static constexpr char kHex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(id.size());
        for (char ch : id) {
            const unsigned char c = static_cast<unsigned char>(ch);
            const bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                                    c == '-' || c == '.' || c == '_' || c == '~';
            if (unreserved) {
                out.push_back(ch);
            } else {
                out.push_back('%');
                out.push_back(kHex[c >> 4]);
                out.push_back(kHex[c & 0x0f]);
            }
        }
        return out;
    }

    std::string canonical_triple(const Triple& t) {
        std::string line = bracket(t.subject);
        line.push_back(' ');
        line += bracket(t.predicate);
        line.push_back(' ');
        line += render_object(t.object);
        line += " .";
        return line;
    }

    std::string to_ntriples(const std::vector<Triple>& triples) {
        std::string out;
        for (const Triple& t : triples) {
            out += canonical_triple(t);
            out.push_back('\n');
        }
        return out;
    }

    core::Status parse_ntriples(std::string_view text, std::vector<Triple>* out) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Rdf, core::StatusCode::Invalid);
        }

        std::vector<Triple> result;
        core::u32 line_no = 0;
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string_view::npos) end = text.size();
            std::string_view line = text.substr(start, end - start);
            ++line_no;
            start = end + 1;

            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            size_t pos = 0;
            skip_space(line, &pos);
            if (pos == line.size() || line[pos] == '#') {
                if (end == text.size()) break;
                continue;
            }

            Triple t;
            const core::Status bad = core::make_status(core::StatusDomain::Rdf, core::StatusCode::Invalid, line_no);
            if (!read_iri(line, &pos, &t.subject)) return bad;
            skip_space(line, &pos);
            if (!read_iri(line, &pos, &t.predicate)) return bad;
            skip_space(line, &pos);
            if (pos < line.size() && line[pos] == '<') {
                if (!read_iri(line, &pos, &t.object)) return bad;
            } else if (!read_literal(line, &pos, &t.object)) {
                return bad;
            }
            skip_space(line, &pos);
            if (pos >= line.size() || line[pos] != '.') return bad;
            ++pos;
            skip_space(line, &pos);
            if (pos != line.size() && line[pos] != '#') return bad;

            result.push_back(std::move(t));
            if (end == text.size()) break;
        }

        *out = std::move(result);
        return core::ok_status();
    }
} // namespace anamnesis::rdf
