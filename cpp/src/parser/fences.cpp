#include "anamnesis/parser/fences.hpp"

namespace anamnesis::parser {
    namespace {
        constexpr std::string_view kFence = "```";

        bool tag_char(char c) noexcept {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                   c == '+' || c == '-' || c == '_' || c == '#' || c == '.';
        }

        std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
            return s;
        }
    } // namespace

    std::vector<FencedBlock> find_fenced_blocks(std::string_view text) {
        std::vector<FencedBlock> out;
        size_t pos = 0;

        while (pos < text.size()) {
            const size_t open = text.find(kFence, pos);
            if (open == std::string_view::npos) break;

            const size_t line_start = open + kFence.size();
            const size_t eol = text.find('\n', line_start);
            if (eol == std::string_view::npos) break;

            // The info string is the language tag; only its first word counts.
            std::string_view info = trim(text.substr(line_start, eol - line_start));
            if (info.find(kFence) != std::string_view::npos) {
                // ```inline``` on one line is not a block
                pos = line_start + info.find(kFence) + kFence.size();
                continue;
            }
            size_t tag_len = 0;
            while (tag_len < info.size() && tag_char(info[tag_len])) ++tag_len;

            const size_t body_start = eol + 1;
            const size_t close = text.find(kFence, body_start);
            if (close == std::string_view::npos) break;

            std::string_view body = text.substr(body_start, close - body_start);
            if (!body.empty() && body.back() == '\n') {
                body.remove_suffix(1);
                if (!body.empty() && body.back() == '\r') body.remove_suffix(1);
            }

            FencedBlock block;
            block.language = std::string(info.substr(0, tag_len));
            block.body = std::string(body);
            out.push_back(std::move(block));

            pos = close + kFence.size();
        }
        return out;
    }
} // namespace anamnesis::parser
