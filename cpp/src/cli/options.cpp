#include "anamnesis/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace anamnesis::cli {
    namespace {
        using anamnesis::core::Status;

        [[nodiscard]] constexpr Status cli_invalid(u32 index) noexcept {
            return anamnesis::core::make_status(anamnesis::core::StatusDomain::Cli,
                                                anamnesis::core::StatusCode::Invalid, index);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool set_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
            case OptionType::String:
                opt->value.str = value;
                return true;
            case OptionType::I64:
                return parse_i64(value, &opt->value.i64v);
            case OptionType::Flag:
                break;
            }
            return false;
        }

        [[nodiscard]] bool push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return false;
            }
            out->data[out->len++] = opt;
            return true;
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid(0);
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid(0);
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid(0);
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const u32 at = i;
            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            bool inline_value = false;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                char name_buf[64]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return cli_invalid(at);
                    }
                    std::memcpy(name_buf, name, name_len);
                    name = name_buf;
                    value = eq + 1;
                    inline_value = true;
                }
                spec = find_long(specs, spec_count, name);
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (spec != nullptr && tok[2] != '\0') {
                    value = tok + 2;
                    inline_value = true;
                }
            }
            if (spec == nullptr) {
                return cli_invalid(at);
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (inline_value) {
                    return cli_invalid(at);
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                if (!inline_value) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_invalid(at);
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }
                if (!set_value(*spec, value, &opt)) {
                    return cli_invalid(at);
                }
            }

            if (!push_option(out, opt)) {
                return cli_invalid(at);
            }
        }

        *consumed = i;
        return anamnesis::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace anamnesis::cli
