#include "anamnesis/cli/commands.hpp"

#include <cstring>

namespace anamnesis::cli {
    anamnesis::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        using anamnesis::core::make_status;
        using anamnesis::core::StatusCode;
        using anamnesis::core::StatusDomain;

        if (out == nullptr || consumed == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                match = &s;
                break;
            }
        }
        if (match == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::NotFound);
        }
        if (args.argc - 1 < match->min_args) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid, match->min_args);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return anamnesis::core::ok_status();
    }
} // namespace anamnesis::cli
