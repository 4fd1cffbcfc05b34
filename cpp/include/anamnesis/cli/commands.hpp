#pragma once

#include <type_traits>

#include "anamnesis/cli/options.hpp"
#include "anamnesis/core/errors.hpp"

namespace anamnesis::cli {
    using u32 = anamnesis::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Ingest = 2,
        Detect = 3,
        Validate = 4,
        Count = 5,
        Spread = 6,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        u32 min_args{0};   // positional arguments after the command name
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs. NotFound for an unknown command,
    // Invalid for an option in command position or too few arguments.
    [[nodiscard]] anamnesis::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace anamnesis::cli
