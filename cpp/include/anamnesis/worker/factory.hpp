#pragma once

#include <string>

#include "anamnesis/core/config.hpp"
#include "anamnesis/worker/pool.hpp"
#include "anamnesis/worker/server.hpp"

namespace anamnesis::worker {

    // Factory spawning `worker_path --kind <kind> --max-frame <n>` per channel.
    [[nodiscard]] ChannelFactory worker_process_factory(std::string worker_path, WorkerKind kind,
                                                        u32 max_frame_bytes = core::kDefaultMaxFrameBytes);

} // namespace anamnesis::worker
