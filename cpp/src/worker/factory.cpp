#include "anamnesis/worker/factory.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace anamnesis::worker {

    ChannelFactory worker_process_factory(std::string worker_path, WorkerKind kind, u32 max_frame_bytes) {
        return [path = std::move(worker_path), kind, max_frame_bytes](WorkerChannel::ClosedCallback on_closed,
                                                                     std::unique_ptr<WorkerChannel>* out) -> Status {
            const std::vector<std::string> args = {"--kind", worker_kind_name(kind), "--max-frame",
                                                   std::to_string(max_frame_bytes)};
            std::unique_ptr<Transport> transport;
            const Status st = spawn_worker_process(path, args, &transport);
            if (!core::is_ok(st)) {
                return st;
            }
            ChannelConfig cfg;
            cfg.name = worker_kind_name(kind);
            cfg.max_frame_bytes = max_frame_bytes;
            *out = std::make_unique<WorkerChannel>(std::move(transport), std::move(cfg), std::move(on_closed));
            return core::ok_status();
        };
    }

} // namespace anamnesis::worker
