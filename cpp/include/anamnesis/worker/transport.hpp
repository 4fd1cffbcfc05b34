#pragma once

#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/types.hpp"

namespace anamnesis::worker {
    using anamnesis::core::Status;
    using anamnesis::core::u32;
    using anamnesis::core::u8;

    // Byte stream to one worker. read_exact and write_all may be called
    // concurrently from one reader and one writer thread.
    class Transport {
    public:
        virtual ~Transport() = default;

        // Closed on end of stream (including mid-read), Io on error.
        [[nodiscard]] virtual Status read_exact(u8* buf, u32 len) = 0;
        [[nodiscard]] virtual Status write_all(const u8* buf, u32 len) = 0;

        // Makes a blocked read_exact return; safe to call more than once.
        virtual void shutdown() noexcept = 0;
    };

    // Blocking fd helpers shared by FdTransport and the worker serve loop.
    [[nodiscard]] Status fd_read_exact(int fd, u8* buf, u32 len) noexcept;
    [[nodiscard]] Status fd_write_all(int fd, const u8* buf, u32 len) noexcept;

    // Owns its fds (read_fd may equal write_fd for a socket) and, when
    // child > 0, the worker process, which is terminated and reaped on
    // destruction. shutdown() shuts a socket down or signals the child.
    class FdTransport final : public Transport {
    public:
        FdTransport(int read_fd, int write_fd, pid_t child = -1) noexcept;
        ~FdTransport() override;

        FdTransport(const FdTransport&) = delete;
        FdTransport& operator=(const FdTransport&) = delete;

        [[nodiscard]] Status read_exact(u8* buf, u32 len) override;
        [[nodiscard]] Status write_all(const u8* buf, u32 len) override;
        void shutdown() noexcept override;

        [[nodiscard]] pid_t child() const noexcept { return child_; }

    private:
        int read_fd_{-1};
        int write_fd_{-1};
        pid_t child_{-1};
        bool socket_{false};
    };

    // fork/exec path with args, the child's stdin and stdout connected to
    // the returned transport. NotFound when the executable cannot be run.
    [[nodiscard]] Status spawn_worker_process(const std::string& path, const std::vector<std::string>& args,
                                              std::unique_ptr<Transport>* out);

} // namespace anamnesis::worker
