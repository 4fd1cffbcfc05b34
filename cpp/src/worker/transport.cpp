#include "anamnesis/worker/transport.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "anamnesis/core/log.hpp"

namespace anamnesis::worker {
    namespace {
        Status io_error(int err) noexcept {
            return core::make_status(core::StatusDomain::Net, core::StatusCode::Io, static_cast<u32>(err));
        }

        void close_fd(int* fd) noexcept {
            if (*fd >= 0) {
                (void)::close(*fd);
                *fd = -1;
            }
        }

        // Child side of the fork: moves fd onto target with FD_CLOEXEC clear.
        // dup2 onto itself is a no-op, so that case clears the flag directly.
        void redirect_fd(int fd, int target) noexcept {
            if (fd == target) {
                (void)::fcntl(fd, F_SETFD, 0);
            } else {
                (void)::dup2(fd, target);
            }
        }

        // A dead worker must surface as a write error, not kill the parent.
        void ignore_sigpipe() {
            static std::once_flag once;
            std::call_once(once, [] { (void)std::signal(SIGPIPE, SIG_IGN); });
        }
    } // namespace

    Status fd_read_exact(int fd, u8* buf, u32 len) noexcept {
        u32 total = 0;
        while (total < len) {
            const ssize_t n = ::read(fd, buf + total, len - total);
            if (n == 0) {
                return core::make_status(core::StatusDomain::Net, core::StatusCode::Closed, total);
            }
            if (n < 0) {
                if (errno == EINTR) continue;
                return io_error(errno);
            }
            total += static_cast<u32>(n);
        }
        return core::ok_status();
    }

    Status fd_write_all(int fd, const u8* buf, u32 len) noexcept {
        u32 total = 0;
        while (total < len) {
            const ssize_t n = ::write(fd, buf + total, len - total);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EPIPE) {
                    return core::make_status(core::StatusDomain::Net, core::StatusCode::Closed);
                }
                return io_error(errno);
            }
            total += static_cast<u32>(n);
        }
        return core::ok_status();
    }

    FdTransport::FdTransport(int read_fd, int write_fd, pid_t child) noexcept
        : read_fd_(read_fd), write_fd_(write_fd), child_(child) {
        struct stat st{};
        socket_ = read_fd_ >= 0 && ::fstat(read_fd_, &st) == 0 && S_ISSOCK(st.st_mode);
    }

    FdTransport::~FdTransport() {
        if (write_fd_ == read_fd_) {
            write_fd_ = -1;
        }
        close_fd(&write_fd_);
        close_fd(&read_fd_);

        if (child_ > 0) {
            (void)::kill(child_, SIGTERM);

            int status = 0;
            for (int attempt = 0; attempt < 10; ++attempt) {
                if (::waitpid(child_, &status, WNOHANG) != 0) {
                    child_ = -1;
                    return;
                }
                ::usleep(20000);
            }
            (void)::kill(child_, SIGKILL);
            (void)::waitpid(child_, &status, 0);
            child_ = -1;
        }
    }

    Status FdTransport::read_exact(u8* buf, u32 len) {
        return fd_read_exact(read_fd_, buf, len);
    }

    Status FdTransport::write_all(const u8* buf, u32 len) {
        return fd_write_all(write_fd_, buf, len);
    }

    void FdTransport::shutdown() noexcept {
        if (socket_) {
            (void)::shutdown(read_fd_, SHUT_RDWR);
        }
        if (child_ > 0) {
            (void)::kill(child_, SIGTERM);
        }
    }

    Status spawn_worker_process(const std::string& path, const std::vector<std::string>& args,
                                std::unique_ptr<Transport>* out) {
        if (out == nullptr || path.empty()) {
            return core::make_status(core::StatusDomain::Worker, core::StatusCode::Invalid);
        }
        ignore_sigpipe();

        int stdin_pipe[2];
        int stdout_pipe[2];
        int exec_pipe[2];
        // Every pipe is close-on-exec so a worker spawned later never inherits
        // another worker's ends; the child's dup2 onto 0 and 1 clears the flag.
        if (::pipe2(stdin_pipe, O_CLOEXEC) < 0) {
            return io_error(errno);
        }
        if (::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
            const int err = errno;
            (void)::close(stdin_pipe[0]);
            (void)::close(stdin_pipe[1]);
            return io_error(err);
        }
        // Reports exec failure; closed by a successful exec.
        if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
            const int err = errno;
            for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1]}) {
                (void)::close(fd);
            }
            return io_error(err);
        }

        std::vector<const char*> argv;
        argv.push_back(path.c_str());
        for (const std::string& a : args) {
            argv.push_back(a.c_str());
        }
        argv.push_back(nullptr);

        const pid_t pid = ::fork();
        if (pid < 0) {
            const int err = errno;
            for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1], exec_pipe[0], exec_pipe[1]}) {
                (void)::close(fd);
            }
            return io_error(err);
        }

        if (pid == 0) {
            redirect_fd(stdin_pipe[0], STDIN_FILENO);
            redirect_fd(stdout_pipe[1], STDOUT_FILENO);
            (void)::signal(SIGPIPE, SIG_DFL);

            ::execvp(path.c_str(), const_cast<char* const*>(argv.data()));

            const int err = errno;
            (void)!::write(exec_pipe[1], &err, sizeof(err));
            ::_exit(127);
        }

        (void)::close(stdin_pipe[0]);
        (void)::close(stdout_pipe[1]);
        (void)::close(exec_pipe[1]);

        int child_err = 0;
        ssize_t n = 0;
        do {
            n = ::read(exec_pipe[0], &child_err, sizeof(child_err));
        } while (n < 0 && errno == EINTR);
        (void)::close(exec_pipe[0]);

        auto transport = std::make_unique<FdTransport>(stdout_pipe[0], stdin_pipe[1], pid);
        if (n == static_cast<ssize_t>(sizeof(child_err))) {
            core::log_error("worker", "cannot execute %s: %s", path.c_str(), std::strerror(child_err));
            return core::make_status(core::StatusDomain::Worker, core::StatusCode::NotFound,
                                     static_cast<u32>(child_err));
        }

        core::log_debug("worker", "spawned %s pid=%d", path.c_str(), static_cast<int>(pid));
        *out = std::move(transport);
        return core::ok_status();
    }
} // namespace anamnesis::worker
