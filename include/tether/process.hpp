#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <sys/types.h>

namespace tether
{

    struct ExitInfo
    {
        bool exited{false}; // true: exit(code); false: killed by signal
        int code{-1};
        int signal{0};
    };

    /**
     * Body run inside the child. Receives the descriptors its output must go
     * to and returns the process exit code.
     */
    using ChildEntry = std::function<int(int out_fd, int err_fd)>;

    /**
     * A forked child in its own process group with stdout and stderr
     * redirected to files. Owns the child: the destructor kills and reaps it
     * if nobody waited for it.
     */
    class ChildProcess
    {
    public:
        /**
         * Fork and run entry in the child. Fails with SpawnUnavailable when the
         * environment refuses process creation (EAGAIN, ENOMEM, EPERM, ENOSYS).
         */
        static Result<ChildProcess> spawn(const ChildEntry &entry,
                                          const std::filesystem::path &stdout_path,
                                          const std::filesystem::path &stderr_path);

        ChildProcess(ChildProcess &&other) noexcept;
        ChildProcess &operator=(ChildProcess &&) = delete;
        ChildProcess(const ChildProcess &) = delete;
        ChildProcess &operator=(const ChildProcess &) = delete;
        ~ChildProcess();

        pid_t pid() const { return pid_; }

        /** Block until the child exits or the deadline passes (nullopt) */
        std::optional<ExitInfo> wait_until(std::chrono::steady_clock::time_point deadline,
                                           std::chrono::milliseconds poll_interval);

        /** SIGKILL the whole process group and reap the child */
        ExitInfo terminate();

    private:
        explicit ChildProcess(pid_t pid) : pid_(pid) {}

        pid_t pid_{-1};
        bool reaped_{false};
    };

    /** Open (create/truncate) a capture file, close-on-exec */
    Result<int> open_capture_file(const std::filesystem::path &path);

    /** write(2) until everything is written or an error occurs */
    bool write_all(int fd, std::string_view data);

} // namespace tether
