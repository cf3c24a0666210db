#include "tether/process.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <iostream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace tether
{
    namespace
    {
        constexpr int kChildSetupFailure = 126;
        constexpr int kChildUncaught = 70;

        ExitInfo decode_status(int status)
        {
            ExitInfo info;
            if (WIFEXITED(status))
            {
                info.exited = true;
                info.code = WEXITSTATUS(status);
            }
            else if (WIFSIGNALED(status))
            {
                info.signal = WTERMSIG(status);
            }
            return info;
        }

        [[noreturn]] void child_main(const ChildEntry &entry, int out_fd, int err_fd)
        {
            // own process group so a timeout can take down anything the agent started
            ::setpgid(0, 0);

            int dev_null = ::open("/dev/null", O_RDONLY);
            if (dev_null >= 0)
            {
                ::dup2(dev_null, STDIN_FILENO);
                ::close(dev_null);
            }
            if (::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(err_fd, STDERR_FILENO) < 0)
                ::_exit(kChildSetupFailure);
            ::close(out_fd);
            ::close(err_fd);

            int rc = kChildUncaught;
            try
            {
                rc = entry(STDOUT_FILENO, STDERR_FILENO);
            }
            catch (const std::exception &e)
            {
                std::string msg = std::string("agent host: uncaught exception: ") + e.what() + "\n";
                write_all(STDERR_FILENO, msg);
            }
            catch (...)
            {
                write_all(STDERR_FILENO, "agent host: uncaught non-standard exception\n");
            }

            std::cout.flush();
            std::cerr.flush();
            std::fflush(nullptr);
            ::_exit(rc);
        }
    } // namespace

    Result<int> open_capture_file(const std::filesystem::path &path)
    {
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        if (fd < 0)
        {
            return std::unexpected(TetherError::io(std::format(
                "Unable to open capture file {}: {}", path.string(), std::strerror(errno))));
        }
        return fd;
    }

    bool write_all(int fd, std::string_view data)
    {
        while (!data.empty())
        {
            ssize_t n = ::write(fd, data.data(), data.size());
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
        return true;
    }

    Result<ChildProcess> ChildProcess::spawn(const ChildEntry &entry,
                                             const std::filesystem::path &stdout_path,
                                             const std::filesystem::path &stderr_path)
    {
        auto out_fd = open_capture_file(stdout_path);
        if (!out_fd)
            return std::unexpected(out_fd.error());
        auto err_fd = open_capture_file(stderr_path);
        if (!err_fd)
        {
            ::close(*out_fd);
            return std::unexpected(err_fd.error());
        }

        // nothing buffered in the parent may be flushed twice
        std::fflush(nullptr);

        pid_t pid = ::fork();
        if (pid < 0)
        {
            int err = errno;
            ::close(*out_fd);
            ::close(*err_fd);
            if (err == EAGAIN || err == ENOMEM || err == EPERM || err == ENOSYS)
            {
                return std::unexpected(TetherError::spawn_unavailable(std::format(
                    "fork failed: {}", std::strerror(err))));
            }
            return std::unexpected(TetherError::io(std::format("fork failed: {}", std::strerror(err))));
        }

        if (pid == 0)
            child_main(entry, *out_fd, *err_fd);

        // set from both sides so the group exists before either one acts on it
        ::setpgid(pid, pid);
        ::close(*out_fd);
        ::close(*err_fd);
        return ChildProcess(pid);
    }

    ChildProcess::ChildProcess(ChildProcess &&other) noexcept
        : pid_(other.pid_), reaped_(other.reaped_)
    {
        other.pid_ = -1;
        other.reaped_ = true;
    }

    ChildProcess::~ChildProcess()
    {
        if (pid_ > 0 && !reaped_)
            terminate();
    }

    std::optional<ExitInfo> ChildProcess::wait_until(std::chrono::steady_clock::time_point deadline,
                                                     std::chrono::milliseconds poll_interval)
    {
        while (true)
        {
            int status = 0;
            pid_t r = ::waitpid(pid_, &status, WNOHANG);
            if (r == pid_)
            {
                reaped_ = true;
                return decode_status(status);
            }
            if (r < 0 && errno != EINTR)
            {
                // ECHILD: already reaped elsewhere; nothing left to own
                reaped_ = true;
                return ExitInfo{};
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                return std::nullopt;
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(poll_interval, remaining + std::chrono::milliseconds(1)));
        }
    }

    ExitInfo ChildProcess::terminate()
    {
        if (pid_ <= 0 || reaped_)
            return ExitInfo{};

        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);

        int status = 0;
        pid_t r = -1;
        do
        {
            r = ::waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        reaped_ = true;

        if (r != pid_)
            return ExitInfo{false, -1, SIGKILL};
        return decode_status(status);
    }

} // namespace tether
