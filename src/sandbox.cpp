#include "tether/sandbox.hpp"
#include "tether/clock.hpp"
#include "tether/process.hpp"
#include <cerrno>
#include <cmath>
#include <condition_variable>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace tether
{
    namespace
    {
        constexpr int kExitOk = 0;
        constexpr int kExitCrash = 1;
        constexpr int kExitHandled = 2;

        std::string file_safe(const std::string &name)
        {
            std::string out = name;
            for (auto &c : out)
            {
                bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
                if (!ok)
                    c = '_';
            }
            return out;
        }

        std::filesystem::path with_suffix(const std::filesystem::path &stem, const char *suffix)
        {
            return std::filesystem::path(stem.string() + suffix);
        }

        bool valid_timeout(double seconds)
        {
            return seconds > 0.0 && std::isfinite(seconds);
        }

        // saturates at time_point::max() for timeouts the clock cannot represent
        std::chrono::steady_clock::time_point deadline_after(std::chrono::steady_clock::time_point start, double seconds)
        {
            using std::chrono::steady_clock;
            const std::chrono::duration<double> headroom = steady_clock::time_point::max() - start;
            if (seconds >= headroom.count())
                return steady_clock::time_point::max();
            return start + std::chrono::duration_cast<steady_clock::duration>(std::chrono::duration<double>(seconds));
        }

        Result<void> write_transport(const SandboxInvocation &invocation)
        {
            nlohmann::json doc{{"capability", invocation.capability}, {"parameters", invocation.input}};
            std::ofstream out(invocation.input_path, std::ios::trunc);
            if (!out.is_open())
                return std::unexpected(TetherError::io("Unable to write agent input " + invocation.input_path.string()));
            out << doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
            out.flush();
            if (!out)
                return std::unexpected(TetherError::io("Write failed for agent input " + invocation.input_path.string()));
            return {};
        }

        // State shared with an in-process worker that may outlive the call
        struct InProcessRun
        {
            std::mutex mutex;
            std::condition_variable cv;
            bool done{false};
            int code{kExitCrash};
            int out_fd{-1};
            int err_fd{-1};

            ~InProcessRun()
            {
                if (out_fd >= 0)
                    ::close(out_fd);
                if (err_fd >= 0)
                    ::close(err_fd);
            }
        };
    } // namespace

    std::string exit_status_to_string(ExitStatus status)
    {
        switch (status)
        {
        case ExitStatus::Success:
            return "success";
        case ExitStatus::Timeout:
            return "timeout";
        case ExitStatus::Crash:
            return "crash";
        case ExitStatus::MalformedOutput:
            return "malformed_output";
        }
        return "crash";
    }

    std::string isolation_to_string(IsolationMode mode)
    {
        return mode == IsolationMode::Process ? "process" : "in_process";
    }

    int run_agent_entry(const AgentFunction &function,
                        const std::filesystem::path &input_path,
                        int out_fd, int err_fd)
    {
        std::ifstream in(input_path);
        if (!in.is_open())
        {
            write_all(err_fd, "agent host: cannot open input " + input_path.string() + "\n");
            return kExitCrash;
        }
        nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
        if (doc.is_discarded() || !doc.is_object())
        {
            write_all(err_fd, "agent host: input is not a JSON object\n");
            return kExitCrash;
        }
        nlohmann::json params = doc.contains("parameters") ? doc["parameters"] : nlohmann::json::object();

        try
        {
            std::string text = function(params).dump();
            text.push_back('\n');
            return write_all(out_fd, text) ? kExitOk : kExitCrash;
        }
        catch (const AgentFailure &e)
        {
            nlohmann::json payload = e.payload().is_object() ? e.payload() : nlohmann::json::object();
            payload["handled_failure"] = true;
            payload["error"] = e.what();
            write_all(out_fd, payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n");
            write_all(err_fd, std::format("agent reported failure: {}\n", e.what()));
            return kExitHandled;
        }
        catch (const std::exception &e)
        {
            write_all(err_fd, std::format("agent crashed: {}\n", e.what()));
            return kExitCrash;
        }
        catch (...)
        {
            write_all(err_fd, "agent crashed: non-standard exception\n");
            return kExitCrash;
        }
    }

    SandboxRunner::SandboxRunner(SandboxConfig cfg, AuditSink &audit, std::string actor, Spawner spawner)
        : cfg_(std::move(cfg)), audit_(audit), actor_(std::move(actor)), spawner_(std::move(spawner))
    {
        if (!spawner_)
            spawner_ = &ChildProcess::spawn;
    }

    Result<SandboxInvocation> SandboxRunner::prepare(const std::string &capability,
                                                     nlohmann::json input,
                                                     std::optional<double> timeout_seconds) const
    {
        SandboxInvocation inv;
        inv.capability = capability;
        inv.input = std::move(input);
        inv.timeout_seconds = timeout_seconds.value_or(cfg_.timeout_seconds);

        if (capability.empty())
            return std::unexpected(TetherError::invalid_input("capability name must not be empty"));
        if (!valid_timeout(inv.timeout_seconds))
            return std::unexpected(TetherError::invalid_input(std::format(
                "timeout_seconds must be a finite number > 0, got {}", inv.timeout_seconds)));

        std::filesystem::path run_dir(cfg_.run_dir);
        std::error_code ec;
        std::filesystem::create_directories(run_dir, ec);
        if (ec)
            return std::unexpected(TetherError::io(std::format(
                "Unable to create run directory {}: {}", run_dir.string(), ec.message())));

        // reserve the name by creating the transport file exclusively
        const std::string base = file_safe(capability) + "_" + compact_utc_timestamp();
        for (int attempt = 0; attempt < 1000; ++attempt)
        {
            std::string name = attempt == 0 ? base : std::format("{}-{}", base, attempt);
            std::filesystem::path stem = run_dir / name;
            auto input_path = with_suffix(stem, ".input.json");
            int fd = ::open(input_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
            if (fd < 0)
            {
                if (errno == EEXIST)
                    continue;
                return std::unexpected(TetherError::io(std::format(
                    "Unable to create {}: {}", input_path.string(), std::strerror(errno))));
            }
            ::close(fd);
            inv.input_path = input_path;
            inv.stdout_path = with_suffix(stem, ".stdout.log");
            inv.stderr_path = with_suffix(stem, ".stderr.log");
            return inv;
        }
        return std::unexpected(TetherError::io("Unable to allocate a unique run file name for " + capability));
    }

    SandboxResult SandboxRunner::run(const ResolvedAgent &agent, const SandboxInvocation &invocation)
    {
        SandboxResult result;
        result.stdout_path = invocation.stdout_path;
        result.stderr_path = invocation.stderr_path;
        std::string fallback_reason;

        if (!valid_timeout(invocation.timeout_seconds))
        {
            result.error = "timeout_seconds must be a finite number > 0";
        }
        else if (!agent.function)
        {
            result.error = "resolved agent has no callable";
        }
        else if (auto written = write_transport(invocation); !written)
        {
            result.error = written.error().what();
        }
        else if (cfg_.force_in_process)
        {
            fallback_reason = "in-process execution forced by configuration";
            result = run_in_process(agent, invocation);
        }
        else
        {
            bool spawn_unavailable = false;
            result = run_forked(agent, invocation, spawn_unavailable);
            if (spawn_unavailable)
            {
                fallback_reason = result.error;
                spdlog::warn("process creation unavailable ({}); running {} in-process with reduced isolation",
                             fallback_reason, invocation.capability);
                result = run_in_process(agent, invocation);
            }
        }

        record(agent, invocation, result, fallback_reason);
        return result;
    }

    SandboxResult SandboxRunner::run_forked(const ResolvedAgent &agent,
                                            const SandboxInvocation &invocation,
                                            bool &spawn_unavailable)
    {
        SandboxResult result;
        result.stdout_path = invocation.stdout_path;
        result.stderr_path = invocation.stderr_path;
        result.isolation = IsolationMode::Process;

        const auto start = std::chrono::steady_clock::now();
        const auto deadline = deadline_after(start, invocation.timeout_seconds);
        const AgentFunction &function = agent.function;
        const std::filesystem::path &input_path = invocation.input_path;

        auto child = spawner_(
            [&function, &input_path](int out_fd, int err_fd)
            { return run_agent_entry(function, input_path, out_fd, err_fd); },
            invocation.stdout_path, invocation.stderr_path);
        if (!child)
        {
            spawn_unavailable = child.error().code == ErrorCode::SpawnUnavailable;
            result.error = child.error().what();
            result.elapsed_seconds = seconds_since(start);
            return result;
        }

        auto exit = child->wait_until(deadline, std::chrono::milliseconds(cfg_.poll_interval_ms));
        if (!exit)
        {
            auto killed = child->terminate();
            result.elapsed_seconds = seconds_since(start);
            result.exit_status = ExitStatus::Timeout;
            if (killed.signal != 0)
                result.signal = killed.signal;
            result.error = std::format("deadline of {}s exceeded; process group killed", invocation.timeout_seconds);
            return result;
        }

        result.elapsed_seconds = seconds_since(start);
        if (exit->exited)
            result.exit_code = exit->code;
        else
            result.signal = exit->signal;
        classify(result);
        return result;
    }

    SandboxResult SandboxRunner::run_in_process(const ResolvedAgent &agent, const SandboxInvocation &invocation)
    {
        SandboxResult result;
        result.stdout_path = invocation.stdout_path;
        result.stderr_path = invocation.stderr_path;
        result.isolation = IsolationMode::InProcess;

        const auto start = std::chrono::steady_clock::now();
        const auto deadline = deadline_after(start, invocation.timeout_seconds);

        auto state = std::make_shared<InProcessRun>();
        auto out_fd = open_capture_file(invocation.stdout_path);
        if (!out_fd)
        {
            result.error = out_fd.error().what();
            return result;
        }
        state->out_fd = *out_fd;
        auto err_fd = open_capture_file(invocation.stderr_path);
        if (!err_fd)
        {
            result.error = err_fd.error().what();
            return result;
        }
        state->err_fd = *err_fd;

        std::thread worker([state, function = agent.function, input_path = invocation.input_path]()
                           {
                               int rc = kExitCrash;
                               try
                               {
                                   rc = run_agent_entry(function, input_path, state->out_fd, state->err_fd);
                               }
                               catch (const std::exception &e)
                               {
                                   write_all(state->err_fd, std::format("agent host: uncaught exception: {}\n", e.what()));
                               }
                               catch (...)
                               {
                                   write_all(state->err_fd, "agent host: uncaught non-standard exception\n");
                               }
                               {
                                   std::lock_guard lock(state->mutex);
                                   state->done = true;
                                   state->code = rc;
                               }
                               state->cv.notify_all(); });
        // a thread cannot be killed; on timeout it is abandoned and keeps its own reference to the state
        worker.detach();

        std::unique_lock lock(state->mutex);
        bool finished = true;
        if (deadline == std::chrono::steady_clock::time_point::max())
            state->cv.wait(lock, [&state]
                           { return state->done; });
        else
            finished = state->cv.wait_until(lock, deadline, [&state]
                                            { return state->done; });
        result.elapsed_seconds = seconds_since(start);
        if (!finished)
        {
            result.exit_status = ExitStatus::Timeout;
            result.error = std::format("deadline of {}s exceeded; in-process agent abandoned (best effort)",
                                       invocation.timeout_seconds);
            return result;
        }
        result.exit_code = state->code;
        lock.unlock();

        classify(result);
        return result;
    }

    void SandboxRunner::classify(SandboxResult &result) const
    {
        if (result.signal)
        {
            result.exit_status = ExitStatus::Crash;
            result.error = std::format("agent terminated by signal {}", *result.signal);
            return;
        }

        const int code = result.exit_code.value_or(kExitCrash);
        std::error_code ec;
        auto size = std::filesystem::file_size(result.stdout_path, ec);
        if (ec)
        {
            result.exit_status = code == kExitOk ? ExitStatus::MalformedOutput : ExitStatus::Crash;
            result.error = std::format("unable to read captured stdout: {}", ec.message());
            return;
        }
        if (size > cfg_.max_output_bytes)
        {
            result.exit_status = code == kExitOk ? ExitStatus::MalformedOutput : ExitStatus::Crash;
            result.error = std::format("stdout is {} bytes, limit is {}", size, cfg_.max_output_bytes);
            return;
        }

        std::ifstream in(result.stdout_path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        nlohmann::json parsed = nlohmann::json::parse(buffer.str(), nullptr, false);

        if (code == kExitOk)
        {
            if (parsed.is_discarded())
            {
                result.exit_status = ExitStatus::MalformedOutput;
                result.error = "stdout is not exactly one JSON document";
                return;
            }
            result.exit_status = ExitStatus::Success;
            result.parsed_output = std::move(parsed);
            return;
        }

        result.exit_status = ExitStatus::Crash;
        result.error = std::format("agent exited with code {}", code);
        if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("handled_failure") &&
            parsed["handled_failure"] == true)
        {
            result.handled_failure = true;
            if (parsed.contains("error") && parsed["error"].is_string())
                result.error = parsed["error"].get<std::string>();
            result.parsed_output = std::move(parsed);
        }
    }

    void SandboxRunner::record(const ResolvedAgent &agent, const SandboxInvocation &invocation,
                               const SandboxResult &result, const std::string &fallback_reason)
    {
        auto event = AuditEvent::make(EventType::AgentSubprocess, actor_, "run_agent");
        event.duration_seconds = result.elapsed_seconds;
        event.success = result.ok();
        event.details = {{"capability", invocation.capability},
                         {"source", agent_source_to_string(agent.source)},
                         {"origin", agent.origin},
                         {"exit_status", exit_status_to_string(result.exit_status)},
                         {"timeout_seconds", invocation.timeout_seconds},
                         {"input_path", invocation.input_path.string()},
                         {"stdout_path", result.stdout_path.string()},
                         {"stderr_path", result.stderr_path.string()},
                         {"isolation", isolation_to_string(result.isolation)},
                         {"reduced_isolation", result.isolation == IsolationMode::InProcess}};
        if (result.exit_code)
            event.details["exit_code"] = *result.exit_code;
        if (result.signal)
            event.details["signal"] = *result.signal;
        if (result.handled_failure)
            event.details["handled_failure"] = true;
        if (!result.error.empty())
            event.details["error"] = result.error;
        if (!fallback_reason.empty())
            event.details["fallback_reason"] = fallback_reason;
        append_or_warn(audit_, event);

        if (result.ok())
            spdlog::info("{} finished in {:.3f}s", invocation.capability, result.elapsed_seconds);
        else
            spdlog::warn("{} {}: {} (stderr: {})", invocation.capability,
                         exit_status_to_string(result.exit_status), result.error, result.stderr_path.string());
    }

} // namespace tether
