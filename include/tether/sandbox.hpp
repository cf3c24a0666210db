#pragma once

#include "agent.hpp"
#include "audit.hpp"
#include "config.hpp"
#include "process.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace tether
{

    enum class ExitStatus
    {
        Success,
        Timeout,
        Crash,
        MalformedOutput
    };

    std::string exit_status_to_string(ExitStatus status);

    enum class IsolationMode
    {
        Process,
        InProcess // reduced isolation: process creation was unavailable
    };

    std::string isolation_to_string(IsolationMode mode);

    struct SandboxInvocation
    {
        std::string capability;
        nlohmann::json input = nlohmann::json::object(); // capability parameters
        double timeout_seconds{0.0};
        std::filesystem::path input_path;
        std::filesystem::path stdout_path;
        std::filesystem::path stderr_path;
    };

    struct SandboxResult
    {
        ExitStatus exit_status{ExitStatus::Crash};
        std::optional<nlohmann::json> parsed_output;
        std::filesystem::path stdout_path;
        std::filesystem::path stderr_path;
        double elapsed_seconds{0.0};
        std::optional<int> exit_code;
        std::optional<int> signal;
        IsolationMode isolation{IsolationMode::Process};
        bool handled_failure{false};
        std::string error; // diagnostic for non-success outcomes

        bool ok() const { return exit_status == ExitStatus::Success; }
    };

    /** Starts the child for a run; ChildProcess::spawn unless a test swaps it */
    using Spawner = std::function<Result<ChildProcess>(const ChildEntry &entry,
                                                       const std::filesystem::path &stdout_path,
                                                       const std::filesystem::path &stderr_path)>;

    /**
     * Runs one agent call in a child process under a wall-clock deadline.
     *
     * The child gets its parameters through an input file and must print
     * exactly one JSON document to stdout; stdout and stderr are captured to
     * files, never to memory. On expiry the child's process group is killed.
     * Every run() appends exactly one agent_subprocess event, whatever the
     * outcome. run() never throws; failures come back as a SandboxResult.
     */
    class SandboxRunner
    {
    public:
        SandboxRunner(SandboxConfig cfg, AuditSink &audit, std::string actor, Spawner spawner = {});

        /**
         * Name the transport and capture files for a call:
         * <run_dir>/<capability>_<utc timestamp>{.input.json,.stdout.log,.stderr.log}
         */
        Result<SandboxInvocation> prepare(const std::string &capability,
                                          nlohmann::json input,
                                          std::optional<double> timeout_seconds = std::nullopt) const;

        SandboxResult run(const ResolvedAgent &agent, const SandboxInvocation &invocation);

    private:
        SandboxResult run_forked(const ResolvedAgent &agent, const SandboxInvocation &invocation, bool &spawn_unavailable);
        SandboxResult run_in_process(const ResolvedAgent &agent, const SandboxInvocation &invocation);
        void classify(SandboxResult &result) const;
        void record(const ResolvedAgent &agent, const SandboxInvocation &invocation,
                    const SandboxResult &result, const std::string &fallback_reason);

        SandboxConfig cfg_;
        AuditSink &audit_;
        std::string actor_;
        Spawner spawner_;
    };

    /**
     * Child-side protocol: read the invocation document, call the agent,
     * print its JSON result. Returns the exit code (0 ok, 1 crash, 2 handled).
     */
    int run_agent_entry(const AgentFunction &function,
                        const std::filesystem::path &input_path,
                        int out_fd, int err_fd);

} // namespace tether
