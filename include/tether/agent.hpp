#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tether
{
    namespace capability
    {
        constexpr std::string_view kRunReport = "run_report";
        constexpr std::string_view kProposeTransforms = "propose_transforms";
        constexpr std::string_view kApplyTransforms = "apply_transforms";

        constexpr std::array<std::string_view, 3> kAll = {kRunReport, kProposeTransforms, kApplyTransforms};
    }

    /**
     * An agent implementation: takes the capability parameters and returns one
     * JSON document. Throwing AgentFailure reports a handled failure; any other
     * exception is treated as a crash.
     */
    using AgentFunction = std::function<nlohmann::json(const nlohmann::json &parameters)>;

    class AgentFailure : public std::runtime_error
    {
    public:
        explicit AgentFailure(const std::string &message, nlohmann::json payload = nlohmann::json::object())
            : std::runtime_error(message), payload_(std::move(payload)) {}

        const nlohmann::json &payload() const { return payload_; }

    private:
        nlohmann::json payload_;
    };

    enum class AgentSource
    {
        InstalledModule,
        ModulePath,
        Stub
    };

    std::string agent_source_to_string(AgentSource source);

    /**
     * dlopen()ed agent module. The handle is closed when the last
     * ResolvedAgent referencing it goes away.
     */
    class SharedModule
    {
    public:
        static Result<std::shared_ptr<SharedModule>> open(const std::filesystem::path &path);
        ~SharedModule();

        SharedModule(const SharedModule &) = delete;
        SharedModule &operator=(const SharedModule &) = delete;

        Result<void *> symbol(const std::string &name) const;
        const std::filesystem::path &path() const { return path_; }

    private:
        SharedModule(void *handle, std::filesystem::path path) : handle_(handle), path_(std::move(path)) {}

        void *handle_;
        std::filesystem::path path_;
    };

    struct ResolvedAgent
    {
        std::string capability;
        AgentSource source{AgentSource::Stub};
        std::string origin; // module path, or "builtin"
        AgentFunction function;
        std::shared_ptr<SharedModule> module;
    };

    /** Wrap a module entry point exporting the tether_agent_<capability> C ABI */
    AgentFunction wrap_module_entry(const std::string &capability, std::shared_ptr<SharedModule> module, void *entry);

} // namespace tether
