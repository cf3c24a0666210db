#include "tether/agent_resolver.hpp"
#include "tether/agent_abi.h"
#include <filesystem>
#include <spdlog/spdlog.h>

namespace tether
{
    namespace
    {
        Result<ResolvedAgent> load_module(const std::string &capability,
                                          const std::filesystem::path &path,
                                          AgentSource source)
        {
            auto module = SharedModule::open(path);
            if (!module)
                return std::unexpected(module.error());

            auto entry = (*module)->symbol(TETHER_AGENT_SYMBOL_PREFIX + capability);
            if (!entry)
                return std::unexpected(entry.error());

            ResolvedAgent agent;
            agent.capability = capability;
            agent.source = source;
            agent.origin = path.string();
            agent.function = wrap_module_entry(capability, *module, *entry);
            agent.module = *module;
            return agent;
        }

        nlohmann::json stub_run_report(const nlohmann::json &params)
        {
            return {{"stub", true},
                    {"out_dir", params.value("out_dir", "")},
                    {"summary_path", nullptr}};
        }

        nlohmann::json stub_propose_transforms(const nlohmann::json & /*params*/)
        {
            return {{"stub", true}, {"proposals", nlohmann::json::array()}};
        }

        nlohmann::json stub_apply_transforms(const nlohmann::json &params)
        {
            // identity transform: hand back the input table unchanged
            return {{"stub", true},
                    {"data_ref", params.value("data_ref", "")},
                    {"applied", nlohmann::json::array()},
                    {"count", 0}};
        }
    } // namespace

    InstalledModuleProvider::InstalledModuleProvider(std::vector<std::string> search_paths)
        : search_paths_(std::move(search_paths)) {}

    Result<ResolvedAgent> InstalledModuleProvider::find(const std::string &capability)
    {
        const std::string filename = TETHER_AGENT_LIBRARY_PREFIX + capability + ".so";
        for (const auto &dir : search_paths_)
        {
            std::filesystem::path candidate = std::filesystem::path(dir) / filename;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec))
                return load_module(capability, candidate, source());
        }
        // bare name: let the dynamic loader search LD_LIBRARY_PATH and the system paths
        return load_module(capability, filename, source());
    }

    ModulePathProvider::ModulePathProvider(std::map<std::string, std::string> module_paths)
        : module_paths_(std::move(module_paths)) {}

    Result<ResolvedAgent> ModulePathProvider::find(const std::string &capability)
    {
        auto it = module_paths_.find(capability);
        if (it == module_paths_.end())
            return std::unexpected(TetherError::resolution("no module path configured for " + capability));

        std::filesystem::path path(it->second);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            return std::unexpected(TetherError::resolution("module path does not exist: " + path.string()));
        return load_module(capability, path, source());
    }

    BuiltinStubProvider::BuiltinStubProvider()
    {
        stubs_.emplace(std::string(capability::kRunReport), stub_run_report);
        stubs_.emplace(std::string(capability::kProposeTransforms), stub_propose_transforms);
        stubs_.emplace(std::string(capability::kApplyTransforms), stub_apply_transforms);
    }

    Result<ResolvedAgent> BuiltinStubProvider::find(const std::string &capability)
    {
        auto it = stubs_.find(capability);
        if (it == stubs_.end())
            return std::unexpected(TetherError::resolution("no built-in stub for " + capability));

        ResolvedAgent agent;
        agent.capability = capability;
        agent.source = source();
        agent.origin = "builtin";
        agent.function = it->second;
        return agent;
    }

    ProviderList default_providers(const AgentsConfig &cfg)
    {
        ProviderList providers;
        providers.push_back(std::make_unique<InstalledModuleProvider>(cfg.search_paths));
        providers.push_back(std::make_unique<ModulePathProvider>(cfg.module_paths));
        providers.push_back(std::make_unique<BuiltinStubProvider>());
        return providers;
    }

    AgentResolver::AgentResolver(ProviderList providers, AuditSink &audit, std::string actor)
        : providers_(std::move(providers)), audit_(audit), actor_(std::move(actor)) {}

    Result<ResolvedAgent> AgentResolver::resolve(const std::string &capability)
    {
        nlohmann::json attempts = nlohmann::json::array();
        for (const auto &provider : providers_)
        {
            auto found = provider->find(capability);
            if (!found)
            {
                spdlog::debug("resolve {}: {} provider skipped: {}",
                              capability, agent_source_to_string(provider->source()), found.error().what());
                attempts.push_back({{"source", agent_source_to_string(provider->source())},
                                    {"error", found.error().what()}});
                continue;
            }

            if (found->source == AgentSource::Stub)
            {
                spdlog::warn("capability {} unresolved; using built-in stub", capability);
                auto event = AuditEvent::make(EventType::AgentSubprocess, actor_, "resolve_agent");
                event.details = {{"capability", capability},
                                 {"source", "stub"},
                                 {"attempts", attempts}};
                append_or_warn(audit_, event);
            }
            else
            {
                spdlog::info("capability {} resolved from {} ({})",
                             capability, agent_source_to_string(found->source), found->origin);
            }
            return found;
        }

        auto error = TetherError::resolution(std::format(
            "capability {} could not be resolved and has no built-in stub", capability));
        auto event = AuditEvent::make(EventType::Error, actor_, "resolve_agent");
        event.success = false;
        event.details = {{"capability", capability},
                         {"error", error.what()},
                         {"error_code", error_code_to_string(error.code)},
                         {"attempts", attempts}};
        append_or_warn(audit_, event);
        return std::unexpected(error);
    }

} // namespace tether
