#pragma once

#include "agent.hpp"
#include "audit.hpp"
#include "config.hpp"
#include "types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tether
{

    /**
     * One step of the resolution chain. Providers are tried in order; a
     * provider that cannot supply a capability returns an error, which the
     * resolver records and moves past.
     */
    class AgentProvider
    {
    public:
        virtual ~AgentProvider() = default;

        virtual AgentSource source() const = 0;

        virtual Result<ResolvedAgent> find(const std::string &capability) = 0;
    };

    /**
     * Installed agent modules: libtether_agent_<capability>.so in the
     * configured search directories, then on the system loader path.
     */
    class InstalledModuleProvider : public AgentProvider
    {
    public:
        explicit InstalledModuleProvider(std::vector<std::string> search_paths);

        AgentSource source() const override { return AgentSource::InstalledModule; }
        Result<ResolvedAgent> find(const std::string &capability) override;

    private:
        std::vector<std::string> search_paths_;
    };

    /** Agent modules named by explicit file path, per capability (local and dev agents). */
    class ModulePathProvider : public AgentProvider
    {
    public:
        explicit ModulePathProvider(std::map<std::string, std::string> module_paths);

        AgentSource source() const override { return AgentSource::ModulePath; }
        Result<ResolvedAgent> find(const std::string &capability) override;

    private:
        std::map<std::string, std::string> module_paths_;
    };

    /**
     * Built-in placeholder agents. Each returns an empty but well-formed
     * result tagged "stub": true.
     */
    class BuiltinStubProvider : public AgentProvider
    {
    public:
        BuiltinStubProvider();

        AgentSource source() const override { return AgentSource::Stub; }
        Result<ResolvedAgent> find(const std::string &capability) override;

    private:
        std::map<std::string, AgentFunction, std::less<>> stubs_;
    };

    using ProviderList = std::vector<std::unique_ptr<AgentProvider>>;
    using ProviderFactory = std::function<ProviderList()>;

    /** installed -> explicit path -> stub */
    ProviderList default_providers(const AgentsConfig &cfg);

    /**
     * Walks the provider chain for a capability. Falling through to the stub
     * is audited; running out of providers is a ResolutionFailure, audited
     * before it is returned.
     */
    class AgentResolver
    {
    public:
        AgentResolver(ProviderList providers, AuditSink &audit, std::string actor);

        Result<ResolvedAgent> resolve(const std::string &capability);

    private:
        ProviderList providers_;
        AuditSink &audit_;
        std::string actor_;
    };

} // namespace tether
