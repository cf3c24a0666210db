#include "tether/agent.hpp"
#include "tether/agent_abi.h"
#include <cstdlib>
#include <dlfcn.h>
#include <format>

namespace tether
{

    std::string agent_source_to_string(AgentSource source)
    {
        switch (source)
        {
        case AgentSource::InstalledModule:
            return "installed";
        case AgentSource::ModulePath:
            return "path";
        case AgentSource::Stub:
            return "stub";
        }
        return "stub";
    }

    Result<std::shared_ptr<SharedModule>> SharedModule::open(const std::filesystem::path &path)
    {
        // dlerror() state is per thread; clear anything left from an earlier call
        ::dlerror();
        void *handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (!handle)
        {
            const char *err = ::dlerror();
            return std::unexpected(TetherError::resolution(std::format(
                "dlopen {} failed: {}", path.string(), err ? err : "unknown error")));
        }
        return std::shared_ptr<SharedModule>(new SharedModule(handle, path));
    }

    SharedModule::~SharedModule()
    {
        if (handle_)
            ::dlclose(handle_);
    }

    Result<void *> SharedModule::symbol(const std::string &name) const
    {
        ::dlerror();
        void *sym = ::dlsym(handle_, name.c_str());
        if (const char *err = ::dlerror(); err || !sym)
        {
            return std::unexpected(TetherError::resolution(std::format(
                "{} does not export {}: {}", path_.string(), name, err ? err : "null symbol")));
        }
        return sym;
    }

    AgentFunction wrap_module_entry(const std::string &capability, std::shared_ptr<SharedModule> module, void *entry)
    {
        auto fn = reinterpret_cast<tether_agent_entry_fn>(entry);
        return [capability, module = std::move(module), fn](const nlohmann::json &parameters) -> nlohmann::json
        {
            nlohmann::json doc{{"capability", capability}, {"parameters", parameters}};
            std::string input = doc.dump();

            char *raw = nullptr;
            int rc = fn(input.c_str(), &raw);
            std::unique_ptr<char, decltype(&std::free)> output(raw, &std::free);

            nlohmann::json parsed = nlohmann::json::object();
            if (output)
            {
                parsed = nlohmann::json::parse(output.get(), nullptr, false);
                if (parsed.is_discarded() && rc == 0)
                {
                    throw std::runtime_error(std::format(
                        "{} returned invalid JSON from {}", capability, module->path().string()));
                }
            }
            if (rc != 0)
            {
                if (parsed.is_discarded())
                    parsed = nlohmann::json::object();
                throw AgentFailure(std::format("{} reported failure code {}", capability, rc), parsed);
            }
            return parsed;
        };
    }

} // namespace tether
