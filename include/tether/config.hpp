#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tether
{

    struct AuditConfig
    {
        std::string log_path{"./artifacts/audit/audit_log.jsonl"};
    };

    struct SandboxConfig
    {
        std::string run_dir{"./artifacts/runs"};
        double timeout_seconds{120.0};
        bool force_in_process{false};
        std::size_t max_output_bytes{64 * 1024 * 1024};
        int poll_interval_ms{10};
    };

    struct AgentsConfig
    {
        std::vector<std::string> search_paths{"./agents"};
        std::map<std::string, std::string> module_paths; // capability -> shared library
    };

    struct PrivacyConfig
    {
        std::string strategy{"drop"};
        std::optional<std::vector<std::string>> columns; // nullopt = auto-detect
        std::string salt;
        std::size_t bucket_count{4};
        std::size_t categorical_max_cardinality{50};
    };

    struct ConfirmationConfig
    {
        bool auto_confirm{false};
        bool interactive{true};
        std::string affirmative_token{"yes"};
    };

    struct PersistConfig
    {
        std::string output_dir{"./artifacts/features"};
    };

    struct TetherConfig
    {
        std::string actor{"tether"};
        std::string log_level{"info"};
        AuditConfig audit{};
        SandboxConfig sandbox{};
        AgentsConfig agents{};
        PrivacyConfig privacy{};
        ConfirmationConfig confirmation{};
        PersistConfig persist{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides. The privacy
     * strategy is kept as written; it is validated when a policy is built so
     * that a bad value is audited rather than lost at startup.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<TetherConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<TetherConfig> from_string(const std::string &toml_content);

        /** Defaults with environment overrides applied, for runs without a file. */
        static Result<TetherConfig> defaults();

        /** Serialize config to JSON for inspection. The salt is never included. */
        static nlohmann::json to_json(const TetherConfig &cfg);

    private:
        static Result<void> apply_env_overrides(TetherConfig &cfg);
    };

} // namespace tether
