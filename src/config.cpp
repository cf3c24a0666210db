#include "tether/config.hpp"
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace tether
{
    namespace
    {
        std::vector<std::string> string_array(const toml::array &arr)
        {
            std::vector<std::string> out;
            for (const auto &node : arr)
            {
                if (auto s = node.value<std::string>())
                    out.push_back(*s);
            }
            return out;
        }

        bool env_flag(const char *value)
        {
            std::string v(value);
            return !(v.empty() || v == "0" || v == "false" || v == "no");
        }

        Result<std::size_t> count_value(std::string_view key, int64_t value)
        {
            if (value < 0)
                return std::unexpected(TetherError::config(std::format("{} must not be negative, got {}", key, value)));
            return static_cast<std::size_t>(value);
        }

        Result<TetherConfig> parse_toml(const toml::table &tbl, TetherConfig cfg)
        {
            if (auto actor = tbl["actor"].value<std::string>())
                cfg.actor = *actor;
            if (auto level = tbl["log_level"].value<std::string>())
                cfg.log_level = *level;

            if (auto audit = tbl["audit"].as_table())
            {
                if (auto path = (*audit)["log_path"].value<std::string>())
                    cfg.audit.log_path = *path;
            }

            if (auto sandbox = tbl["sandbox"].as_table())
            {
                if (auto dir = (*sandbox)["run_dir"].value<std::string>())
                    cfg.sandbox.run_dir = *dir;
                if (auto t = (*sandbox)["timeout_seconds"].value<double>())
                    cfg.sandbox.timeout_seconds = *t;
                if (auto f = (*sandbox)["force_in_process"].value<bool>())
                    cfg.sandbox.force_in_process = *f;
                if (auto m = (*sandbox)["max_output_bytes"].value<int64_t>())
                {
                    auto bytes = count_value("sandbox.max_output_bytes", *m);
                    if (!bytes)
                        return std::unexpected(bytes.error());
                    cfg.sandbox.max_output_bytes = *bytes;
                }
                if (auto p = (*sandbox)["poll_interval_ms"].value<int64_t>())
                {
                    if (*p <= 0 || *p > 60000)
                        return std::unexpected(TetherError::config(std::format(
                            "sandbox.poll_interval_ms must be in 1..60000, got {}", *p)));
                    cfg.sandbox.poll_interval_ms = static_cast<int>(*p);
                }
            }

            if (auto agents = tbl["agents"].as_table())
            {
                if (auto paths = (*agents)["search_paths"].as_array())
                    cfg.agents.search_paths = string_array(*paths);
                if (auto modules = (*agents)["modules"].as_table())
                {
                    for (const auto &[key, node] : *modules)
                    {
                        if (auto p = node.value<std::string>())
                            cfg.agents.module_paths[std::string(key.str())] = *p;
                    }
                }
            }

            if (auto privacy = tbl["privacy"].as_table())
            {
                if (auto s = (*privacy)["strategy"].value<std::string>())
                    cfg.privacy.strategy = *s;
                if (auto cols = (*privacy)["columns"].as_array())
                    cfg.privacy.columns = string_array(*cols);
                if (auto salt = (*privacy)["salt"].value<std::string>())
                    cfg.privacy.salt = *salt;
                if (auto k = (*privacy)["bucket_count"].value<int64_t>())
                {
                    auto count = count_value("privacy.bucket_count", *k);
                    if (!count)
                        return std::unexpected(count.error());
                    cfg.privacy.bucket_count = *count;
                }
                if (auto c = (*privacy)["categorical_max_cardinality"].value<int64_t>())
                {
                    auto cardinality = count_value("privacy.categorical_max_cardinality", *c);
                    if (!cardinality)
                        return std::unexpected(cardinality.error());
                    cfg.privacy.categorical_max_cardinality = *cardinality;
                }
            }

            if (auto confirm = tbl["confirmation"].as_table())
            {
                if (auto a = (*confirm)["auto_confirm"].value<bool>())
                    cfg.confirmation.auto_confirm = *a;
                if (auto i = (*confirm)["interactive"].value<bool>())
                    cfg.confirmation.interactive = *i;
                if (auto t = (*confirm)["affirmative_token"].value<std::string>())
                    cfg.confirmation.affirmative_token = *t;
            }

            if (auto persist = tbl["persist"].as_table())
            {
                if (auto dir = (*persist)["output_dir"].value<std::string>())
                    cfg.persist.output_dir = *dir;
            }

            return cfg;
        }

        Result<void> check(const TetherConfig &cfg)
        {
            if (!(cfg.sandbox.timeout_seconds > 0.0) || !std::isfinite(cfg.sandbox.timeout_seconds))
                return std::unexpected(TetherError::config("sandbox.timeout_seconds must be a finite number > 0"));
            if (cfg.sandbox.poll_interval_ms <= 0)
                return std::unexpected(TetherError::config("sandbox.poll_interval_ms must be > 0"));
            if (cfg.confirmation.affirmative_token.empty())
                return std::unexpected(TetherError::config("confirmation.affirmative_token must not be empty"));
            return {};
        }

    } // namespace

    Result<TetherConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(TetherError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<TetherConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        TetherConfig cfg{};
        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(TetherError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto ok = check(cfg); !ok)
            return std::unexpected(ok.error());
        return cfg;
    }

    Result<TetherConfig> ConfigLoader::defaults()
    {
        TetherConfig cfg{};
        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto ok = check(cfg); !ok)
            return std::unexpected(ok.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(TetherConfig &cfg)
    {
        if (const char *actor = std::getenv("TETHER_ACTOR"))
            cfg.actor = actor;
        if (const char *level = std::getenv("TETHER_LOG_LEVEL"))
            cfg.log_level = level;
        if (const char *audit_path = std::getenv("TETHER_AUDIT_LOG"))
            cfg.audit.log_path = audit_path;
        if (const char *run_dir = std::getenv("TETHER_RUN_DIR"))
            cfg.sandbox.run_dir = run_dir;
        if (const char *timeout = std::getenv("TETHER_SANDBOX_TIMEOUT"))
        {
            std::string_view text(timeout);
            double value = 0.0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
                return std::unexpected(TetherError::config(std::format("Invalid TETHER_SANDBOX_TIMEOUT: {}", text)));
            cfg.sandbox.timeout_seconds = value;
        }
        if (const char *in_proc = std::getenv("TETHER_FORCE_IN_PROCESS"))
            cfg.sandbox.force_in_process = env_flag(in_proc);
        if (const char *auto_confirm = std::getenv("TETHER_AUTO_CONFIRM"))
            cfg.confirmation.auto_confirm = env_flag(auto_confirm);
        if (const char *salt = std::getenv("TETHER_DEID_SALT"))
            cfg.privacy.salt = salt;
        if (const char *out = std::getenv("TETHER_OUTPUT_DIR"))
            cfg.persist.output_dir = out;
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const TetherConfig &cfg)
    {
        nlohmann::json j;
        j["actor"] = cfg.actor;
        j["log_level"] = cfg.log_level;
        j["audit"] = {{"log_path", cfg.audit.log_path}};
        j["sandbox"] = {{"run_dir", cfg.sandbox.run_dir},
                        {"timeout_seconds", cfg.sandbox.timeout_seconds},
                        {"force_in_process", cfg.sandbox.force_in_process},
                        {"max_output_bytes", cfg.sandbox.max_output_bytes},
                        {"poll_interval_ms", cfg.sandbox.poll_interval_ms}};
        j["agents"] = {{"search_paths", cfg.agents.search_paths},
                       {"modules", cfg.agents.module_paths}};
        j["privacy"] = {{"strategy", cfg.privacy.strategy},
                        {"columns", cfg.privacy.columns ? nlohmann::json(*cfg.privacy.columns) : nlohmann::json("auto")},
                        {"has_salt", !cfg.privacy.salt.empty()},
                        {"bucket_count", cfg.privacy.bucket_count},
                        {"categorical_max_cardinality", cfg.privacy.categorical_max_cardinality}};
        j["confirmation"] = {{"auto_confirm", cfg.confirmation.auto_confirm},
                             {"interactive", cfg.confirmation.interactive},
                             {"affirmative_token", cfg.confirmation.affirmative_token}};
        j["persist"] = {{"output_dir", cfg.persist.output_dir}};
        return j;
    }

} // namespace tether
