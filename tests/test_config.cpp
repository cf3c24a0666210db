#include <catch2/catch_test_macros.hpp>
#include "tether/config.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <fstream>

using namespace tether;

namespace
{
    /** Sets an environment variable for the lifetime of the guard */
    class EnvGuard
    {
    public:
        EnvGuard(const char *name, const char *value) : name_(name)
        {
            ::setenv(name, value, 1);
        }
        ~EnvGuard() { ::unsetenv(name_); }

    private:
        const char *name_;
    };
}

TEST_CASE("Config parses every section", "[config]")
{
    const char *toml = R"(
actor = "analyst-7"
log_level = "debug"

[audit]
log_path = "/tmp/tether/audit.jsonl"

[sandbox]
run_dir = "/tmp/tether/runs"
timeout_seconds = 2.5
force_in_process = true
max_output_bytes = 1024
poll_interval_ms = 5

[agents]
search_paths = ["/opt/agents", "./agents"]

[agents.modules]
run_report = "/opt/dev/libreport.so"

[privacy]
strategy = "generalize"
columns = ["age", "zip"]
salt = "pepper"
bucket_count = 5
categorical_max_cardinality = 10

[confirmation]
auto_confirm = true
interactive = false
affirmative_token = "CONFIRM"

[persist]
output_dir = "/tmp/tether/features"
)";
    auto cfg = ConfigLoader::from_string(toml);
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->actor == "analyst-7");
    REQUIRE(cfg->log_level == "debug");
    REQUIRE(cfg->audit.log_path == "/tmp/tether/audit.jsonl");
    REQUIRE(cfg->sandbox.timeout_seconds == 2.5);
    REQUIRE(cfg->sandbox.force_in_process);
    REQUIRE(cfg->sandbox.max_output_bytes == 1024);
    REQUIRE(cfg->sandbox.poll_interval_ms == 5);
    REQUIRE(cfg->agents.search_paths.size() == 2);
    REQUIRE(cfg->agents.module_paths.at("run_report") == "/opt/dev/libreport.so");
    REQUIRE(cfg->privacy.strategy == "generalize");
    REQUIRE(cfg->privacy.columns == std::vector<std::string>{"age", "zip"});
    REQUIRE(cfg->privacy.bucket_count == 5);
    REQUIRE(cfg->privacy.categorical_max_cardinality == 10);
    REQUIRE(cfg->confirmation.auto_confirm);
    REQUIRE_FALSE(cfg->confirmation.interactive);
    REQUIRE(cfg->confirmation.affirmative_token == "CONFIRM");
    REQUIRE(cfg->persist.output_dir == "/tmp/tether/features");
}

TEST_CASE("Config defaults", "[config]")
{
    auto cfg = ConfigLoader::from_string("");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->sandbox.timeout_seconds == 120.0);
    REQUIRE_FALSE(cfg->privacy.columns.has_value());
    REQUIRE_FALSE(cfg->confirmation.auto_confirm);
    REQUIRE(cfg->confirmation.affirmative_token == "yes");
}

TEST_CASE("Config rejects bad values", "[config]")
{
    REQUIRE_FALSE(ConfigLoader::from_string("[sandbox]\ntimeout_seconds = 0").has_value());
    REQUIRE_FALSE(ConfigLoader::from_string("[sandbox]\ntimeout_seconds = -3.0").has_value());
    REQUIRE_FALSE(ConfigLoader::from_string("[confirmation]\naffirmative_token = \"\"").has_value());

    auto broken = ConfigLoader::from_string("actor = ");
    REQUIRE_FALSE(broken.has_value());
    REQUIRE(broken.error().code == ErrorCode::ConfigError);

    REQUIRE_FALSE(ConfigLoader::load("/definitely/not/here.toml").has_value());
}

TEST_CASE("Config rejects non-finite timeouts", "[config]")
{
    REQUIRE_FALSE(ConfigLoader::from_string("[sandbox]\ntimeout_seconds = inf").has_value());
    REQUIRE_FALSE(ConfigLoader::from_string("[sandbox]\ntimeout_seconds = nan").has_value());

    EnvGuard timeout("TETHER_SANDBOX_TIMEOUT", "inf");
    auto cfg = ConfigLoader::defaults();
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == ErrorCode::ConfigError);
}

TEST_CASE("Config rejects negative counts", "[config]")
{
    auto buckets = ConfigLoader::from_string("[privacy]\nbucket_count = -1");
    REQUIRE_FALSE(buckets.has_value());
    REQUIRE(buckets.error().code == ErrorCode::ConfigError);
    REQUIRE(std::string(buckets.error().what()).find("privacy.bucket_count") != std::string::npos);

    REQUIRE_FALSE(ConfigLoader::from_string("[privacy]\ncategorical_max_cardinality = -5").has_value());
    REQUIRE_FALSE(ConfigLoader::from_string("[sandbox]\nmax_output_bytes = -1").has_value());
    REQUIRE_FALSE(ConfigLoader::from_string("[sandbox]\npoll_interval_ms = -10").has_value());
}

TEST_CASE("Unknown strategies survive loading so they can be audited later", "[config]")
{
    auto cfg = ConfigLoader::from_string("[privacy]\nstrategy = \"encrypt\"");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->privacy.strategy == "encrypt");
}

TEST_CASE("Environment overrides take precedence", "[config][env]")
{
    EnvGuard actor("TETHER_ACTOR", "from-env");
    EnvGuard timeout("TETHER_SANDBOX_TIMEOUT", "7.5");
    EnvGuard confirm("TETHER_AUTO_CONFIRM", "1");
    EnvGuard salt("TETHER_DEID_SALT", "env-salt");

    auto cfg = ConfigLoader::from_string("actor = \"from-file\"\n[sandbox]\ntimeout_seconds = 1.0");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->actor == "from-env");
    REQUIRE(cfg->sandbox.timeout_seconds == 7.5);
    REQUIRE(cfg->confirmation.auto_confirm);
    REQUIRE(cfg->privacy.salt == "env-salt");

    SECTION("Malformed numbers are config errors")
    {
        EnvGuard bad("TETHER_SANDBOX_TIMEOUT", "soon");
        REQUIRE_FALSE(ConfigLoader::defaults().has_value());
    }
}

TEST_CASE("Config JSON never exposes the salt", "[config]")
{
    TetherConfig cfg;
    cfg.privacy.salt = "top-secret";
    auto j = ConfigLoader::to_json(cfg);
    REQUIRE(j.dump().find("top-secret") == std::string::npos);
    REQUIRE(j["privacy"]["has_salt"] == true);
    REQUIRE(j["privacy"]["columns"] == "auto");
}

TEST_CASE("Config loads from a file", "[config]")
{
    tether::testing::TempDir dir;
    std::ofstream(dir / "tether.toml") << "actor = \"file-actor\"\n";
    auto cfg = ConfigLoader::load((dir / "tether.toml").string());
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->actor == "file-actor");
}
