#include <catch2/catch_test_macros.hpp>
#include "tether/orchestrator.hpp"
#include "test_support.hpp"
#include <fstream>
#include <thread>

using namespace tether;
using tether::testing::MemoryAuditSink;
using tether::testing::TempDir;
using tether::testing::count_files;

namespace
{
    class RecordingStore : public ArtifactStore
    {
    public:
        Result<PersistedArtifact> persist(const Dataset &data, const nlohmann::json &metadata, const std::string &name) override
        {
            if (fail)
                return std::unexpected(TetherError::storage("volume is read-only"));
            writes.push_back({data, metadata, name});
            return PersistedArtifact{"/store/" + name + ".csv", "/store/" + name + ".meta.json", "digest"};
        }

        struct Write
        {
            Dataset data;
            nlohmann::json metadata;
            std::string name;
        };
        std::vector<Write> writes;
        bool fail{false};
    };

    /** Supplies one fixed function for every capability */
    class FixedProvider : public AgentProvider
    {
    public:
        explicit FixedProvider(AgentFunction fn) : fn_(std::move(fn)) {}

        AgentSource source() const override { return AgentSource::ModulePath; }

        Result<ResolvedAgent> find(const std::string &capability) override
        {
            ResolvedAgent agent;
            agent.capability = capability;
            agent.source = source();
            agent.origin = "fixed";
            agent.function = fn_;
            return agent;
        }

    private:
        AgentFunction fn_;
    };

    ProviderFactory fixed(AgentFunction fn)
    {
        return [fn]
        {
            ProviderList providers;
            providers.push_back(std::make_unique<FixedProvider>(fn));
            return providers;
        };
    }

    class AnswerPrompter : public Prompter
    {
    public:
        explicit AnswerPrompter(std::string answer) : answer_(std::move(answer)) {}
        std::optional<std::string> ask(const std::string &) override { return answer_; }

    private:
        std::string answer_;
    };

    TetherConfig config_in(const TempDir &dir)
    {
        TetherConfig cfg;
        cfg.actor = "tester";
        cfg.audit.log_path = (dir / "audit/audit_log.jsonl").string();
        cfg.sandbox.run_dir = (dir / "runs").string();
        cfg.sandbox.timeout_seconds = 10.0;
        cfg.sandbox.poll_interval_ms = 5;
        cfg.agents.search_paths = {};
        cfg.confirmation.interactive = false;
        cfg.persist.output_dir = (dir / "features").string();
        return cfg;
    }

    Dataset patients()
    {
        return Dataset::create({"patient_id", "age", "income", "outcome"},
                               {{"p1", "34", "52000", "0"},
                                {"p2", "51", "61000", "1"},
                                {"p3", "29", "48000", "0"}})
            .value();
    }
}

TEST_CASE("Apply without authorization is a dry run", "[orchestrator][gate]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto store = std::make_shared<RecordingStore>();
    Orchestrator orch(config_in(dir), audit, nullptr, {}, store);

    auto result = orch.apply_transforms(patients(), {{"scale_age", ProposalKind::Scale, nlohmann::json::object()}});
    REQUIRE(result.has_value());
    REQUIRE(result->computed());
    REQUIRE_FALSE(result->persisted);
    REQUIRE_FALSE(result->decision.confirmed());
    REQUIRE(store->writes.empty());

    // the stub hands back the de-identified input
    REQUIRE_FALSE(result->data->has_column("patient_id"));
    REQUIRE(result->data->row_count() == 3);

    auto events = audit->of(EventType::ApplyFeatures);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].success);
    REQUIRE(events[0].details["persisted"] == false);
    REQUIRE(events[0].details["authorization"] == "none");
}

TEST_CASE("Apply without authorization never touches the real store", "[orchestrator][gate]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto cfg = config_in(dir);
    Orchestrator orch(cfg, audit);

    auto result = orch.apply_transforms(patients(), {});
    REQUIRE(result.has_value());
    REQUIRE(result->computed());
    REQUIRE(count_files(cfg.persist.output_dir) == 0);
}

TEST_CASE("Each authorization source persists", "[orchestrator][gate]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto store = std::make_shared<RecordingStore>();
    auto cfg = config_in(dir);
    std::vector<ApplyProposal> proposals{{"ratio_income_age", ProposalKind::Ratio, {{"numerator", "income"}}}};

    SECTION("Explicit flag")
    {
        Orchestrator orch(cfg, audit, nullptr, {}, store);
        auto result = orch.apply_transforms(patients(), proposals, true);
        REQUIRE(result->persisted);
        REQUIRE(result->decision.source == AuthorizationSource::ExplicitFlag);
    }

    SECTION("Auto-confirm")
    {
        cfg.confirmation.auto_confirm = true;
        Orchestrator orch(cfg, audit, nullptr, {}, store);
        auto result = orch.apply_transforms(patients(), proposals);
        REQUIRE(result->persisted);
        REQUIRE(result->decision.source == AuthorizationSource::AutoConfirm);
    }

    SECTION("Interactive")
    {
        cfg.confirmation.interactive = true;
        Orchestrator orch(cfg, audit, std::make_shared<AnswerPrompter>("yes"), {}, store);
        auto result = orch.apply_transforms(patients(), proposals);
        REQUIRE(result->persisted);
        REQUIRE(result->decision.source == AuthorizationSource::Interactive);
    }

    REQUIRE(store->writes.size() == 1);
    REQUIRE(store->writes[0].name == "features");
    REQUIRE(store->writes[0].metadata["proposals"][0]["name"] == "ratio_income_age");
    REQUIRE(store->writes[0].metadata.dump().find("p1") == std::string::npos);

    auto events = audit->of(EventType::ApplyFeatures);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].details["persisted"] == true);
    REQUIRE(events[0].details["data_path"] == "/store/features.csv");
}

TEST_CASE("Interactive refusal stays a dry run", "[orchestrator][gate]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto store = std::make_shared<RecordingStore>();
    auto cfg = config_in(dir);
    cfg.confirmation.interactive = true;
    Orchestrator orch(cfg, audit, std::make_shared<AnswerPrompter>("y"), {}, store);

    auto result = orch.apply_transforms(patients(), {}, false);
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->persisted);
    REQUIRE(store->writes.empty());
    REQUIRE(audit->of(EventType::ApplyFeatures)[0].success);
}

TEST_CASE("Confirmed apply writes real artifacts", "[orchestrator][artifact]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto cfg = config_in(dir);
    Orchestrator orch(cfg, audit);

    auto result = orch.apply_transforms(patients(), {}, true);
    REQUIRE(result.has_value());
    REQUIRE(result->persisted);
    REQUIRE(result->artifact.has_value());
    REQUIRE(std::filesystem::exists(result->artifact->data_path));
    REQUIRE(std::filesystem::exists(result->artifact->metadata_path));
    REQUIRE(count_files(cfg.persist.output_dir) == 2);
}

TEST_CASE("Storage failures are audited as unsuccessful", "[orchestrator][artifact]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto store = std::make_shared<RecordingStore>();
    store->fail = true;
    Orchestrator orch(config_in(dir), audit, nullptr, {}, store);

    auto result = orch.apply_transforms(patients(), {}, true);
    REQUIRE(result.has_value());
    REQUIRE(result->computed());
    REQUIRE_FALSE(result->persisted);
    REQUIRE(result->error == "volume is read-only");

    auto events = audit->of(EventType::ApplyFeatures);
    REQUIRE_FALSE(events[0].success);
    REQUIRE(events[0].details["error_code"] == "StorageError");
}

TEST_CASE("An unresolved propose_transforms returns an empty list", "[orchestrator][resolver]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    Orchestrator orch(config_in(dir), audit);

    auto result = orch.propose_transforms(patients(), "outcome", 5);
    REQUIRE(result.has_value());
    REQUIRE(result->available);
    REQUIRE(result->source == AgentSource::Stub);
    REQUIRE(result->proposals.empty());
    REQUIRE(result->sandbox->ok());

    REQUIRE(audit->of(EventType::AgentSubprocess, "resolve_agent").size() == 1);
    REQUIRE(audit->of(EventType::AgentSubprocess, "run_agent").size() == 1);
}

TEST_CASE("Installed agents are used and capped at max_items", "[orchestrator][dlopen]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto cfg = config_in(dir);
    cfg.agents.search_paths = {TETHER_TEST_AGENT_DIR};
    Orchestrator orch(cfg, audit);

    auto result = orch.propose_transforms(patients(), "outcome", 2);
    REQUIRE(result.has_value());
    REQUIRE(result->source == AgentSource::InstalledModule);
    REQUIRE(result->proposals.size() == 2);
    REQUIRE(result->proposals[0].kind == ProposalKind::Ratio);
    REQUIRE(result->proposals[1].kind == ProposalKind::OutlierCap);
    REQUIRE(result->proposals[1].parameters["cols"][0] == "income");
}

TEST_CASE("A timed-out capability is unavailable for the rest of the run", "[orchestrator][timeout]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto cfg = config_in(dir);
    cfg.sandbox.timeout_seconds = 0.3;
    Orchestrator orch(cfg, audit, nullptr, fixed([](const nlohmann::json &)
                                                 {
                                                     std::this_thread::sleep_for(std::chrono::seconds(30));
                                                     return nlohmann::json::array(); }));

    auto first = orch.propose_transforms(patients(), "outcome", 5);
    REQUIRE(first.has_value());
    REQUIRE_FALSE(first->available);
    REQUIRE(first->proposals.empty());
    REQUIRE(first->sandbox->exit_status == ExitStatus::Timeout);

    auto second = orch.propose_transforms(patients(), "outcome", 5);
    REQUIRE(second.has_value());
    REQUIRE_FALSE(second->available);
    REQUIRE_FALSE(second->sandbox.has_value());
    REQUIRE(audit->of(EventType::AgentSubprocess, "run_agent").size() == 1);
}

TEST_CASE("A timed-out report is skipped for the rest of the run", "[orchestrator][timeout]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto cfg = config_in(dir);
    cfg.sandbox.timeout_seconds = 0.3;
    Orchestrator orch(cfg, audit, nullptr, fixed([](const nlohmann::json &)
                                                 {
                                                     std::this_thread::sleep_for(std::chrono::seconds(30));
                                                     return nlohmann::json::object(); }));

    auto first = orch.run_report(patients(), "outcome");
    REQUIRE(first.has_value());
    REQUIRE(first->available);
    REQUIRE_FALSE(first->ok());
    REQUIRE(first->sandbox.exit_status == ExitStatus::Timeout);

    auto second = orch.run_report(patients(), "outcome");
    REQUIRE(second.has_value());
    REQUIRE_FALSE(second->available);
    REQUIRE_FALSE(second->ok());
    REQUIRE(audit->of(EventType::AgentSubprocess, "run_agent").size() == 1);
    REQUIRE(audit->of(EventType::EdaRun).size() == 1);

    // other capabilities are unaffected
    auto proposals = orch.propose_transforms(patients(), "outcome", 3);
    REQUIRE(proposals.has_value());
    REQUIRE(proposals->sandbox.has_value());
    REQUIRE(audit->of(EventType::AgentSubprocess, "run_agent").size() == 2);
}

TEST_CASE("A timed-out apply is skipped for the rest of the run", "[orchestrator][timeout]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    auto store = std::make_shared<RecordingStore>();
    auto cfg = config_in(dir);
    cfg.sandbox.timeout_seconds = 0.3;
    Orchestrator orch(cfg, audit, nullptr, fixed([](const nlohmann::json &)
                                                 {
                                                     std::this_thread::sleep_for(std::chrono::seconds(30));
                                                     return nlohmann::json::object(); }),
                      store);

    const std::vector<ApplyProposal> proposals{{"scale_age", ProposalKind::Scale, nlohmann::json::object()}};
    auto first = orch.apply_transforms(patients(), proposals, true);
    REQUIRE(first.has_value());
    REQUIRE(first->available);
    REQUIRE_FALSE(first->computed());
    REQUIRE(first->sandbox.exit_status == ExitStatus::Timeout);

    auto second = orch.apply_transforms(patients(), proposals, true);
    REQUIRE(second.has_value());
    REQUIRE_FALSE(second->available);
    REQUIRE_FALSE(second->computed());
    REQUIRE_FALSE(second->persisted);
    REQUIRE(store->writes.empty());
    REQUIRE(audit->of(EventType::AgentSubprocess, "run_agent").size() == 1);
    REQUIRE(audit->of(EventType::ApplyFeatures).size() == 1);
}

TEST_CASE("Agent output shapes are validated", "[orchestrator][malformed]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();

    SECTION("Proposals that are not a list")
    {
        Orchestrator orch(config_in(dir), audit, nullptr, fixed([](const nlohmann::json &)
                                                                { return nlohmann::json{{"proposals", "ratio"}}; }));
        auto result = orch.propose_transforms(patients(), "", 5);
        REQUIRE(result.has_value());
        REQUIRE(result->proposals.empty());
        REQUIRE(result->sandbox->exit_status == ExitStatus::MalformedOutput);
    }

    SECTION("Apply output pointing at nothing")
    {
        Orchestrator orch(config_in(dir), audit, nullptr, fixed([](const nlohmann::json &)
                                                                { return nlohmann::json{{"data_ref", "/no/such.csv"}, {"applied", nlohmann::json::array()}}; }));
        auto result = orch.apply_transforms(patients(), {}, true);
        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->computed());
        REQUIRE_FALSE(result->persisted);
        REQUIRE(result->sandbox.exit_status == ExitStatus::MalformedOutput);

        auto events = audit->of(EventType::ApplyFeatures);
        REQUIRE(events.size() == 1);
        REQUIRE_FALSE(events[0].success);
        REQUIRE(events[0].details["exit_status"] == "malformed_output");
    }
}

TEST_CASE("Agents only ever see de-identified data", "[orchestrator][deidentify]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    Orchestrator orch(config_in(dir), audit, nullptr, fixed([](const nlohmann::json &params)
                                                            {
                                                                std::ifstream in(params["data_ref"].get<std::string>());
                                                                std::string header;
                                                                std::getline(in, header);
                                                                return nlohmann::json{{"out_dir", nullptr}, {"header", header}}; }));

    auto report = orch.run_report(patients(), "outcome");
    REQUIRE(report.has_value());
    REQUIRE(report->ok());
    REQUIRE(report->output["header"] == "age,income,outcome");
    REQUIRE(report->manifest.removed == std::vector<std::string>{"patient_id"});

    auto eda = audit->of(EventType::EdaRun);
    REQUIRE(eda.size() == 1);
    REQUIRE(eda[0].success);
    REQUIRE(eda[0].details["target_col"] == "outcome");
}

TEST_CASE("run_report falls back to the stub", "[orchestrator]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();
    Orchestrator orch(config_in(dir), audit);

    auto report = orch.run_report(patients(), "");
    REQUIRE(report.has_value());
    REQUIRE(report->ok());
    REQUIRE(report->output["stub"] == true);

    // deidentify, stub fallback, sandbox run, report: in that order
    auto events = audit->events();
    REQUIRE(events.size() == 4);
    REQUIRE(events[0].event_type == EventType::Deidentify);
    REQUIRE(events[1].event_type == EventType::AgentSubprocess);
    REQUIRE(events[1].action == "resolve_agent");
    REQUIRE(events[1].details["source"] == "stub");
    REQUIRE(events[2].event_type == EventType::AgentSubprocess);
    REQUIRE(events[2].action == "run_agent");
    REQUIRE(events[3].event_type == EventType::EdaRun);
    REQUIRE(events[3].details["stub"] == true);

    // per-invocation counts go by action, not by event type alone
    REQUIRE(audit->of(EventType::AgentSubprocess).size() == 2);
    REQUIRE(audit->of(EventType::AgentSubprocess, "run_agent").size() == 1);
}

TEST_CASE("Bad inputs are audited and nothing runs", "[orchestrator]")
{
    TempDir dir;
    auto audit = std::make_shared<MemoryAuditSink>();

    SECTION("Unknown target column")
    {
        Orchestrator orch(config_in(dir), audit);
        auto report = orch.run_report(patients(), "no_such_column");
        REQUIRE_FALSE(report.has_value());
        REQUIRE(report.error().code == ErrorCode::InvalidInput);
        REQUIRE(audit->of(EventType::Error).size() == 1);
    }

    SECTION("Unknown strategy")
    {
        auto cfg = config_in(dir);
        cfg.privacy.strategy = "encrypt";
        Orchestrator orch(cfg, audit);
        auto result = orch.propose_transforms(patients(), "", 3);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::PolicyConfiguration);

        auto deid = audit->of(EventType::Deidentify);
        REQUIRE(deid.size() == 1);
        REQUIRE_FALSE(deid[0].success);
    }

    SECTION("Pseudonymize without a salt")
    {
        auto cfg = config_in(dir);
        cfg.privacy.strategy = "pseudonymize";
        Orchestrator orch(cfg, audit);
        auto result = orch.deidentify(patients());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::PolicyConfiguration);
    }

    REQUIRE(audit->of(EventType::AgentSubprocess).empty());
    REQUIRE(count_files(dir / "runs") == 0);
}

TEST_CASE("Orchestrator writes through a real audit log", "[orchestrator][audit]")
{
    TempDir dir;
    auto cfg = config_in(dir);
    auto audit = std::make_shared<JsonlAuditLog>(cfg.audit.log_path);
    Orchestrator orch(cfg, audit);

    REQUIRE(orch.apply_transforms(patients(), {}).has_value());

    auto events = JsonlAuditLog::read_all(cfg.audit.log_path);
    REQUIRE(events.has_value());
    REQUIRE(events->back().event_type == EventType::ApplyFeatures);
    REQUIRE(events->back().details["persisted"] == false);
}
