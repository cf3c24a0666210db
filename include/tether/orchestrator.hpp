#pragma once

#include "agent_resolver.hpp"
#include "artifact_store.hpp"
#include "audit.hpp"
#include "config.hpp"
#include "confirmation_gate.hpp"
#include "dataset.hpp"
#include "deidentifier.hpp"
#include "proposal.hpp"
#include "sandbox.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tether
{

    struct ReportResult
    {
        SandboxResult sandbox;
        AgentSource source{AgentSource::Stub};
        ChangeManifest manifest;
        nlohmann::json output; // validated agent output, null unless ok()
        bool available{true};   // false once the capability has timed out in this run

        bool ok() const { return available && sandbox.ok(); }
    };

    struct ProposalResult
    {
        std::vector<ApplyProposal> proposals;
        bool available{true}; // false once the capability has timed out in this run
        std::optional<SandboxResult> sandbox;
        AgentSource source{AgentSource::Stub};
    };

    struct ApplyResult
    {
        std::optional<Dataset> data; // the computed transformation, even on a dry run
        std::vector<std::string> applied;
        std::size_t count{0};
        GateDecision decision;
        bool persisted{false};
        std::optional<PersistedArtifact> artifact;
        SandboxResult sandbox;
        std::string error;
        bool available{true};

        bool computed() const { return data.has_value(); }
    };

    /**
     * Sequences one analysis step: de-identify, resolve the agent, run it in
     * the sandbox, gate any persistence, and audit the outcome.
     *
     * Agents are resolved afresh on every call. The orchestrator never
     * retries a failed agent, and a capability that timed out is skipped for
     * the rest of this orchestrator's life.
     */
    class Orchestrator
    {
    public:
        Orchestrator(TetherConfig cfg,
                     std::shared_ptr<AuditSink> audit,
                     std::shared_ptr<Prompter> prompter = nullptr,
                     ProviderFactory providers = {},
                     std::shared_ptr<ArtifactStore> store = nullptr);

        /** Build the configured policy and run it; bad privacy settings are audited */
        Result<DeidentifiedDataset> deidentify(Dataset dataset);

        /** Exploratory report on the de-identified data; appends an eda_run event unless skipped */
        Result<ReportResult> run_report(Dataset dataset, const std::string &target_col);

        /** Ask the agent for at most max_items proposals; empty and flagged when unavailable */
        Result<ProposalResult> propose_transforms(Dataset dataset, const std::string &label_col, std::size_t max_items);

        /**
         * Compute the transformed dataset as a dry run, then persist it only if
         * the confirmation gate grants. Appends one apply_features event.
         */
        Result<ApplyResult> apply_transforms(Dataset dataset,
                                             const std::vector<ApplyProposal> &proposals,
                                             std::optional<bool> confirm = std::nullopt);

        const TetherConfig &config() const { return cfg_; }

    private:
        struct AgentCall
        {
            ResolvedAgent agent;
            SandboxInvocation invocation;
            ChangeManifest manifest;
            std::filesystem::path data_ref;
        };

        Result<DeidentificationPolicy> make_policy();
        Result<AgentCall> prepare_call(const std::string &capability, Dataset dataset, SandboxRunner &runner);
        TetherError audit_error(const std::string &action, const TetherError &error, nlohmann::json details);
        bool is_unavailable(const std::string &capability) const;
        void note_outcome(const std::string &capability, const SandboxResult &result);

        TetherConfig cfg_;
        std::shared_ptr<AuditSink> audit_;
        ProviderFactory providers_;
        std::shared_ptr<ArtifactStore> store_;
        ConfirmationGate gate_;
        Deidentifier deidentifier_;
        std::set<std::string> unavailable_;
    };

} // namespace tether
