#include "tether/orchestrator.hpp"
#include "tether/clock.hpp"
#include <spdlog/spdlog.h>

namespace tether
{
    namespace
    {
        constexpr std::string_view kInputSuffix = ".input.json";

        AuditSink &require_sink(const std::shared_ptr<AuditSink> &sink)
        {
            if (!sink)
                throw std::invalid_argument("Orchestrator requires an audit sink");
            return *sink;
        }

        /** <run_dir>/<capability>_<ts><suffix>, sharing the stem of the transport file */
        std::filesystem::path sibling_path(const SandboxInvocation &inv, std::string_view suffix)
        {
            std::string stem = inv.input_path.string();
            if (stem.ends_with(kInputSuffix))
                stem.resize(stem.size() - kInputSuffix.size());
            return std::filesystem::path(stem + std::string(suffix));
        }

        void mark_malformed(SandboxResult &result, const std::string &why)
        {
            result.exit_status = ExitStatus::MalformedOutput;
            result.error = why;
            result.parsed_output.reset();
            spdlog::warn("agent output rejected: {}", why);
        }

        bool is_string_or_null(const nlohmann::json &j, const char *key)
        {
            return !j.contains(key) || j[key].is_string() || j[key].is_null();
        }
    } // namespace

    Orchestrator::Orchestrator(TetherConfig cfg,
                               std::shared_ptr<AuditSink> audit,
                               std::shared_ptr<Prompter> prompter,
                               ProviderFactory providers,
                               std::shared_ptr<ArtifactStore> store)
        : cfg_(std::move(cfg)),
          audit_(std::move(audit)),
          providers_(std::move(providers)),
          store_(std::move(store)),
          gate_(cfg_.confirmation, std::move(prompter)),
          deidentifier_(require_sink(audit_), cfg_.actor)
    {
        if (!providers_)
        {
            AgentsConfig agents = cfg_.agents;
            providers_ = [agents]
            { return default_providers(agents); };
        }
        if (!store_)
            store_ = std::make_shared<FilesystemArtifactStore>(cfg_.persist.output_dir);
    }

    TetherError Orchestrator::audit_error(const std::string &action, const TetherError &error, nlohmann::json details)
    {
        auto event = AuditEvent::make(EventType::Error, cfg_.actor, action);
        event.success = false;
        event.details = details.is_object() ? std::move(details) : nlohmann::json::object();
        event.details["error"] = error.what();
        event.details["error_code"] = error_code_to_string(error.code);
        append_or_warn(*audit_, event);
        spdlog::error("{} failed: {}", action, error.what());
        return error;
    }

    bool Orchestrator::is_unavailable(const std::string &capability) const
    {
        if (!unavailable_.contains(capability))
            return false;
        spdlog::warn("{} timed out earlier in this run; skipping", capability);
        return true;
    }

    void Orchestrator::note_outcome(const std::string &capability, const SandboxResult &result)
    {
        if (result.exit_status != ExitStatus::Timeout)
            return;
        unavailable_.insert(capability);
        spdlog::warn("{} unavailable for this run after timeout", capability);
    }

    Result<DeidentificationPolicy> Orchestrator::make_policy()
    {
        const auto &privacy = cfg_.privacy;
        auto strategy = strategy_from_string(privacy.strategy);
        if (!strategy)
        {
            deidentifier_.record_policy_error(strategy.error(), {{"strategy", privacy.strategy}});
            return std::unexpected(strategy.error());
        }

        DeidentificationPolicy policy;
        policy.strategy = *strategy;
        policy.columns = privacy.columns;
        policy.salt = privacy.salt;
        policy.bucket_count = privacy.bucket_count;
        policy.categorical_max_cardinality = privacy.categorical_max_cardinality;
        return policy;
    }

    Result<DeidentifiedDataset> Orchestrator::deidentify(Dataset dataset)
    {
        auto policy = make_policy();
        if (!policy)
            return std::unexpected(policy.error());
        return deidentifier_.deidentify(std::move(dataset), *policy);
    }

    Result<Orchestrator::AgentCall> Orchestrator::prepare_call(const std::string &capability,
                                                              Dataset dataset,
                                                              SandboxRunner &runner)
    {
        auto reduced = deidentify(std::move(dataset));
        if (!reduced)
            return std::unexpected(reduced.error());

        AgentResolver resolver(providers_(), *audit_, cfg_.actor);
        auto agent = resolver.resolve(capability);
        if (!agent)
            return std::unexpected(agent.error());

        auto invocation = runner.prepare(capability, nlohmann::json::object());
        if (!invocation)
            return std::unexpected(audit_error(capability, invocation.error(), {{"capability", capability}}));

        AgentCall call{std::move(*agent), std::move(*invocation), std::move(reduced->manifest), {}};
        call.data_ref = sibling_path(call.invocation, ".data.csv");
        if (auto written = reduced->data.write_csv(call.data_ref); !written)
            return std::unexpected(audit_error(capability, written.error(), {{"capability", capability}}));
        call.invocation.input["data_ref"] = call.data_ref.string();
        return call;
    }

    Result<ReportResult> Orchestrator::run_report(Dataset dataset, const std::string &target_col)
    {
        const std::string capability(capability::kRunReport);
        if (is_unavailable(capability))
        {
            ReportResult skipped;
            skipped.available = false;
            skipped.sandbox.exit_status = ExitStatus::Timeout;
            skipped.sandbox.error = capability + " is unavailable after an earlier timeout";
            return skipped;
        }
        if (!target_col.empty() && !dataset.has_column(target_col))
            return std::unexpected(audit_error(capability,
                                               TetherError::invalid_input("target column not in dataset: " + target_col),
                                               {{"target_col", target_col}}));

        SandboxRunner runner(cfg_.sandbox, *audit_, cfg_.actor);
        auto call = prepare_call(capability, std::move(dataset), runner);
        if (!call)
            return std::unexpected(call.error());

        auto out_dir = sibling_path(call->invocation, ".report");
        call->invocation.input["target_col"] = target_col.empty() ? nlohmann::json(nullptr) : nlohmann::json(target_col);
        call->invocation.input["out_dir"] = out_dir.string();

        ReportResult report;
        report.source = call->agent.source;
        report.manifest = call->manifest;
        report.sandbox = runner.run(call->agent, call->invocation);
        note_outcome(capability, report.sandbox);

        if (report.sandbox.ok())
        {
            const auto &out = *report.sandbox.parsed_output;
            if (!out.is_object())
                mark_malformed(report.sandbox, "run_report must return a JSON object");
            else if (!is_string_or_null(out, "out_dir") || !is_string_or_null(out, "summary_path"))
                mark_malformed(report.sandbox, "run_report out_dir and summary_path must be strings or null");
            else
                report.output = out;
        }

        auto event = AuditEvent::make(EventType::EdaRun, cfg_.actor, "run_report");
        event.duration_seconds = report.sandbox.elapsed_seconds;
        event.success = report.ok();
        event.details = {{"capability", capability},
                         {"source", agent_source_to_string(report.source)},
                         {"exit_status", exit_status_to_string(report.sandbox.exit_status)},
                         {"target_col", target_col},
                         {"data_ref", call->data_ref.string()},
                         {"stdout_path", report.sandbox.stdout_path.string()},
                         {"stderr_path", report.sandbox.stderr_path.string()},
                         {"deidentified_columns", report.manifest.targeted}};
        if (report.ok())
        {
            const auto &out = report.output;
            event.details["out_dir"] = out.contains("out_dir") && out["out_dir"].is_string() ? out["out_dir"] : nlohmann::json(out_dir.string());
            event.details["summary_path"] = out.contains("summary_path") ? out["summary_path"] : nlohmann::json(nullptr);
            event.details["stub"] = out.contains("stub") && out["stub"] == true;
        }
        else
        {
            event.details["error"] = report.sandbox.error;
        }
        append_or_warn(*audit_, event);
        return report;
    }

    Result<ProposalResult> Orchestrator::propose_transforms(Dataset dataset, const std::string &label_col, std::size_t max_items)
    {
        const std::string capability(capability::kProposeTransforms);
        ProposalResult result;
        if (is_unavailable(capability))
        {
            result.available = false;
            return result;
        }
        if (max_items == 0)
            return std::unexpected(audit_error(capability, TetherError::invalid_input("max_items must be >= 1"),
                                               {{"max_items", max_items}}));
        if (!label_col.empty() && !dataset.has_column(label_col))
            return std::unexpected(audit_error(capability,
                                               TetherError::invalid_input("label column not in dataset: " + label_col),
                                               {{"label_col", label_col}}));

        SandboxRunner runner(cfg_.sandbox, *audit_, cfg_.actor);
        auto call = prepare_call(capability, std::move(dataset), runner);
        if (!call)
            return std::unexpected(call.error());

        call->invocation.input["label_ref"] = label_col.empty() ? nlohmann::json(nullptr) : nlohmann::json(label_col);
        call->invocation.input["max_items"] = max_items;

        result.source = call->agent.source;
        auto run = runner.run(call->agent, call->invocation);
        note_outcome(capability, run);

        if (run.exit_status == ExitStatus::Timeout)
        {
            result.available = false;
        }
        else if (run.ok())
        {
            // either a bare array or {"proposals": [...]}
            const auto &out = *run.parsed_output;
            const nlohmann::json *items = nullptr;
            if (out.is_array())
                items = &out;
            else if (out.is_object() && out.contains("proposals"))
                items = &out["proposals"];

            if (!items)
            {
                mark_malformed(run, "propose_transforms must return an array of proposals");
            }
            else if (auto parsed = proposals_from_json(*items); !parsed)
            {
                mark_malformed(run, parsed.error().what());
            }
            else
            {
                result.proposals = std::move(*parsed);
                if (result.proposals.size() > max_items)
                    result.proposals.resize(max_items);
            }
        }
        else
        {
            spdlog::warn("{} returned no proposals: {}", capability, run.error);
        }

        result.sandbox = std::move(run);
        return result;
    }

    Result<ApplyResult> Orchestrator::apply_transforms(Dataset dataset,
                                                       const std::vector<ApplyProposal> &proposals,
                                                       std::optional<bool> confirm)
    {
        const std::string capability(capability::kApplyTransforms);
        if (is_unavailable(capability))
        {
            ApplyResult skipped;
            skipped.available = false;
            skipped.sandbox.exit_status = ExitStatus::Timeout;
            skipped.error = skipped.sandbox.error = capability + " is unavailable after an earlier timeout";
            return skipped;
        }
        SandboxRunner runner(cfg_.sandbox, *audit_, cfg_.actor);
        auto call = prepare_call(capability, std::move(dataset), runner);
        if (!call)
            return std::unexpected(call.error());

        // the agent never persists; durable writes happen here, behind the gate
        call->invocation.input["proposals"] = proposals_to_json(proposals);
        call->invocation.input["dry_run"] = true;
        call->invocation.input["out_dir"] = cfg_.sandbox.run_dir;

        ApplyResult result;
        result.sandbox = runner.run(call->agent, call->invocation);
        note_outcome(capability, result.sandbox);

        std::string data_ref;
        if (result.sandbox.ok())
        {
            const auto &out = *result.sandbox.parsed_output;
            if (!out.is_object() || !out.contains("data_ref") || !out["data_ref"].is_string())
            {
                mark_malformed(result.sandbox, "apply_transforms must return an object with a string data_ref");
            }
            else if (out.contains("applied") && !out["applied"].is_array())
            {
                mark_malformed(result.sandbox, "apply_transforms applied must be an array");
            }
            else if (out.contains("count") && !out["count"].is_number_unsigned())
            {
                mark_malformed(result.sandbox, "apply_transforms count must be a non-negative integer");
            }
            else
            {
                data_ref = out["data_ref"].get<std::string>();
                for (const auto &item : out.value("applied", nlohmann::json::array()))
                {
                    if (item.is_string())
                        result.applied.push_back(item.get<std::string>());
                    else if (item.is_object() && item.contains("name") && item["name"].is_string())
                        result.applied.push_back(item["name"].get<std::string>());
                }
                result.count = out.contains("count") ? out["count"].get<std::size_t>() : result.applied.size();

                auto loaded = Dataset::read_csv(data_ref);
                if (!loaded)
                    mark_malformed(result.sandbox, std::format("data_ref unreadable: {}", loaded.error().what()));
                else
                    result.data = std::move(*loaded);
            }
        }
        if (!result.computed())
            result.error = result.sandbox.error;

        nlohmann::json details{{"capability", capability},
                               {"source", agent_source_to_string(call->agent.source)},
                               {"exit_status", exit_status_to_string(result.sandbox.exit_status)},
                               {"proposals", proposals.size()},
                               {"persisted", false}};

        if (result.computed())
        {
            result.decision = gate_.evaluate(capability, confirm);
            details["gate_state"] = gate_state_to_string(result.decision.state);
            details["authorization"] = authorization_source_to_string(result.decision.source);
            details["applied"] = result.applied;
            details["count"] = result.count;
            details["data_ref"] = data_ref;

            if (result.decision.confirmed())
            {
                nlohmann::json metadata{{"capability", capability},
                                        {"source", agent_source_to_string(call->agent.source)},
                                        {"applied", result.applied},
                                        {"proposals", proposals_to_json(proposals)},
                                        {"authorization", authorization_source_to_string(result.decision.source)},
                                        {"deidentification", call->manifest.to_json()}};
                auto stored = store_->persist(*result.data, metadata, "features");
                if (stored)
                {
                    result.persisted = true;
                    result.artifact = *stored;
                    details["persisted"] = true;
                    details["data_path"] = stored->data_path.string();
                    details["metadata_path"] = stored->metadata_path.string();
                }
                else
                {
                    result.error = stored.error().what();
                    details["error"] = result.error;
                    details["error_code"] = error_code_to_string(stored.error().code);
                }
            }
            else
            {
                spdlog::info("apply_transforms ran as dry run; nothing persisted");
            }
        }
        else
        {
            details["error"] = result.error;
        }

        auto event = AuditEvent::make(EventType::ApplyFeatures, cfg_.actor, "apply_transforms");
        event.duration_seconds = result.sandbox.elapsed_seconds;
        // a declined gate is still a success; only an uncomputed or unwritable result is not
        event.success = result.computed() && (result.persisted || !result.decision.confirmed());
        event.details = std::move(details);
        append_or_warn(*audit_, event);
        return result;
    }

} // namespace tether
