#include "tether/cli.hpp"
#include "tether/audit.hpp"
#include "tether/config.hpp"
#include "tether/logging.hpp"
#include "tether/orchestrator.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>

namespace tether::cli
{
	namespace
	{
		constexpr int kExitOk = 0;
		constexpr int kExitError = 1;
		constexpr int kExitAgentFailed = 2;

		Result<TetherConfig> load_config(const std::string &path)
		{
			if (path.empty())
				return ConfigLoader::defaults();
			return ConfigLoader::load(path);
		}

		int report_error(const TetherError &e)
		{
			std::cerr << error_code_to_string(e.code) << ": " << e.what() << std::endl;
			return kExitError;
		}

		nlohmann::json sandbox_summary(const SandboxResult &r)
		{
			nlohmann::json j{{"exit_status", exit_status_to_string(r.exit_status)},
							 {"elapsed_seconds", r.elapsed_seconds},
							 {"stdout_path", r.stdout_path.string()},
							 {"stderr_path", r.stderr_path.string()},
							 {"isolation", isolation_to_string(r.isolation)}};
			if (!r.error.empty())
				j["error"] = r.error;
			return j;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Tether: sandboxed runtime for untrusted analysis agents"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print effective config as JSON");

		std::string input_path;
		std::string output_path;
		std::string strategy;
		std::vector<std::string> columns;
		bool no_columns{false};
		auto deid_cmd = app.add_subcommand("deidentify", "De-identify a CSV file");
		deid_cmd->add_option("--input", input_path, "Input CSV")->required();
		deid_cmd->add_option("--output", output_path, "Output CSV (defaults to stdout)");
		deid_cmd->add_option("--strategy", strategy, "drop, pseudonymize or generalize");
		deid_cmd->add_option("--columns", columns, "Explicit columns (default: auto-detect)")->delimiter(',');
		deid_cmd->add_flag("--no-columns", no_columns, "Explicit empty column list (no-op)");

		std::string target_col;
		auto report_cmd = app.add_subcommand("report", "Run the run_report agent on a CSV file");
		report_cmd->add_option("--input", input_path, "Input CSV")->required();
		report_cmd->add_option("--target", target_col, "Target column");

		std::string label_col;
		std::size_t max_items{10};
		auto propose_cmd = app.add_subcommand("propose", "Ask the propose_transforms agent for proposals");
		propose_cmd->add_option("--input", input_path, "Input CSV")->required();
		propose_cmd->add_option("--label", label_col, "Label column");
		propose_cmd->add_option("--max-items", max_items, "Maximum number of proposals")->check(CLI::PositiveNumber);

		std::string proposals_path;
		bool confirm{false};
		auto apply_cmd = app.add_subcommand("apply", "Apply proposals; persists only when confirmed");
		apply_cmd->add_option("--input", input_path, "Input CSV")->required();
		apply_cmd->add_option("--proposals", proposals_path, "JSON file with a proposal array")->required();
		apply_cmd->add_flag("--confirm", confirm, "Authorize writing the result to durable storage");

		std::size_t tail_lines{20};
		auto tail_cmd = app.add_subcommand("audit-tail", "Print the most recent audit events");
		tail_cmd->add_option("-n,--lines", tail_lines, "Number of events");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
			return report_error(cfg.error());
		if (auto logging = configure_logging(cfg->log_level); !logging)
			return report_error(logging.error());

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return kExitOk;
		}

		if (*tail_cmd)
		{
			auto events = JsonlAuditLog::read_all(cfg->audit.log_path);
			if (!events)
				return report_error(events.error());
			std::size_t skip = events->size() > tail_lines ? events->size() - tail_lines : 0;
			for (std::size_t i = skip; i < events->size(); ++i)
				std::cout << (*events)[i].to_json().dump() << '\n';
			return kExitOk;
		}

		if (*deid_cmd)
		{
			if (!strategy.empty())
				cfg->privacy.strategy = strategy;
			if (no_columns)
				cfg->privacy.columns = std::vector<std::string>{};
			else if (!columns.empty())
				cfg->privacy.columns = columns;
		}

		auto data = Dataset::read_csv(input_path);
		if (!data)
			return report_error(data.error());

		auto audit = std::make_shared<JsonlAuditLog>(cfg->audit.log_path);
		std::shared_ptr<Prompter> prompter;
		if (cfg->confirmation.interactive)
			prompter = std::make_shared<StreamPrompter>(std::cin, std::cerr);
		Orchestrator orchestrator(*cfg, audit, prompter);

		if (*deid_cmd)
		{
			auto result = orchestrator.deidentify(std::move(*data));
			if (!result)
				return report_error(result.error());
			if (output_path.empty())
			{
				std::cout << result->data.to_csv();
			}
			else if (auto written = result->data.write_csv(output_path); !written)
			{
				return report_error(written.error());
			}
			std::cerr << result->manifest.to_json().dump(2) << std::endl;
			return kExitOk;
		}

		if (*report_cmd)
		{
			auto report = orchestrator.run_report(std::move(*data), target_col);
			if (!report)
				return report_error(report.error());
			nlohmann::json out{{"source", agent_source_to_string(report->source)},
							   {"available", report->available},
							   {"sandbox", sandbox_summary(report->sandbox)},
							   {"report", report->output}};
			std::cout << out.dump(2) << std::endl;
			return report->ok() ? kExitOk : kExitAgentFailed;
		}

		if (*propose_cmd)
		{
			auto proposals = orchestrator.propose_transforms(std::move(*data), label_col, max_items);
			if (!proposals)
				return report_error(proposals.error());
			nlohmann::json out{{"source", agent_source_to_string(proposals->source)},
							   {"available", proposals->available},
							   {"proposals", proposals_to_json(proposals->proposals)}};
			if (proposals->sandbox)
				out["sandbox"] = sandbox_summary(*proposals->sandbox);
			std::cout << out.dump(2) << std::endl;
			return proposals->sandbox && !proposals->sandbox->ok() ? kExitAgentFailed : kExitOk;
		}

		if (*apply_cmd)
		{
			std::ifstream pf(proposals_path);
			if (!pf.is_open())
			{
				std::cerr << "Unable to open proposals file " << proposals_path << std::endl;
				return kExitError;
			}
			nlohmann::json doc = nlohmann::json::parse(pf, nullptr, false);
			if (doc.is_discarded())
			{
				std::cerr << "Proposals file is not valid JSON" << std::endl;
				return kExitError;
			}
			if (doc.is_object() && doc.contains("proposals"))
				doc = doc["proposals"];
			auto proposals = proposals_from_json(doc);
			if (!proposals)
				return report_error(proposals.error());

			auto applied = orchestrator.apply_transforms(std::move(*data), *proposals,
														 confirm ? std::optional<bool>(true) : std::nullopt);
			if (!applied)
				return report_error(applied.error());

			nlohmann::json out{{"computed", applied->computed()},
							   {"available", applied->available},
							   {"persisted", applied->persisted},
							   {"authorization", authorization_source_to_string(applied->decision.source)},
							   {"applied", applied->applied},
							   {"count", applied->count},
							   {"sandbox", sandbox_summary(applied->sandbox)}};
			if (applied->artifact)
			{
				out["data_path"] = applied->artifact->data_path.string();
				out["metadata_path"] = applied->artifact->metadata_path.string();
			}
			if (!applied->error.empty())
				out["error"] = applied->error;
			std::cout << out.dump(2) << std::endl;
			if (!applied->computed())
				return kExitAgentFailed;
			return applied->error.empty() ? kExitOk : kExitError;
		}

		return kExitOk;
	}

} // namespace tether::cli
