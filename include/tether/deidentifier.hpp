#pragma once

#include "audit.hpp"
#include "dataset.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tether
{

    enum class Strategy
    {
        Drop,
        Pseudonymize,
        Generalize
    };

    std::string strategy_to_string(Strategy strategy);

    /** Unknown names are a PolicyConfiguration error, never a silent default */
    Result<Strategy> strategy_from_string(const std::string &s);

    /**
     * How a dataset is de-identified. An absent column list means "auto-detect";
     * an explicit empty list targets nothing.
     */
    struct DeidentificationPolicy
    {
        static constexpr std::size_t kMaxBucketCount = 1024;

        Strategy strategy{Strategy::Drop};
        std::optional<std::vector<std::string>> columns;
        std::string salt;
        std::size_t bucket_count{4};
        std::size_t categorical_max_cardinality{50};

        static DeidentificationPolicy auto_detect(Strategy strategy, std::string salt = {});
        static DeidentificationPolicy explicit_columns(Strategy strategy,
                                                       std::vector<std::string> columns,
                                                       std::string salt = {});

        bool auto_detects() const { return !columns.has_value(); }

        /** Salt present for pseudonymize, 1..kMaxBucketCount buckets for generalize */
        Result<void> validate() const;
    };

    struct BucketSpec
    {
        enum class Method
        {
            Quantile,
            Rank,
            Hash
        };

        Method method{Method::Quantile};
        std::vector<std::string> labels;
        std::vector<double> boundaries;      // quantile: bucket_count + 1 edges
        std::vector<std::size_t> group_sizes; // rank: distinct values per bucket

        nlohmann::json to_json() const;
    };

    /**
     * What a de-identification pass changed. Holds column names and bucket
     * descriptions only: never cell values, never the salt.
     */
    struct ChangeManifest
    {
        Strategy strategy{Strategy::Drop};
        bool auto_detected{false};
        std::vector<std::string> targeted;
        std::vector<std::string> missing;
        std::vector<std::string> removed;
        std::vector<std::string> hashed;
        std::map<std::string, BucketSpec> buckets;

        nlohmann::json to_json() const;
    };

    struct DeidentifiedDataset
    {
        Dataset data;
        ChangeManifest manifest;
    };

    /** Case-insensitive identifier-name heuristic used when a policy auto-detects */
    bool looks_like_identifier(const std::string &column_name);
    std::vector<std::string> detect_identifier_columns(const Dataset &dataset);

    /**
     * Produces privacy-reduced copies of datasets. Every call appends exactly
     * one `deidentify` audit event, including calls that fail validation.
     */
    class Deidentifier
    {
    public:
        Deidentifier(AuditSink &audit, std::string actor);

        Result<DeidentifiedDataset> deidentify(Dataset dataset, const DeidentificationPolicy &policy);

        /** Audit a policy that could not even be built (e.g. unknown strategy name) */
        void record_policy_error(const TetherError &error, const nlohmann::json &context = nlohmann::json::object());

    private:
        AuditSink &audit_;
        std::string actor_;
    };

    /** Hex HMAC-SHA-256 pseudonym of one cell value */
    std::string pseudonymize_value(const std::string &salt, const std::string &value);

} // namespace tether
