#include "tether/deidentifier.hpp"
#include "tether/clock.hpp"
#include "tether/crypto.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <set>
#include <string_view>
#include <spdlog/spdlog.h>

namespace tether
{
    namespace
    {
        constexpr std::array<std::string_view, 28> kIdentifierTokens = {
            "name", "firstname", "lastname", "fullname", "surname", "forename", "username",
            "email", "mail", "id", "uuid", "guid", "ssn",
            "address", "addr", "street", "zip", "zipcode", "postcode", "postal",
            "phone", "telephone", "tel", "mobile",
            "dob", "birthdate", "birthday", "mrn"};

        // Matched against the whole name with separators removed
        constexpr std::array<std::string_view, 14> kIdentifierFragments = {
            "email", "phone", "address", "dateofbirth", "birthdate", "firstname", "lastname",
            "fullname", "surname", "socialsecurity", "patientid", "userid", "customerid", "personid"};

        std::vector<std::string> name_tokens(const std::string &name)
        {
            std::vector<std::string> tokens;
            std::string current;
            auto flush = [&]()
            {
                if (!current.empty())
                    tokens.push_back(std::move(current));
                current.clear();
            };
            for (std::size_t i = 0; i < name.size(); ++i)
            {
                unsigned char c = static_cast<unsigned char>(name[i]);
                if (!std::isalnum(c))
                {
                    flush();
                    continue;
                }
                // camelCase boundary: patientId -> patient, id
                if (std::isupper(c) && i > 0 && std::islower(static_cast<unsigned char>(name[i - 1])))
                    flush();
                current.push_back(static_cast<char>(std::tolower(c)));
            }
            flush();
            return tokens;
        }

        std::string compact_lower(const std::string &name)
        {
            std::string out;
            for (unsigned char c : name)
            {
                if (std::isalnum(c))
                    out.push_back(static_cast<char>(std::tolower(c)));
            }
            return out;
        }

        std::string bucket_label(std::size_t index)
        {
            return "bucket_" + std::to_string(index);
        }

        std::vector<std::string> bucket_labels(std::size_t count)
        {
            std::vector<std::string> labels;
            labels.reserve(count);
            for (std::size_t i = 0; i < count; ++i)
                labels.push_back(bucket_label(i));
            return labels;
        }

        bool is_numeric_column(const std::vector<std::string> &values)
        {
            bool any = false;
            for (const auto &v : values)
            {
                if (v.empty())
                    continue;
                if (!parse_number(v))
                    return false;
                any = true;
            }
            return any;
        }

        double quantile(const std::vector<double> &sorted, double q)
        {
            if (sorted.size() == 1)
                return sorted.front();
            double pos = q * static_cast<double>(sorted.size() - 1);
            auto lo = static_cast<std::size_t>(std::floor(pos));
            auto hi = std::min(lo + 1, sorted.size() - 1);
            double frac = pos - static_cast<double>(lo);
            return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
        }

        BucketSpec generalize_numeric(std::vector<std::string> &values, std::size_t k)
        {
            std::vector<double> sorted;
            for (const auto &v : values)
            {
                if (auto n = parse_number(v))
                    sorted.push_back(*n);
            }
            std::sort(sorted.begin(), sorted.end());

            BucketSpec spec;
            spec.method = BucketSpec::Method::Quantile;
            spec.labels = bucket_labels(k);
            for (std::size_t i = 0; i <= k; ++i)
                spec.boundaries.push_back(quantile(sorted, static_cast<double>(i) / static_cast<double>(k)));

            // interior edges e_1 .. e_{k-1}
            auto first = spec.boundaries.begin() + 1;
            auto last = spec.boundaries.begin() + static_cast<std::ptrdiff_t>(k);
            for (auto &v : values)
            {
                auto n = parse_number(v);
                if (!n)
                    continue;
                auto idx = static_cast<std::size_t>(std::upper_bound(first, last, *n) - first);
                v = bucket_label(std::min(idx, k - 1));
            }
            return spec;
        }

        BucketSpec generalize_categorical(std::vector<std::string> &values, std::size_t k, std::size_t max_cardinality)
        {
            std::set<std::string> distinct;
            for (const auto &v : values)
            {
                if (!v.empty())
                    distinct.insert(v);
            }

            BucketSpec spec;
            spec.labels = bucket_labels(k);

            if (distinct.size() <= max_cardinality)
            {
                spec.method = BucketSpec::Method::Rank;
                spec.group_sizes.assign(k, 0);
                std::map<std::string, std::size_t> bucket_of;
                std::size_t rank = 0;
                for (const auto &d : distinct)
                {
                    auto b = rank * k / distinct.size();
                    bucket_of.emplace(d, b);
                    ++spec.group_sizes[b];
                    ++rank;
                }
                for (auto &v : values)
                {
                    if (!v.empty())
                        v = bucket_label(bucket_of.at(v));
                }
                return spec;
            }

            spec.method = BucketSpec::Method::Hash;
            for (auto &v : values)
            {
                if (v.empty())
                    continue;
                auto digest = crypto::SHA256::hash(v);
                uint64_t prefix = 0;
                for (std::size_t i = 0; i < 8; ++i)
                    prefix = (prefix << 8) | digest[i];
                v = bucket_label(static_cast<std::size_t>(prefix % k));
            }
            return spec;
        }

        std::string method_to_string(BucketSpec::Method m)
        {
            switch (m)
            {
            case BucketSpec::Method::Quantile:
                return "quantile";
            case BucketSpec::Method::Rank:
                return "rank";
            case BucketSpec::Method::Hash:
                return "hash";
            }
            return "quantile";
        }
    } // namespace

    std::string strategy_to_string(Strategy strategy)
    {
        switch (strategy)
        {
        case Strategy::Drop:
            return "drop";
        case Strategy::Pseudonymize:
            return "pseudonymize";
        case Strategy::Generalize:
            return "generalize";
        }
        return "drop";
    }

    Result<Strategy> strategy_from_string(const std::string &s)
    {
        if (s == "drop")
            return Strategy::Drop;
        if (s == "pseudonymize")
            return Strategy::Pseudonymize;
        if (s == "generalize")
            return Strategy::Generalize;
        return std::unexpected(TetherError::policy(std::format("Unknown de-identification strategy: {}", s)));
    }

    DeidentificationPolicy DeidentificationPolicy::auto_detect(Strategy strategy, std::string salt)
    {
        DeidentificationPolicy p;
        p.strategy = strategy;
        p.salt = std::move(salt);
        return p;
    }

    DeidentificationPolicy DeidentificationPolicy::explicit_columns(Strategy strategy,
                                                                    std::vector<std::string> columns,
                                                                    std::string salt)
    {
        DeidentificationPolicy p;
        p.strategy = strategy;
        p.columns = std::move(columns);
        p.salt = std::move(salt);
        return p;
    }

    Result<void> DeidentificationPolicy::validate() const
    {
        if (strategy == Strategy::Pseudonymize && salt.empty())
            return std::unexpected(TetherError::policy("pseudonymize requires a non-empty salt"));
        if (strategy == Strategy::Generalize && (bucket_count == 0 || bucket_count > kMaxBucketCount))
            return std::unexpected(TetherError::policy(std::format(
                "generalize requires bucket_count in 1..{}, got {}", kMaxBucketCount, bucket_count)));
        return {};
    }

    nlohmann::json BucketSpec::to_json() const
    {
        nlohmann::json j{{"method", method_to_string(method)},
                         {"bucket_count", labels.size()},
                         {"labels", labels}};
        if (!boundaries.empty())
            j["boundaries"] = boundaries;
        if (!group_sizes.empty())
            j["group_sizes"] = group_sizes;
        return j;
    }

    nlohmann::json ChangeManifest::to_json() const
    {
        nlohmann::json j{{"strategy", strategy_to_string(strategy)},
                         {"auto_detected", auto_detected},
                         {"cols_targeted", targeted},
                         {"missing", missing}};
        switch (strategy)
        {
        case Strategy::Drop:
            j["action"] = "dropped_columns";
            j["removed"] = removed;
            break;
        case Strategy::Pseudonymize:
            j["action"] = "pseudonymized";
            j["hashed"] = hashed;
            break;
        case Strategy::Generalize:
        {
            j["action"] = "generalized";
            nlohmann::json b = nlohmann::json::object();
            for (const auto &[col, spec] : buckets)
                b[col] = spec.to_json();
            j["buckets"] = b;
            break;
        }
        }
        return j;
    }

    bool looks_like_identifier(const std::string &column_name)
    {
        for (const auto &token : name_tokens(column_name))
        {
            if (std::find(kIdentifierTokens.begin(), kIdentifierTokens.end(), token) != kIdentifierTokens.end())
                return true;
        }
        auto compact = compact_lower(column_name);
        for (auto fragment : kIdentifierFragments)
        {
            if (compact.find(fragment) != std::string::npos)
                return true;
        }
        return false;
    }

    std::vector<std::string> detect_identifier_columns(const Dataset &dataset)
    {
        std::vector<std::string> out;
        for (const auto &c : dataset.columns())
        {
            if (looks_like_identifier(c))
                out.push_back(c);
        }
        return out;
    }

    std::string pseudonymize_value(const std::string &salt, const std::string &value)
    {
        return crypto::HmacSha256::compute_hex(salt, value);
    }

    Deidentifier::Deidentifier(AuditSink &audit, std::string actor)
        : audit_(audit), actor_(std::move(actor)) {}

    void Deidentifier::record_policy_error(const TetherError &error, const nlohmann::json &context)
    {
        auto event = AuditEvent::make(EventType::Deidentify, actor_, "deidentify");
        event.success = false;
        event.details = context.is_object() ? context : nlohmann::json::object();
        event.details["error"] = error.what();
        event.details["error_code"] = error_code_to_string(error.code);
        append_or_warn(audit_, event);
    }

    Result<DeidentifiedDataset> Deidentifier::deidentify(Dataset dataset, const DeidentificationPolicy &policy)
    {
        auto start = std::chrono::steady_clock::now();

        nlohmann::json context{{"strategy", strategy_to_string(policy.strategy)},
                               {"auto_detected", policy.auto_detects()}};
        if (auto valid = policy.validate(); !valid)
        {
            record_policy_error(valid.error(), context);
            return std::unexpected(valid.error());
        }

        ChangeManifest manifest;
        manifest.strategy = policy.strategy;
        manifest.auto_detected = policy.auto_detects();
        auto requested = policy.columns ? *policy.columns : detect_identifier_columns(dataset);
        std::set<std::string> seen;
        for (const auto &c : requested)
        {
            // a column named twice is still transformed once
            if (!seen.insert(c).second)
                continue;
            if (dataset.has_column(c))
                manifest.targeted.push_back(c);
            else
                manifest.missing.push_back(c);
        }

        switch (policy.strategy)
        {
        case Strategy::Drop:
            dataset.drop_columns(manifest.targeted);
            manifest.removed = manifest.targeted;
            break;

        case Strategy::Pseudonymize:
            for (const auto &c : manifest.targeted)
            {
                auto idx = *dataset.column_index(c);
                auto values = dataset.column_values(idx);
                for (auto &v : values)
                {
                    if (!v.empty())
                        v = pseudonymize_value(policy.salt, v);
                }
                if (auto set = dataset.set_column_values(idx, std::move(values)); !set)
                {
                    record_policy_error(set.error(), context);
                    return std::unexpected(set.error());
                }
                manifest.hashed.push_back(c);
            }
            break;

        case Strategy::Generalize:
            for (const auto &c : manifest.targeted)
            {
                auto idx = *dataset.column_index(c);
                auto values = dataset.column_values(idx);
                auto spec = is_numeric_column(values)
                                ? generalize_numeric(values, policy.bucket_count)
                                : generalize_categorical(values, policy.bucket_count, policy.categorical_max_cardinality);
                if (auto set = dataset.set_column_values(idx, std::move(values)); !set)
                {
                    record_policy_error(set.error(), context);
                    return std::unexpected(set.error());
                }
                manifest.buckets.emplace(c, std::move(spec));
            }
            break;
        }

        auto event = AuditEvent::make(EventType::Deidentify, actor_, "deidentify");
        event.duration_seconds = seconds_since(start);
        event.details = context;
        event.details["columns"] = manifest.targeted;
        event.details["missing"] = manifest.missing;
        event.details["rows"] = dataset.row_count();
        if (policy.strategy == Strategy::Generalize)
        {
            nlohmann::json counts = nlohmann::json::object();
            for (const auto &[col, spec] : manifest.buckets)
                counts[col] = spec.labels.size();
            event.details["bucket_counts"] = counts;
        }
        append_or_warn(audit_, event);

        spdlog::debug("deidentify strategy={} targeted={} missing={}",
                      strategy_to_string(policy.strategy), manifest.targeted.size(), manifest.missing.size());
        return DeidentifiedDataset{std::move(dataset), std::move(manifest)};
    }

} // namespace tether
