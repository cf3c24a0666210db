#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tether
{

    enum class ProposalKind
    {
        Ratio,
        OutlierCap,
        Scale,
        Interaction,
        Other
    };

    std::string proposal_kind_to_string(ProposalKind kind);

    /** Unknown kinds map to Other; agents are free to invent their own. */
    ProposalKind proposal_kind_from_string(const std::string &s);

    /**
     * One feature-engineering suggestion produced by propose_transforms and
     * consumed by apply_transforms.
     */
    struct ApplyProposal
    {
        std::string name;
        ProposalKind kind{ProposalKind::Other};
        nlohmann::json parameters = nlohmann::json::object();

        nlohmann::json to_json() const;

        /**
         * Accepts {"name", "kind", "parameters"}. "type" is read as an alias of
         * "kind", and without a "parameters" object every other field is kept
         * as a parameter.
         */
        static Result<ApplyProposal> from_json(const nlohmann::json &j);
    };

    /** Parse a JSON array of proposals; any invalid element fails the whole list */
    Result<std::vector<ApplyProposal>> proposals_from_json(const nlohmann::json &j);

    nlohmann::json proposals_to_json(const std::vector<ApplyProposal> &proposals);

} // namespace tether
