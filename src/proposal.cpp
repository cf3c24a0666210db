#include "tether/proposal.hpp"

namespace tether
{

    std::string proposal_kind_to_string(ProposalKind kind)
    {
        switch (kind)
        {
        case ProposalKind::Ratio:
            return "ratio";
        case ProposalKind::OutlierCap:
            return "outlier_cap";
        case ProposalKind::Scale:
            return "scale";
        case ProposalKind::Interaction:
            return "interaction";
        case ProposalKind::Other:
            break;
        }
        return "other";
    }

    ProposalKind proposal_kind_from_string(const std::string &s)
    {
        if (s == "ratio")
            return ProposalKind::Ratio;
        if (s == "outlier_cap")
            return ProposalKind::OutlierCap;
        if (s == "scale")
            return ProposalKind::Scale;
        if (s == "interaction")
            return ProposalKind::Interaction;
        return ProposalKind::Other;
    }

    nlohmann::json ApplyProposal::to_json() const
    {
        return {{"name", name},
                {"kind", proposal_kind_to_string(kind)},
                {"parameters", parameters}};
    }

    Result<ApplyProposal> ApplyProposal::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(TetherError::parsing("proposal must be a JSON object"));
        if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty())
            return std::unexpected(TetherError::parsing("proposal requires a non-empty string 'name'"));

        ApplyProposal p;
        p.name = j["name"].get<std::string>();

        const char *kind_key = j.contains("kind") ? "kind" : "type";
        if (j.contains(kind_key))
        {
            if (!j[kind_key].is_string())
                return std::unexpected(TetherError::parsing(std::format("proposal '{}': {} must be a string", p.name, kind_key)));
            p.kind = proposal_kind_from_string(j[kind_key].get<std::string>());
        }

        if (j.contains("parameters"))
        {
            if (!j["parameters"].is_object())
                return std::unexpected(TetherError::parsing(std::format("proposal '{}': parameters must be an object", p.name)));
            p.parameters = j["parameters"];
        }
        else
        {
            for (const auto &[key, value] : j.items())
            {
                if (key != "name" && key != "kind" && key != "type")
                    p.parameters[key] = value;
            }
        }
        return p;
    }

    Result<std::vector<ApplyProposal>> proposals_from_json(const nlohmann::json &j)
    {
        if (!j.is_array())
            return std::unexpected(TetherError::parsing("proposals must be a JSON array"));

        std::vector<ApplyProposal> out;
        out.reserve(j.size());
        for (const auto &item : j)
        {
            auto p = ApplyProposal::from_json(item);
            if (!p)
                return std::unexpected(p.error());
            out.push_back(std::move(*p));
        }
        return out;
    }

    nlohmann::json proposals_to_json(const std::vector<ApplyProposal> &proposals)
    {
        auto arr = nlohmann::json::array();
        for (const auto &p : proposals)
            arr.push_back(p.to_json());
        return arr;
    }

} // namespace tether
