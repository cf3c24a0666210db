#include "tether/confirmation_gate.hpp"
#include <istream>
#include <ostream>
#include <spdlog/spdlog.h>

namespace tether
{

    std::string gate_state_to_string(GateState state)
    {
        return state == GateState::Confirmed ? "confirmed" : "unconfirmed";
    }

    std::string authorization_source_to_string(AuthorizationSource source)
    {
        switch (source)
        {
        case AuthorizationSource::ExplicitFlag:
            return "explicit_flag";
        case AuthorizationSource::AutoConfirm:
            return "auto_confirm";
        case AuthorizationSource::Interactive:
            return "interactive";
        case AuthorizationSource::None:
            break;
        }
        return "none";
    }

    StreamPrompter::StreamPrompter(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

    std::optional<std::string> StreamPrompter::ask(const std::string &question)
    {
        out_ << question << std::flush;
        std::string line;
        if (!std::getline(in_, line))
            return std::nullopt;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return line;
    }

    ConfirmationGate::ConfirmationGate(ConfirmationConfig cfg, std::shared_ptr<Prompter> prompter)
        : cfg_(std::move(cfg)), prompter_(std::move(prompter)) {}

    GateDecision ConfirmationGate::evaluate(const std::string &operation, std::optional<bool> explicit_confirm) const
    {
        if (explicit_confirm.value_or(false))
            return {GateState::Confirmed, AuthorizationSource::ExplicitFlag};

        if (cfg_.auto_confirm)
            return {GateState::Confirmed, AuthorizationSource::AutoConfirm};

        if (cfg_.interactive && prompter_)
        {
            auto answer = prompter_->ask(std::format(
                "{} will write durable output. Type '{}' to proceed: ", operation, cfg_.affirmative_token));
            if (answer && *answer == cfg_.affirmative_token)
                return {GateState::Confirmed, AuthorizationSource::Interactive};
            spdlog::info("{} not confirmed interactively; continuing as dry run", operation);
        }

        return {GateState::Unconfirmed, AuthorizationSource::None};
    }

} // namespace tether
