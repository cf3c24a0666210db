#pragma once

#include "config.hpp"
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace tether
{

    enum class GateState
    {
        Unconfirmed,
        Confirmed
    };

    enum class AuthorizationSource
    {
        None,
        ExplicitFlag,
        AutoConfirm,
        Interactive
    };

    std::string gate_state_to_string(GateState state);
    std::string authorization_source_to_string(AuthorizationSource source);

    struct GateDecision
    {
        GateState state{GateState::Unconfirmed};
        AuthorizationSource source{AuthorizationSource::None};

        bool confirmed() const { return state == GateState::Confirmed; }
    };

    /**
     * Asks a human whether a persisting operation may proceed.
     * Returns the raw answer, or nullopt when no answer can be read.
     */
    class Prompter
    {
    public:
        virtual ~Prompter() = default;

        virtual std::optional<std::string> ask(const std::string &question) = 0;
    };

    /** Prompt on an output stream and read one line from an input stream */
    class StreamPrompter : public Prompter
    {
    public:
        StreamPrompter(std::istream &in, std::ostream &out);

        std::optional<std::string> ask(const std::string &question) override;

    private:
        std::istream &in_;
        std::ostream &out_;
    };

    /**
     * Decides whether a state-mutating operation may write durable output.
     *
     * Authorization sources, first one that grants wins:
     *   1. explicit per-call flag set to true
     *   2. auto_confirm from configuration
     *   3. interactive prompt answered with exactly the affirmative token
     *
     * An explicit false does not block the later sources. Anything else leaves
     * the gate unconfirmed and the caller must treat the operation as a dry run.
     */
    class ConfirmationGate
    {
    public:
        ConfirmationGate(ConfirmationConfig cfg, std::shared_ptr<Prompter> prompter);

        GateDecision evaluate(const std::string &operation, std::optional<bool> explicit_confirm) const;

    private:
        ConfirmationConfig cfg_;
        std::shared_ptr<Prompter> prompter_;
    };

} // namespace tether
