#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether
{
    enum class EventType
    {
        EdaRun,
        Deidentify,
        AgentSubprocess, // action "run_agent" once per sandbox run, "resolve_agent" on stub fallback
        ApplyFeatures,
        Error
    };

    std::string event_type_to_string(EventType type);
    Result<EventType> event_type_from_string(const std::string &s);

    /**
     * One line of the audit log. Events are values: sinks take them by const
     * reference and never hand back a mutable copy of what was written.
     */
    struct AuditEvent
    {
        EventType event_type{EventType::Error};
        std::string actor;
        std::string action;
        std::string timestamp;
        std::optional<double> duration_seconds;
        bool success{true};
        nlohmann::json details = nlohmann::json::object();

        /** Build an event stamped with the current UTC time */
        static AuditEvent make(EventType type, std::string actor, std::string action);

        nlohmann::json to_json() const;

        /** Parse a log line object; unknown fields (top-level or in details) are tolerated */
        static Result<AuditEvent> from_json(const nlohmann::json &j);
    };

    /**
     * Append-only event sink shared by every component.
     */
    class AuditSink
    {
    public:
        virtual ~AuditSink() = default;

        virtual Result<void> append(const AuditEvent &event) = 0;
    };

    /**
     * Newline-delimited JSON audit log. Each event is serialized to one
     * complete line and handed to the kernel in a single write(2) on an
     * O_APPEND descriptor, so lines from concurrent writers never interleave.
     */
    class JsonlAuditLog : public AuditSink
    {
    public:
        explicit JsonlAuditLog(std::filesystem::path path);
        ~JsonlAuditLog() override;

        JsonlAuditLog(const JsonlAuditLog &) = delete;
        JsonlAuditLog &operator=(const JsonlAuditLog &) = delete;

        Result<void> append(const AuditEvent &event) override;

        const std::filesystem::path &path() const { return path_; }

        /** Read every event in a log file, oldest first */
        static Result<std::vector<AuditEvent>> read_all(const std::filesystem::path &path);

    private:
        Result<void> ensure_open();

        std::filesystem::path path_;
        int fd_{-1};
        std::mutex mutex_;
    };

    /** Append and report sink failures on the operator log instead of dropping them silently. */
    void append_or_warn(AuditSink &sink, const AuditEvent &event);

} // namespace tether
