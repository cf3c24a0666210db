#include "tether/audit.hpp"
#include "tether/clock.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace tether
{

    std::string event_type_to_string(EventType type)
    {
        switch (type)
        {
        case EventType::EdaRun:
            return "eda_run";
        case EventType::Deidentify:
            return "deidentify";
        case EventType::AgentSubprocess:
            return "agent_subprocess";
        case EventType::ApplyFeatures:
            return "apply_features";
        case EventType::Error:
            return "error";
        }
        return "error";
    }

    Result<EventType> event_type_from_string(const std::string &s)
    {
        if (s == "eda_run")
            return EventType::EdaRun;
        if (s == "deidentify")
            return EventType::Deidentify;
        if (s == "agent_subprocess")
            return EventType::AgentSubprocess;
        if (s == "apply_features")
            return EventType::ApplyFeatures;
        if (s == "error")
            return EventType::Error;
        return std::unexpected(TetherError::parsing(std::format("Unknown audit event type: {}", s)));
    }

    AuditEvent AuditEvent::make(EventType type, std::string actor, std::string action)
    {
        AuditEvent event;
        event.event_type = type;
        event.actor = std::move(actor);
        event.action = std::move(action);
        event.timestamp = utc_timestamp();
        return event;
    }

    nlohmann::json AuditEvent::to_json() const
    {
        nlohmann::json j{{"event_type", event_type_to_string(event_type)},
                         {"actor", actor},
                         {"action", action},
                         {"timestamp", timestamp}};
        if (duration_seconds)
            j["duration_seconds"] = *duration_seconds;
        j["success"] = success;
        j["details"] = details.is_null() ? nlohmann::json::object() : details;
        return j;
    }

    Result<AuditEvent> AuditEvent::from_json(const nlohmann::json &j)
    {
        try
        {
            auto type = event_type_from_string(j.at("event_type").get<std::string>());
            if (!type)
                return std::unexpected(type.error());

            AuditEvent event;
            event.event_type = *type;
            event.actor = j.value("actor", "");
            event.action = j.value("action", "");
            event.timestamp = j.at("timestamp").get<std::string>();
            if (j.contains("duration_seconds") && j["duration_seconds"].is_number())
                event.duration_seconds = j["duration_seconds"].get<double>();
            event.success = j.value("success", true);
            if (j.contains("details") && j["details"].is_object())
                event.details = j["details"];
            return event;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(TetherError::parsing(std::format("Invalid audit event: {}", e.what())));
        }
    }

    JsonlAuditLog::JsonlAuditLog(std::filesystem::path path) : path_(std::move(path)) {}

    JsonlAuditLog::~JsonlAuditLog()
    {
        if (fd_ >= 0)
            ::close(fd_);
    }

    Result<void> JsonlAuditLog::ensure_open()
    {
        if (fd_ >= 0)
            return {};

        std::error_code ec;
        if (path_.has_parent_path())
        {
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec)
            {
                return std::unexpected(TetherError::audit(std::format(
                    "Unable to create audit directory {}: {}", path_.parent_path().string(), ec.message())));
            }
        }

        fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0640);
        if (fd_ < 0)
        {
            return std::unexpected(TetherError::audit(std::format(
                "Unable to open audit log {}: {}", path_.string(), std::strerror(errno))));
        }
        return {};
    }

    Result<void> JsonlAuditLog::append(const AuditEvent &event)
    {
        // ensure_ascii=false keeps UTF-8 as-is; invalid sequences are replaced, never thrown
        std::string line = event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        line.push_back('\n');

        {
            std::lock_guard lock(mutex_);
            if (auto opened = ensure_open(); !opened)
                return opened;

            ssize_t written = -1;
            do
            {
                written = ::write(fd_, line.data(), line.size());
            } while (written < 0 && errno == EINTR);

            if (written < 0)
            {
                return std::unexpected(TetherError::audit(std::format(
                    "Audit write to {} failed: {}", path_.string(), std::strerror(errno))));
            }
            if (static_cast<std::size_t>(written) != line.size())
            {
                return std::unexpected(TetherError::audit(std::format(
                    "Short audit write to {} ({} of {} bytes)", path_.string(), written, line.size())));
            }
        }

        spdlog::info("AUDIT {} action={} actor={} success={}",
                     event_type_to_string(event.event_type), event.action, event.actor, event.success);
        return {};
    }

    Result<std::vector<AuditEvent>> JsonlAuditLog::read_all(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::unexpected(TetherError::io("Unable to open audit log: " + path.string()));
        }

        std::vector<AuditEvent> events;
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line))
        {
            ++line_no;
            if (line.empty())
                continue;
            nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
            if (j.is_discarded())
            {
                return std::unexpected(TetherError::parsing(std::format(
                    "{}:{}: audit line is not valid JSON", path.string(), line_no)));
            }
            auto event = AuditEvent::from_json(j);
            if (!event)
                return std::unexpected(event.error());
            events.push_back(std::move(*event));
        }
        return events;
    }

    void append_or_warn(AuditSink &sink, const AuditEvent &event)
    {
        if (auto res = sink.append(event); !res)
        {
            spdlog::error("audit append failed for {} {}: {}",
                          event_type_to_string(event.event_type), event.action, res.error().what());
        }
    }

} // namespace tether
