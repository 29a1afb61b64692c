#include "renderxfer/worker/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace renderxfer::worker
{

    Logger::Logger(const std::optional<std::filesystem::path> &path, bool console)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (console)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true));
            }
            logger_ = std::make_shared<spdlog::logger>("worker", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            logger_->set_level(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            spdlog::warn("Logging disabled: {}", ex.what());
            logger_.reset();
        }
    }

    void Logger::event(std::string_view step, const nlohmann::json &metadata)
    {
        if (!logger_)
        {
            return;
        }
        logger_->info("[{}] {}", step, metadata.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    void Logger::error(std::string_view step, std::string_view message)
    {
        if (!logger_)
        {
            return;
        }
        logger_->error("[{}] {}", step, nlohmann::json{{"error", message}}.dump(-1, ' ', false,
                                                                                 nlohmann::json::error_handler_t::replace));
    }

    EventSink Logger::sink()
    {
        return EventSink{
            .log = [this](std::string_view step, const nlohmann::json &metadata)
            { event(step, metadata); },
            .log_error = [this](std::string_view step, std::string_view message)
            { error(step, message); },
        };
    }

} // namespace renderxfer::worker
