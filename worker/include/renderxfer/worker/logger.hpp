#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "renderxfer/event_sink.hpp"

namespace renderxfer::worker
{

    // One line per event: "[step] {metadata}".
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path, bool console = true);

        void event(std::string_view step, const nlohmann::json &metadata = nlohmann::json::object());

        void error(std::string_view step, std::string_view message);

        EventSink sink();

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace renderxfer::worker
