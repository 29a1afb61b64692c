/**
 * renderxfer - Structured event callback injected into the pipeline.
 */
#pragma once

#include <functional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace renderxfer
{

    struct EventSink
    {
        std::function<void(std::string_view step, const nlohmann::json &metadata)> log;
        std::function<void(std::string_view step, std::string_view message)> log_error;

        void emit(std::string_view step, const nlohmann::json &metadata = nlohmann::json::object()) const
        {
            if (log)
            {
                log(step, metadata);
            }
        }

        void emit_error(std::string_view step, std::string_view message) const
        {
            if (log_error)
            {
                log_error(step, message);
            }
        }
    };

} // namespace renderxfer
