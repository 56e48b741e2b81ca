#include "ascmedia/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

namespace ascmedia
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            // Appends, so one log file can follow several runs.
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            logger_ = std::make_shared<spdlog::logger>("ascmedia", std::move(sink));
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
            logger_->set_level(spdlog::level::info);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            spdlog::error("Cannot open log file '{}': {}", path->string(), ex.what());
            logger_.reset();
        }
    }

} // namespace ascmedia
