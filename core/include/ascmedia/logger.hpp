/**
 * ascmedia - Tagged file log for sync and API activity.
 *
 * Without a path every call is a no-op. Arguments are formatted with "{}" and
 * concatenated, so log("upload", "Reserved ", id) yields "[upload] Reserved <id>".
 */
#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace ascmedia
{

    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        template <typename... Args>
        void log(const std::string &tag, Args &&...args)
        {
            emit(spdlog::level::info, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(const std::string &tag, Args &&...args)
        {
            emit(spdlog::level::warn, tag, std::forward<Args>(args)...);
        }

        bool enabled() const noexcept { return logger_ != nullptr; }

    private:
        template <typename... Args>
        void emit(spdlog::level::level_enum level, const std::string &tag, Args &&...args)
        {
            if (!logger_ || !logger_->should_log(level))
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer text;
            (spdlog::fmt_lib::format_to(std::back_inserter(text), "{}", std::forward<Args>(args)), ...);
            logger_->log(level, "[{}] {}", tag, std::string(text.data(), text.size()));
        }

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace ascmedia
