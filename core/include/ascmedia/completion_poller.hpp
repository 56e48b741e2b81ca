/**
 * ascmedia - Bounded wait for server-side processing of a committed asset.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "ascmedia/logger.hpp"
#include "ascmedia/media_api.hpp"
#include "ascmedia/media_types.hpp"

namespace ascmedia
{

    enum class PollOutcome
    {
        Complete,
        TimedOut,
        Failed
    };

    std::string_view to_string(PollOutcome outcome) noexcept;

    struct PollResult
    {
        PollOutcome outcome{PollOutcome::TimedOut};
        RemoteAsset asset; // last state observed
        std::size_t polls{};
    };

    struct PollOptions
    {
        std::chrono::milliseconds interval{std::chrono::seconds(5)};
        std::chrono::milliseconds timeout{std::chrono::minutes(5)};
    };

    class CompletionPoller
    {
    public:
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        // The default sleeper blocks the calling thread.
        CompletionPoller(MediaApi &api, Logger &logger, PollOptions options, Sleeper sleeper = {});

        // Polls until the asset is Complete or Failed, or the waited time reaches the timeout.
        // Transport errors count as an inconclusive poll; other errors propagate.
        PollResult wait(AssetKind kind, const std::string &asset_id);

    private:
        MediaApi &api_;
        Logger &logger_;
        PollOptions options_;
        Sleeper sleeper_;
    };

} // namespace ascmedia
