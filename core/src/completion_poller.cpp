#include "ascmedia/completion_poller.hpp"

#include <thread>
#include <utility>

#include "ascmedia/error_codes.hpp"

namespace ascmedia
{

    std::string_view to_string(PollOutcome outcome) noexcept
    {
        switch (outcome)
        {
        case PollOutcome::Complete:
            return "complete";
        case PollOutcome::Failed:
            return "failed";
        case PollOutcome::TimedOut:
            break;
        }
        return "timed out";
    }

    CompletionPoller::CompletionPoller(MediaApi &api, Logger &logger, PollOptions options, Sleeper sleeper)
        : api_(api), logger_(logger), options_(options), sleeper_(std::move(sleeper))
    {
        if (!sleeper_)
        {
            sleeper_ = [](std::chrono::milliseconds delay)
            { std::this_thread::sleep_for(delay); };
        }
    }

    PollResult CompletionPoller::wait(AssetKind kind, const std::string &asset_id)
    {
        PollResult result;
        result.asset.id = asset_id;
        result.asset.kind = kind;
        std::chrono::milliseconds waited{0};

        while (true)
        {
            ++result.polls;
            try
            {
                result.asset = api_.get_asset(kind, asset_id);
                if (result.asset.state == AssetState::Complete)
                {
                    result.outcome = PollOutcome::Complete;
                    break;
                }
                if (result.asset.state == AssetState::Failed)
                {
                    result.outcome = PollOutcome::Failed;
                    break;
                }
            }
            catch (const Error &error)
            {
                if (!error.retryable())
                {
                    throw;
                }
                logger_.warn("upload", "Polling ", asset_id, " failed: ", error.what());
            }

            if (waited >= options_.timeout)
            {
                result.outcome = PollOutcome::TimedOut;
                break;
            }
            sleeper_(options_.interval);
            waited += options_.interval.count() > 0 ? options_.interval : std::chrono::milliseconds(1);
        }

        logger_.log("upload", "Asset ", asset_id, " ", to_string(result.outcome), " after ", result.polls,
                    " polls (", to_string(result.asset.state), ")");
        return result;
    }

} // namespace ascmedia
