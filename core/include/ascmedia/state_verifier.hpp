/**
 * ascmedia - Read-only processing-state report for every media set of a version.
 */
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "ascmedia/logger.hpp"
#include "ascmedia/media_api.hpp"
#include "ascmedia/media_types.hpp"
#include "ascmedia/set_resolver.hpp"
#include "ascmedia/summary.hpp"

namespace ascmedia
{

    struct ItemStatus
    {
        std::size_t position{}; // 1-based remote position
        std::string asset_id;
        std::string file_name;
        AssetState state{AssetState::Unknown};
        std::vector<std::string> errors;

        bool complete() const noexcept { return state == AssetState::Complete; }
        bool failed() const noexcept { return state == AssetState::Failed; }
        // Neither finished nor failed; whether that is abnormal is the operator's call.
        bool stuck() const noexcept { return !complete() && !failed(); }
        bool needs_repair() const noexcept { return !complete(); }
    };

    struct SetStatus
    {
        std::string set_id;
        GroupKey key;
        std::vector<ItemStatus> items;

        std::size_t complete_count() const;
        bool all_complete() const { return complete_count() == items.size(); }
    };

    struct VerifyReport
    {
        std::vector<SetStatus> sets;
        std::vector<UnlistedSet> unlisted;

        bool empty() const noexcept { return sets.empty(); }
        std::size_t total() const;
        std::size_t complete() const;
        std::size_t stuck() const;
        std::size_t failed() const;
        std::size_t needs_repair() const { return total() - complete(); }
        bool all_complete() const { return needs_repair() == 0; }
    };

    class StateVerifier
    {
    public:
        StateVerifier(MediaApi &api, Logger &logger);

        // Issues list calls only. Sets without items are left out of the report.
        VerifyReport verify(const std::string &version_id);

    private:
        MediaApi &api_;
        Logger &logger_;
    };

    SetStatus set_status(const RemoteAssetSet &set);

    // Compact "n/n complete" line for finished sets, one line per item otherwise.
    void print_report(const VerifyReport &report, std::ostream &out, bool after_repair = false);

    // Outcome of a verify that repairs nothing: complete items succeed, unfinished items
    // and vanished sets are skipped, sets that could not be listed fail.
    OperationSummary verify_summary(const VerifyReport &report);

} // namespace ascmedia
