/**
 * ascmedia - Replaces unfinished remote assets with the local file at the same position.
 *
 * Remote and local items are correlated by position, never by name. A group whose
 * local file count differs from its remote item count is refused as a whole.
 */
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "ascmedia/asset_index.hpp"
#include "ascmedia/logger.hpp"
#include "ascmedia/media_api.hpp"
#include "ascmedia/reorder_coordinator.hpp"
#include "ascmedia/state_verifier.hpp"
#include "ascmedia/summary.hpp"
#include "ascmedia/upload_pipeline.hpp"

namespace ascmedia
{

    struct RepairTask
    {
        const ItemStatus *item{};
        const LocalAssetFile *file{};
    };

    struct SetRepair
    {
        const SetStatus *set{};
        std::vector<RepairTask> tasks;
    };

    struct CardinalityConflict
    {
        GroupKey key;
        std::size_t remote_items{};
        std::size_t local_files{};
    };

    struct RepairPlan
    {
        std::vector<SetRepair> sets;
        std::vector<CardinalityConflict> conflicts;
        std::size_t unmatched{}; // items whose group has no local folder

        std::size_t task_count() const;
    };

    // Pure matching step; the report and index must outlive the plan.
    RepairPlan plan_repair(const VerifyReport &report, const AssetIndex &index);

    class RepairCoordinator
    {
    public:
        RepairCoordinator(MediaApi &api, UploadPipeline &pipeline, ReorderCoordinator &reorder, Logger &logger,
                          std::ostream &out);

        // Conflicts are recorded as failures and unmatched items as skipped; every other
        // task is attempted. Each touched set gets one reorder restoring its positions.
        OperationSummary execute(const RepairPlan &plan);

    private:
        void repair_set(const SetRepair &repair, OperationSummary &summary);

        MediaApi &api_;
        UploadPipeline &pipeline_;
        ReorderCoordinator &reorder_;
        Logger &logger_;
        std::ostream &out_;
    };

} // namespace ascmedia
