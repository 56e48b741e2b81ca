#include "ascmedia/repair_coordinator.hpp"

#include <utility>

#include "ascmedia/error_codes.hpp"

namespace ascmedia
{

    std::size_t RepairPlan::task_count() const
    {
        std::size_t count = 0;
        for (const auto &set : sets)
        {
            count += set.tasks.size();
        }
        return count;
    }

    RepairPlan plan_repair(const VerifyReport &report, const AssetIndex &index)
    {
        RepairPlan plan;
        for (const auto &set : report.sets)
        {
            if (set.all_complete())
            {
                continue;
            }
            const auto pending = set.items.size() - set.complete_count();
            const auto *files = index.files(set.key);
            if (!files || files->empty())
            {
                plan.unmatched += pending;
                continue;
            }
            if (files->size() != set.items.size())
            {
                plan.conflicts.push_back(CardinalityConflict{set.key, set.items.size(), files->size()});
                continue;
            }

            SetRepair repair{&set, {}};
            for (const auto &item : set.items)
            {
                if (item.needs_repair())
                {
                    repair.tasks.push_back(RepairTask{&item, index.file_at(set.key, item.position)});
                }
            }
            plan.sets.push_back(std::move(repair));
        }
        return plan;
    }

    RepairCoordinator::RepairCoordinator(MediaApi &api, UploadPipeline &pipeline, ReorderCoordinator &reorder,
                                         Logger &logger, std::ostream &out)
        : api_(api), pipeline_(pipeline), reorder_(reorder), logger_(logger), out_(out) {}

    OperationSummary RepairCoordinator::execute(const RepairPlan &plan)
    {
        OperationSummary summary;
        for (const auto &conflict : plan.conflicts)
        {
            const auto message = std::to_string(conflict.remote_items) + " remote items but " +
                                 std::to_string(conflict.local_files) +
                                 " local files; refusing to match by position.";
            out_ << describe(conflict.key) << ": " << message << std::endl;
            logger_.warn("repair", describe(conflict.key), ": ", message);
            summary.record_failure(describe(conflict.key), ErrorCode::CardinalityMismatch, message);
        }
        summary.skipped += plan.unmatched;

        for (const auto &repair : plan.sets)
        {
            repair_set(repair, summary);
        }
        return summary;
    }

    void RepairCoordinator::repair_set(const SetRepair &repair, OperationSummary &summary)
    {
        const auto &set = *repair.set;
        std::vector<std::pair<std::size_t, std::string>> replacements;
        bool touched = false;

        for (const auto &task : repair.tasks)
        {
            const auto &item = *task.item;
            const auto subject = describe(set.key) + " #" + std::to_string(item.position);
            out_ << "[" << set.key.locale << "] " << set.key.display_type << " #" << item.position << ": "
                 << "Deleting... " << std::flush;

            try
            {
                api_.delete_asset(set.key.kind, item.asset_id);
            }
            catch (const Error &error)
            {
                // Nothing changed remotely; the item keeps its place.
                out_ << "Failed: " << error.what() << std::endl;
                logger_.warn("repair", "Delete of ", item.asset_id, " failed: ", error.what());
                summary.record_failure(subject, error.code(), error.what());
                continue;
            }
            touched = true;
            logger_.log("repair", "Deleted ", item.asset_id, " from set ", set.set_id);

            out_ << "Uploading " << task.file->file_name << "... " << std::flush;
            try
            {
                const auto replacement = pipeline_.upload(*task.file, set.set_id);
                replacements.emplace_back(item.position - 1, replacement.id);
                logger_.log("repair", "Replaced ", item.asset_id, " with ", replacement.id, " at position ",
                            item.position);
                out_ << "Done." << std::endl;
                ++summary.succeeded;
            }
            catch (const Error &error)
            {
                out_ << "Failed: " << error.what() << std::endl;
                logger_.warn("repair", "Re-upload of ", task.file->path.string(), " failed: ", error.what());
                summary.record_failure(subject, error.code(), error.what());
            }
        }

        if (!touched)
        {
            return;
        }
        try
        {
            // The set may have changed since it was verified; order what it holds now.
            const auto current = api_.list_assets(set.key.kind, set.set_id);
            std::vector<std::string> current_ids;
            current_ids.reserve(current.size());
            for (const auto &asset : current)
            {
                current_ids.push_back(asset.id);
            }
            const auto order = order_with_replacements(current_ids, std::move(replacements));
            if (reorder_.apply(set.key.kind, set.set_id, order))
            {
                out_ << describe(set.key) << ": order restored." << std::endl;
            }
        }
        catch (const Error &error)
        {
            out_ << describe(set.key) << ": reorder failed: " << error.what() << std::endl;
            summary.record_failure(describe(set.key) + " reorder", error.code(), error.what());
        }
    }

} // namespace ascmedia
