#include "ascmedia/reorder_coordinator.hpp"

#include <algorithm>
#include <set>

#include "ascmedia/error_codes.hpp"

namespace ascmedia
{

    ReorderCoordinator::ReorderCoordinator(MediaApi &api, Logger &logger)
        : api_(api), logger_(logger) {}

    std::mutex &ReorderCoordinator::lock_for(const std::string &set_id)
    {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        auto &slot = set_locks_[set_id];
        if (!slot)
        {
            slot = std::make_unique<std::mutex>();
        }
        return *slot;
    }

    bool ReorderCoordinator::apply(AssetKind kind, const std::string &set_id,
                                   const std::vector<std::string> &ordered_asset_ids)
    {
        if (set_id.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "Cannot reorder a set without an ID.");
        }
        if (ordered_asset_ids.empty())
        {
            return false;
        }
        std::set<std::string> seen;
        for (const auto &id : ordered_asset_ids)
        {
            if (id.empty() || !seen.insert(id).second)
            {
                throw Error(ErrorCode::InvalidArgument, "Order for set " + set_id + " has an empty or repeated ID.");
            }
        }

        std::lock_guard<std::mutex> lock(lock_for(set_id));
        api_.reorder_set(kind, set_id, ordered_asset_ids);
        logger_.log("reorder", "Set ", set_id, " now holds ", ordered_asset_ids.size(), " ", to_string(kind), "s");
        return true;
    }

    std::vector<std::string> order_with_appended(const std::vector<std::string> &current,
                                                 const std::vector<std::string> &appended)
    {
        const std::set<std::string> listed(current.begin(), current.end());
        const std::set<std::string> fresh(appended.begin(), appended.end());

        std::vector<std::string> order;
        order.reserve(current.size());
        for (const auto &id : current)
        {
            if (!fresh.contains(id))
            {
                order.push_back(id);
            }
        }
        for (const auto &id : appended)
        {
            if (listed.contains(id))
            {
                order.push_back(id);
            }
        }
        return order;
    }

    std::vector<std::string> order_with_replacements(const std::vector<std::string> &current,
                                                     std::vector<std::pair<std::size_t, std::string>> placed)
    {
        const std::set<std::string> listed(current.begin(), current.end());
        std::set<std::string> moved;
        for (const auto &entry : placed)
        {
            moved.insert(entry.second);
        }

        std::vector<std::string> order;
        order.reserve(current.size());
        for (const auto &id : current)
        {
            if (!moved.contains(id))
            {
                order.push_back(id);
            }
        }

        // Ascending insertion keeps every earlier placement at its index.
        std::sort(placed.begin(), placed.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.first < rhs.first; });
        for (auto &[index, id] : placed)
        {
            if (!listed.contains(id))
            {
                continue;
            }
            const auto at = std::min(index, order.size());
            order.insert(order.begin() + static_cast<std::ptrdiff_t>(at), std::move(id));
        }
        return order;
    }

} // namespace ascmedia
