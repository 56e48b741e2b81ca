/**
 * ascmedia - Pushes the intended item order of a set to the remote API.
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "ascmedia/logger.hpp"
#include "ascmedia/media_api.hpp"

namespace ascmedia
{

    class ReorderCoordinator
    {
    public:
        ReorderCoordinator(MediaApi &api, Logger &logger);

        // One relationship update replacing the whole order. Calls for the same set are
        // serialized. Returns false without a remote call when the list is empty.
        bool apply(AssetKind kind, const std::string &set_id, const std::vector<std::string> &ordered_asset_ids);

    private:
        std::mutex &lock_for(const std::string &set_id);

        MediaApi &api_;
        Logger &logger_;
        std::mutex locks_mutex_;
        std::map<std::string, std::unique_ptr<std::mutex>> set_locks_;
    };

    // Keeps `current` minus `appended`, then `appended` in the given order. Appended IDs the
    // set no longer lists are dropped.
    std::vector<std::string> order_with_appended(const std::vector<std::string> &current,
                                                 const std::vector<std::string> &appended);

    // Keeps `current` minus the placed IDs in listed order, then puts each placed ID at its
    // zero-based index (clamped to the end). Placed IDs the set no longer lists are dropped.
    std::vector<std::string> order_with_replacements(const std::vector<std::string> &current,
                                                     std::vector<std::pair<std::size_t, std::string>> placed);

} // namespace ascmedia
