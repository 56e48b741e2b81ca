/**
 * ascmedia - Maps (locale, display type, kind) keys onto remote set IDs.
 */
#pragma once

#include <string>
#include <vector>

#include "ascmedia/error_codes.hpp"
#include "ascmedia/logger.hpp"
#include "ascmedia/media_api.hpp"
#include "ascmedia/media_types.hpp"

namespace ascmedia
{

    struct ResolvedSet
    {
        std::string id;
        bool created{};
    };

    // A set listed by the version whose items could not be read. NotFound means
    // it was deleted out of band; any other code is a failed listing.
    struct UnlistedSet
    {
        std::string set_id;
        GroupKey key;
        ErrorCode code{ErrorCode::NotFound};
        std::string message;

        bool vanished() const noexcept { return code == ErrorCode::NotFound; }
    };

    class SetResolver
    {
    public:
        SetResolver(MediaApi &api, std::string version_id, Logger &logger);

        const std::vector<RemoteAssetSet> &refresh();
        const std::vector<RemoteAssetSet> &sets() const noexcept { return sets_; }

        // nullptr when the version has no set for the key; an existing empty set is returned as-is.
        const RemoteAssetSet *find(const GroupKey &key) const;

        // Creates the set only if a fresh listing still does not contain it.
        ResolvedSet resolve_or_create(const GroupKey &key);

    private:
        MediaApi &api_;
        std::string version_id_;
        Logger &logger_;
        std::vector<RemoteAssetSet> sets_;
        bool loaded_{};
    };

    // Lists every set of the version with its items. A set whose items cannot be
    // read is reported through `unlisted` (when given) and left out of the result.
    std::vector<RemoteAssetSet> fetch_sets_with_items(MediaApi &api, const std::string &version_id, Logger &logger,
                                                      std::vector<UnlistedSet> *unlisted = nullptr);

} // namespace ascmedia
