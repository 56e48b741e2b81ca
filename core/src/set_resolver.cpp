#include "ascmedia/set_resolver.hpp"

#include <algorithm>
#include <utility>

#include "ascmedia/error_codes.hpp"

namespace ascmedia
{

    SetResolver::SetResolver(MediaApi &api, std::string version_id, Logger &logger)
        : api_(api), version_id_(std::move(version_id)), logger_(logger) {}

    const std::vector<RemoteAssetSet> &SetResolver::refresh()
    {
        sets_ = api_.list_sets(version_id_);
        loaded_ = true;
        logger_.log("api", "Version ", version_id_, " has ", sets_.size(), " media sets");
        return sets_;
    }

    const RemoteAssetSet *SetResolver::find(const GroupKey &key) const
    {
        const auto it = std::find_if(sets_.begin(), sets_.end(),
                                     [&](const RemoteAssetSet &set)
                                     { return set.key() == key; });
        return it == sets_.end() ? nullptr : &*it;
    }

    ResolvedSet SetResolver::resolve_or_create(const GroupKey &key)
    {
        if (!loaded_)
        {
            refresh();
        }
        if (const auto *existing = find(key))
        {
            return ResolvedSet{existing->id, false};
        }

        // Another run may have created the set since the last listing.
        refresh();
        if (const auto *existing = find(key))
        {
            return ResolvedSet{existing->id, false};
        }

        auto id = api_.create_set(version_id_, key.locale, key.display_type, key.kind);
        if (id.empty())
        {
            throw Error(ErrorCode::InvalidResponse, "Set creation for " + describe(key) + " returned no ID.");
        }
        logger_.log("api", "Created set ", id, " for ", describe(key));

        RemoteAssetSet created;
        created.id = id;
        created.locale = key.locale;
        created.display_type = key.display_type;
        created.kind = key.kind;
        sets_.push_back(std::move(created));
        return ResolvedSet{std::move(id), true};
    }

    std::vector<RemoteAssetSet> fetch_sets_with_items(MediaApi &api, const std::string &version_id, Logger &logger,
                                                      std::vector<UnlistedSet> *unlisted)
    {
        auto listed = api.list_sets(version_id);
        std::vector<RemoteAssetSet> result;
        result.reserve(listed.size());
        for (auto &set : listed)
        {
            try
            {
                set.items = api.list_assets(set.kind, set.id);
            }
            catch (const Error &error)
            {
                if (error.code() == ErrorCode::NotFound)
                {
                    logger.warn("api", "Set ", set.id, " vanished: ", error.what());
                }
                else
                {
                    logger.warn("api", "Listing set ", set.id, " failed: ", error.what());
                }
                if (unlisted)
                {
                    unlisted->push_back(UnlistedSet{set.id, set.key(), error.code(), error.what()});
                }
                continue;
            }
            result.push_back(std::move(set));
        }
        std::sort(result.begin(), result.end(), [](const RemoteAssetSet &lhs, const RemoteAssetSet &rhs)
                  { return lhs.key() < rhs.key(); });
        return result;
    }

} // namespace ascmedia
