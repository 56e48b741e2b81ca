/**
 * ascmedia - Remote media API consumed by the sync engine.
 *
 * Implementations report failures by throwing ascmedia::Error:
 *   Transport        network failure or a retryable HTTP status
 *   NotFound         the set, asset or locale no longer exists
 *   Integrity        commit rejected because the checksum does not match
 *   ReserveRejected  the reservation was refused (quota, invalid set)
 * put_chunk() may be called from several threads at once; every other call is
 * issued from the command thread.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "ascmedia/media_types.hpp"

namespace ascmedia
{

    class MediaApi
    {
    public:
        virtual ~MediaApi() = default;

        // Every screenshot and preview set of the version; items are not loaded.
        virtual std::vector<RemoteAssetSet> list_sets(const std::string &version_id) = 0;

        // Items of one set in delivery order.
        virtual std::vector<RemoteAsset> list_assets(AssetKind kind, const std::string &set_id) = 0;

        virtual std::string create_set(const std::string &version_id, const std::string &locale,
                                       const std::string &display_type, AssetKind kind) = 0;

        virtual void delete_set(AssetKind kind, const std::string &set_id) = 0;

        virtual ReservedAsset reserve_asset(AssetKind kind, const std::string &set_id, const std::string &file_name,
                                            std::uint64_t file_size) = 0;

        virtual void put_chunk(const UploadOperation &operation, std::span<const std::byte> bytes) = 0;

        virtual RemoteAsset commit_asset(AssetKind kind, const std::string &asset_id, const std::string &checksum,
                                         bool uploaded) = 0;

        virtual RemoteAsset get_asset(AssetKind kind, const std::string &asset_id) = 0;

        virtual void delete_asset(AssetKind kind, const std::string &asset_id) = 0;

        virtual void reorder_set(AssetKind kind, const std::string &set_id,
                                 const std::vector<std::string> &ordered_asset_ids) = 0;

        virtual std::vector<std::byte> fetch_bytes(const std::string &url) = 0;
    };

} // namespace ascmedia
