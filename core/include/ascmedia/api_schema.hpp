/**
 * ascmedia - JSON:API documents exchanged with the App Store Connect media endpoints.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ascmedia/media_types.hpp"

namespace ascmedia
{

    void to_json(nlohmann::json &json, const UploadHeader &header);
    void from_json(const nlohmann::json &json, UploadHeader &header);

    void to_json(nlohmann::json &json, const UploadOperation &operation);
    void from_json(const nlohmann::json &json, UploadOperation &operation);

    void to_json(nlohmann::json &json, const ImageAsset &image);
    void from_json(const nlohmann::json &json, ImageAsset &image);

} // namespace ascmedia

namespace ascmedia::schema
{

    std::string_view asset_resource_type(AssetKind kind) noexcept;
    std::string_view set_resource_type(AssetKind kind) noexcept;
    std::string_view set_relationship_name(AssetKind kind) noexcept;

    RemoteAsset decode_asset(const nlohmann::json &resource, AssetKind kind);

    // Reservation response: the new asset ID plus its presigned upload operations.
    ReservedAsset decode_reservation(const nlohmann::json &document);

    // Returns nullopt for sets whose display/preview type is absent.
    std::optional<RemoteAssetSet> decode_set(const nlohmann::json &resource, AssetKind kind, const std::string &locale);

    struct Localization
    {
        std::string id;
        std::string locale;
    };

    std::vector<Localization> decode_localizations(const nlohmann::json &document);

    nlohmann::json encode_set_create(AssetKind kind, const std::string &localization_id,
                                     const std::string &display_type);

    nlohmann::json encode_reserve(AssetKind kind, const std::string &set_id, const std::string &file_name,
                                  std::uint64_t file_size);

    nlohmann::json encode_commit(AssetKind kind, const std::string &asset_id, const std::string &checksum,
                                 bool uploaded);

    nlohmann::json encode_reorder(AssetKind kind, const std::vector<std::string> &ordered_asset_ids);

    std::optional<std::string> next_link(const nlohmann::json &document);

    // Joins errors[].detail (or title) of an error document; empty when there is none.
    std::string error_summary(const nlohmann::json &document);

} // namespace ascmedia::schema
