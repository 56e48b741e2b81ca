/**
 * ascmedia - Local and remote media asset model.
 */
#pragma once

#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ascmedia
{

    enum class AssetKind : std::uint8_t
    {
        Screenshot,
        Preview
    };

    std::string_view to_string(AssetKind kind) noexcept;

    enum class AssetState : std::uint8_t
    {
        AwaitingUpload,
        UploadComplete,
        Complete,
        Failed,
        Unknown
    };

    std::string_view to_string(AssetState state) noexcept;
    AssetState asset_state_from_string(std::string_view value) noexcept;

    // Identifies one remote set: a locale, a display-type folder name and the kind of media it holds.
    struct GroupKey
    {
        std::string locale;
        std::string display_type;
        AssetKind kind{AssetKind::Screenshot};

        auto operator<=>(const GroupKey &) const = default;
    };

    std::string describe(const GroupKey &key);

    struct LocalAssetFile
    {
        std::filesystem::path path;
        std::string locale;
        std::string display_type;
        AssetKind kind{AssetKind::Screenshot};
        std::size_t position{}; // 1-based, alphabetical within locale/display type/kind
        std::string file_name;
        std::uint64_t file_size{};

        GroupKey key() const { return GroupKey{locale, display_type, kind}; }
    };

    struct ImageAsset
    {
        std::string template_url;
        std::uint32_t width{};
        std::uint32_t height{};
    };

    struct RemoteAsset
    {
        std::string id;
        AssetKind kind{AssetKind::Screenshot};
        std::string file_name;
        std::uint64_t file_size{};
        std::string checksum;
        AssetState state{AssetState::Unknown};
        std::vector<std::string> state_errors;
        std::optional<ImageAsset> image;
        std::optional<std::string> video_url;
    };

    struct RemoteAssetSet
    {
        std::string id;
        std::string locale;
        std::string display_type;
        AssetKind kind{AssetKind::Screenshot};
        std::vector<RemoteAsset> items;

        GroupKey key() const { return GroupKey{locale, display_type, kind}; }
    };

    struct UploadHeader
    {
        std::string name;
        std::string value;
    };

    struct UploadOperation
    {
        std::string method{"PUT"};
        std::string url;
        std::uint64_t offset{};
        std::uint64_t length{};
        std::vector<UploadHeader> headers;
    };

    struct ReservedAsset
    {
        std::string id;
        std::vector<UploadOperation> operations;
    };

} // namespace ascmedia
