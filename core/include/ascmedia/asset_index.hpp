/**
 * ascmedia - Local media folder scanner.
 *
 * Layout: <root>/<locale>/<display type>/<files>. Screenshots (png, jpg, jpeg)
 * and previews (mp4, mov) are indexed separately and numbered from 1 in
 * case-sensitive file name order.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "ascmedia/media_types.hpp"

namespace ascmedia
{

    struct ScanWarning
    {
        std::filesystem::path path;
        std::string message;
    };

    struct AssetGroup
    {
        std::string locale;
        std::string display_type;
        std::vector<LocalAssetFile> screenshots;
        std::vector<LocalAssetFile> previews;

        const std::vector<LocalAssetFile> &files(AssetKind kind) const
        {
            return kind == AssetKind::Screenshot ? screenshots : previews;
        }
    };

    // Files found under <root>/<locale>/<display type>/, grouped and ordered by file name.
    struct AssetIndex
    {
        std::filesystem::path root;
        std::vector<AssetGroup> groups;
        std::vector<ScanWarning> warnings;
        std::size_t total_screenshots{};
        std::size_t total_previews{};

        bool empty() const noexcept { return groups.empty(); }
        std::size_t locale_count() const;
        const AssetGroup *find(const std::string &locale, const std::string &display_type) const;
        const std::vector<LocalAssetFile> *files(const GroupKey &key) const;
        const LocalAssetFile *file_at(const GroupKey &key, std::size_t position) const;
    };

    // Throws Error(NotFound) when root is not a directory; an empty tree yields an empty index.
    AssetIndex scan_media_folder(const std::filesystem::path &root);

} // namespace ascmedia
