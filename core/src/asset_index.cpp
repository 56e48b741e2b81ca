#include "ascmedia/asset_index.hpp"

#include <algorithm>
#include <set>
#include <system_error>

#include "ascmedia/display_types.hpp"
#include "ascmedia/error_codes.hpp"

namespace ascmedia
{

    namespace
    {

        // Sorted names of the entries of one directory that satisfy the predicate.
        template <typename Predicate>
        std::vector<std::string> sorted_entries(const std::filesystem::path &directory, Predicate predicate)
        {
            std::vector<std::string> names;
            std::error_code ec;
            for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
            {
                if (predicate(*it))
                {
                    names.push_back(it->path().filename().string());
                }
            }
            if (ec)
            {
                throw Error(ErrorCode::FileIo, "Cannot list '" + directory.string() + "': " + ec.message());
            }
            std::sort(names.begin(), names.end());
            return names;
        }

        bool is_directory(const std::filesystem::directory_entry &entry)
        {
            std::error_code ec;
            return entry.is_directory(ec);
        }

        bool is_regular_file(const std::filesystem::directory_entry &entry)
        {
            std::error_code ec;
            return entry.is_regular_file(ec);
        }

        void scan_display_type(AssetIndex &index, const std::string &locale, const std::string &display_type,
                               const std::filesystem::path &directory)
        {
            AssetGroup group{locale, display_type, {}, {}};
            const bool accepts_previews = preview_type_for_display_type(display_type).has_value();

            for (const auto &file_name : sorted_entries(directory, is_regular_file))
            {
                if (file_name.starts_with("."))
                {
                    continue;
                }
                const auto path = directory / file_name;
                const auto kind = kind_for_file_name(file_name);
                if (!kind)
                {
                    index.warnings.push_back(ScanWarning{
                        path, "[" + locale + "/" + display_type + "] Skipping '" + file_name + "': unsupported file type."});
                    continue;
                }
                if (*kind == AssetKind::Preview && !accepts_previews)
                {
                    index.warnings.push_back(ScanWarning{
                        path, "[" + locale + "/" + display_type + "] Skipping '" + file_name +
                                  "': no preview support for this display type."});
                    continue;
                }

                auto &bucket = *kind == AssetKind::Screenshot ? group.screenshots : group.previews;
                LocalAssetFile file;
                file.path = path;
                file.locale = locale;
                file.display_type = display_type;
                file.kind = *kind;
                file.position = bucket.size() + 1;
                file.file_name = file_name;
                std::error_code size_ec;
                file.file_size = std::filesystem::file_size(path, size_ec);
                if (size_ec)
                {
                    throw Error(ErrorCode::FileIo, "Cannot read file at '" + path.string() + "'.");
                }
                bucket.push_back(std::move(file));
            }

            if (group.screenshots.empty() && group.previews.empty())
            {
                return;
            }
            index.total_screenshots += group.screenshots.size();
            index.total_previews += group.previews.size();
            index.groups.push_back(std::move(group));
        }

    } // namespace

    std::size_t AssetIndex::locale_count() const
    {
        std::set<std::string> locales;
        for (const auto &group : groups)
        {
            locales.insert(group.locale);
        }
        return locales.size();
    }

    const AssetGroup *AssetIndex::find(const std::string &locale, const std::string &display_type) const
    {
        const auto it = std::find_if(groups.begin(), groups.end(), [&](const AssetGroup &group)
                                     { return group.locale == locale && group.display_type == display_type; });
        return it == groups.end() ? nullptr : &*it;
    }

    const std::vector<LocalAssetFile> *AssetIndex::files(const GroupKey &key) const
    {
        const auto *group = find(key.locale, key.display_type);
        return group ? &group->files(key.kind) : nullptr;
    }

    const LocalAssetFile *AssetIndex::file_at(const GroupKey &key, std::size_t position) const
    {
        const auto *list = files(key);
        if (!list || position == 0 || position > list->size())
        {
            return nullptr;
        }
        return &(*list)[position - 1];
    }

    AssetIndex scan_media_folder(const std::filesystem::path &root)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec))
        {
            throw Error(ErrorCode::NotFound, "Folder not found at '" + root.string() + "'.");
        }

        AssetIndex index;
        index.root = root;
        for (const auto &locale : sorted_entries(root, is_directory))
        {
            if (locale.starts_with("."))
            {
                continue;
            }
            const auto locale_path = root / locale;
            for (const auto &display_type : sorted_entries(locale_path, is_directory))
            {
                if (display_type.starts_with("."))
                {
                    continue;
                }
                if (!is_known_display_type(display_type))
                {
                    index.warnings.push_back(ScanWarning{
                        locale_path / display_type,
                        "[" + locale + "] Skipping unknown display type '" + display_type + "'."});
                    continue;
                }
                scan_display_type(index, locale, display_type, locale_path / display_type);
            }
        }
        return index;
    }

} // namespace ascmedia
