#include "ascmedia/display_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace ascmedia
{

    namespace
    {

        constexpr std::array<std::string_view, 33> kScreenshotDisplayTypes{{
            "APP_IPHONE_67",
            "APP_IPHONE_61",
            "APP_IPHONE_65",
            "APP_IPHONE_58",
            "APP_IPHONE_55",
            "APP_IPHONE_47",
            "APP_IPHONE_40",
            "APP_IPHONE_35",
            "APP_IPAD_PRO_3GEN_129",
            "APP_IPAD_PRO_3GEN_11",
            "APP_IPAD_PRO_129",
            "APP_IPAD_105",
            "APP_IPAD_97",
            "APP_DESKTOP",
            "APP_WATCH_ULTRA",
            "APP_WATCH_SERIES_10",
            "APP_WATCH_SERIES_7",
            "APP_WATCH_SERIES_4",
            "APP_WATCH_SERIES_3",
            "APP_APPLE_TV",
            "APP_APPLE_VISION_PRO",
            "IMESSAGE_APP_IPHONE_67",
            "IMESSAGE_APP_IPHONE_61",
            "IMESSAGE_APP_IPHONE_65",
            "IMESSAGE_APP_IPHONE_58",
            "IMESSAGE_APP_IPHONE_55",
            "IMESSAGE_APP_IPHONE_47",
            "IMESSAGE_APP_IPHONE_40",
            "IMESSAGE_APP_IPAD_PRO_3GEN_129",
            "IMESSAGE_APP_IPAD_PRO_3GEN_11",
            "IMESSAGE_APP_IPAD_PRO_129",
            "IMESSAGE_APP_IPAD_105",
            "IMESSAGE_APP_IPAD_97",
        }};

        constexpr std::array<std::string_view, 16> kPreviewTypes{{
            "IPHONE_67",
            "IPHONE_61",
            "IPHONE_65",
            "IPHONE_58",
            "IPHONE_55",
            "IPHONE_47",
            "IPHONE_40",
            "IPHONE_35",
            "IPAD_PRO_3GEN_129",
            "IPAD_PRO_3GEN_11",
            "IPAD_PRO_129",
            "IPAD_105",
            "IPAD_97",
            "DESKTOP",
            "APPLE_TV",
            "APPLE_VISION_PRO",
        }};

        constexpr std::array<std::string_view, 3> kImageExtensions{{"png", "jpg", "jpeg"}};
        constexpr std::array<std::string_view, 2> kVideoExtensions{{"mp4", "mov"}};

        template <std::size_t N>
        bool contains(const std::array<std::string_view, N> &values, std::string_view value)
        {
            return std::find(values.begin(), values.end(), value) != values.end();
        }

    } // namespace

    bool is_known_display_type(std::string_view display_type) noexcept
    {
        return contains(kScreenshotDisplayTypes, display_type);
    }

    bool is_screenshot_only(std::string_view display_type) noexcept
    {
        return display_type.starts_with("APP_WATCH_") || display_type.starts_with("IMESSAGE_");
    }

    std::optional<std::string> preview_type_for_display_type(std::string_view display_type)
    {
        if (is_screenshot_only(display_type) || !display_type.starts_with("APP_"))
        {
            return std::nullopt;
        }
        const auto preview = display_type.substr(4);
        if (!contains(kPreviewTypes, preview))
        {
            return std::nullopt;
        }
        return std::string(preview);
    }

    std::string display_type_for_preview_type(std::string_view preview_type)
    {
        return "APP_" + std::string(preview_type);
    }

    std::string lowercase_extension(std::string_view file_name)
    {
        const auto dot = file_name.find_last_of('.');
        if (dot == std::string_view::npos || dot == 0)
        {
            return {};
        }
        std::string ext(file_name.substr(dot + 1));
        for (auto &ch : ext)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return ext;
    }

    std::optional<AssetKind> kind_for_file_name(std::string_view file_name)
    {
        const auto ext = lowercase_extension(file_name);
        if (contains(kImageExtensions, ext))
        {
            return AssetKind::Screenshot;
        }
        if (contains(kVideoExtensions, ext))
        {
            return AssetKind::Preview;
        }
        return std::nullopt;
    }

    std::string mime_type_for(std::string_view file_name)
    {
        const auto ext = lowercase_extension(file_name);
        if (ext == "mp4")
        {
            return "video/mp4";
        }
        if (ext == "mov")
        {
            return "video/quicktime";
        }
        if (ext == "png")
        {
            return "image/png";
        }
        if (ext == "jpg" || ext == "jpeg")
        {
            return "image/jpeg";
        }
        return "application/octet-stream";
    }

} // namespace ascmedia
