/**
 * ascmedia - Display-type catalogue and file classification.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ascmedia/media_types.hpp"

namespace ascmedia
{

    bool is_known_display_type(std::string_view display_type) noexcept;

    // Watch and iMessage families accept screenshots only.
    bool is_screenshot_only(std::string_view display_type) noexcept;

    std::optional<std::string> preview_type_for_display_type(std::string_view display_type);

    std::string display_type_for_preview_type(std::string_view preview_type);

    std::string lowercase_extension(std::string_view file_name);

    std::optional<AssetKind> kind_for_file_name(std::string_view file_name);

    std::string mime_type_for(std::string_view file_name);

} // namespace ascmedia
