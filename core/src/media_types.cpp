#include "ascmedia/media_types.hpp"

#include <array>

namespace ascmedia
{

    namespace
    {

        struct StateMapping
        {
            AssetState state;
            std::string_view label;
        };

        constexpr std::array<StateMapping, 5> kStateMappings{{
            {AssetState::AwaitingUpload, "AWAITING_UPLOAD"},
            {AssetState::UploadComplete, "UPLOAD_COMPLETE"},
            {AssetState::Complete, "COMPLETE"},
            {AssetState::Failed, "FAILED"},
            {AssetState::Unknown, "UNKNOWN"},
        }};

    } // namespace

    std::string_view to_string(AssetKind kind) noexcept
    {
        return kind == AssetKind::Screenshot ? "screenshot" : "preview";
    }

    std::string_view to_string(AssetState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    AssetState asset_state_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.label == value)
            {
                return mapping.state;
            }
        }
        return AssetState::Unknown;
    }

    std::string describe(const GroupKey &key)
    {
        return "[" + key.locale + "] " + key.display_type + " (" + std::string(to_string(key.kind)) + "s)";
    }

} // namespace ascmedia
