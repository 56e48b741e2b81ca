#include "ascmedia/api_schema.hpp"

#include "ascmedia/display_types.hpp"
#include "ascmedia/error_codes.hpp"

namespace ascmedia
{

    namespace
    {

        std::string string_or(const nlohmann::json &object, const char *key, std::string fallback = {})
        {
            if (!object.is_object())
            {
                return fallback;
            }
            const auto it = object.find(key);
            if (it == object.end() || !it->is_string())
            {
                return fallback;
            }
            return it->get<std::string>();
        }

        template <typename T>
        T number_or(const nlohmann::json &object, const char *key, T fallback)
        {
            if (!object.is_object())
            {
                return fallback;
            }
            const auto it = object.find(key);
            if (it == object.end() || !it->is_number())
            {
                return fallback;
            }
            return it->get<T>();
        }

        const nlohmann::json &attributes_of(const nlohmann::json &resource)
        {
            static const nlohmann::json kEmpty = nlohmann::json::object();
            const auto it = resource.find("attributes");
            if (it == resource.end() || !it->is_object())
            {
                return kEmpty;
            }
            return *it;
        }

        std::string resource_id(const nlohmann::json &resource)
        {
            const auto id = string_or(resource, "id");
            if (id.empty())
            {
                throw Error(ErrorCode::InvalidResponse, "Resource without an id in API response");
            }
            return id;
        }

    } // namespace

    void to_json(nlohmann::json &json, const UploadHeader &header)
    {
        json = {{"name", header.name}, {"value", header.value}};
    }

    void from_json(const nlohmann::json &json, UploadHeader &header)
    {
        header.name = string_or(json, "name");
        header.value = string_or(json, "value");
    }

    void to_json(nlohmann::json &json, const UploadOperation &operation)
    {
        json = {
            {"method", operation.method},
            {"url", operation.url},
            {"offset", operation.offset},
            {"length", operation.length},
            {"requestHeaders", operation.headers},
        };
    }

    void from_json(const nlohmann::json &json, UploadOperation &operation)
    {
        operation.url = string_or(json, "url");
        if (operation.url.empty() || !json.contains("offset") || !json.contains("length"))
        {
            throw Error(ErrorCode::InvalidResponse, "Upload operation missing required fields.");
        }
        operation.method = string_or(json, "method", "PUT");
        operation.offset = number_or<std::uint64_t>(json, "offset", 0);
        operation.length = number_or<std::uint64_t>(json, "length", 0);
        operation.headers.clear();
        if (const auto it = json.find("requestHeaders"); it != json.end() && it->is_array())
        {
            operation.headers = it->get<std::vector<UploadHeader>>();
        }
    }

    void to_json(nlohmann::json &json, const ImageAsset &image)
    {
        json = {{"templateUrl", image.template_url}, {"width", image.width}, {"height", image.height}};
    }

    void from_json(const nlohmann::json &json, ImageAsset &image)
    {
        image.template_url = string_or(json, "templateUrl");
        image.width = number_or<std::uint32_t>(json, "width", 0);
        image.height = number_or<std::uint32_t>(json, "height", 0);
    }

} // namespace ascmedia

namespace ascmedia::schema
{

    namespace
    {

        nlohmann::json linkage(std::string_view type, const std::string &id)
        {
            return {{"type", std::string(type)}, {"id", id}};
        }

    } // namespace

    std::string_view asset_resource_type(AssetKind kind) noexcept
    {
        return kind == AssetKind::Screenshot ? "appScreenshots" : "appPreviews";
    }

    std::string_view set_resource_type(AssetKind kind) noexcept
    {
        return kind == AssetKind::Screenshot ? "appScreenshotSets" : "appPreviewSets";
    }

    std::string_view set_relationship_name(AssetKind kind) noexcept
    {
        return kind == AssetKind::Screenshot ? "appScreenshotSet" : "appPreviewSet";
    }

    RemoteAsset decode_asset(const nlohmann::json &resource, AssetKind kind)
    {
        const auto &attributes = attributes_of(resource);

        RemoteAsset asset;
        asset.id = resource_id(resource);
        asset.kind = kind;
        asset.file_name = string_or(attributes, "fileName");
        asset.file_size = number_or<std::uint64_t>(attributes, "fileSize", 0);
        asset.checksum = string_or(attributes, "sourceFileChecksum");

        if (const auto it = attributes.find("assetDeliveryState"); it != attributes.end() && it->is_object())
        {
            asset.state = asset_state_from_string(string_or(*it, "state"));
            if (const auto errors = it->find("errors"); errors != it->end() && errors->is_array())
            {
                for (const auto &error : *errors)
                {
                    auto text = string_or(error, "description", string_or(error, "code"));
                    if (!text.empty())
                    {
                        asset.state_errors.push_back(std::move(text));
                    }
                }
            }
        }

        if (const auto it = attributes.find("imageAsset"); it != attributes.end() && it->is_object())
        {
            asset.image = it->get<ImageAsset>();
        }
        if (const auto url = string_or(attributes, "videoUrl"); !url.empty())
        {
            asset.video_url = url;
        }
        return asset;
    }

    ReservedAsset decode_reservation(const nlohmann::json &document)
    {
        const auto data = document.find("data");
        if (data == document.end() || !data->is_object())
        {
            throw Error(ErrorCode::InvalidResponse, "Reservation response without data");
        }

        ReservedAsset reserved;
        reserved.id = resource_id(*data);
        const auto &attributes = attributes_of(*data);
        if (const auto it = attributes.find("uploadOperations"); it != attributes.end() && it->is_array())
        {
            reserved.operations = it->get<std::vector<UploadOperation>>();
        }
        return reserved;
    }

    std::optional<RemoteAssetSet> decode_set(const nlohmann::json &resource, AssetKind kind, const std::string &locale)
    {
        const auto &attributes = attributes_of(resource);

        RemoteAssetSet set;
        set.id = resource_id(resource);
        set.locale = locale;
        set.kind = kind;
        if (kind == AssetKind::Screenshot)
        {
            set.display_type = string_or(attributes, "screenshotDisplayType");
        }
        else
        {
            const auto preview_type = string_or(attributes, "previewType");
            if (!preview_type.empty())
            {
                set.display_type = display_type_for_preview_type(preview_type);
            }
        }
        if (set.display_type.empty())
        {
            return std::nullopt;
        }
        return set;
    }

    std::vector<Localization> decode_localizations(const nlohmann::json &document)
    {
        std::vector<Localization> result;
        const auto data = document.find("data");
        if (data == document.end() || !data->is_array())
        {
            return result;
        }
        for (const auto &resource : *data)
        {
            auto locale = string_or(attributes_of(resource), "locale");
            if (locale.empty())
            {
                continue;
            }
            result.push_back(Localization{resource_id(resource), std::move(locale)});
        }
        return result;
    }

    nlohmann::json encode_set_create(AssetKind kind, const std::string &localization_id,
                                     const std::string &display_type)
    {
        nlohmann::json attributes;
        if (kind == AssetKind::Screenshot)
        {
            attributes["screenshotDisplayType"] = display_type;
        }
        else
        {
            const auto preview_type = preview_type_for_display_type(display_type);
            if (!preview_type)
            {
                throw Error(ErrorCode::Unsupported, "No preview support for display type " + display_type);
            }
            attributes["previewType"] = *preview_type;
        }

        return {{"data",
                 {{"type", std::string(set_resource_type(kind))},
                  {"attributes", attributes},
                  {"relationships",
                   {{"appStoreVersionLocalization",
                     {{"data", linkage("appStoreVersionLocalizations", localization_id)}}}}}}}};
    }

    nlohmann::json encode_reserve(AssetKind kind, const std::string &set_id, const std::string &file_name,
                                  std::uint64_t file_size)
    {
        nlohmann::json attributes = {{"fileName", file_name}, {"fileSize", file_size}};
        if (kind == AssetKind::Preview)
        {
            attributes["mimeType"] = mime_type_for(file_name);
        }

        return {{"data",
                 {{"type", std::string(asset_resource_type(kind))},
                  {"attributes", attributes},
                  {"relationships",
                   {{std::string(set_relationship_name(kind)), {{"data", linkage(set_resource_type(kind), set_id)}}}}}}}};
    }

    nlohmann::json encode_commit(AssetKind kind, const std::string &asset_id, const std::string &checksum,
                                 bool uploaded)
    {
        return {{"data",
                 {{"type", std::string(asset_resource_type(kind))},
                  {"id", asset_id},
                  {"attributes", {{"sourceFileChecksum", checksum}, {"uploaded", uploaded}}}}}};
    }

    nlohmann::json encode_reorder(AssetKind kind, const std::vector<std::string> &ordered_asset_ids)
    {
        auto data = nlohmann::json::array();
        for (const auto &id : ordered_asset_ids)
        {
            data.push_back(linkage(asset_resource_type(kind), id));
        }
        return {{"data", data}};
    }

    std::optional<std::string> next_link(const nlohmann::json &document)
    {
        const auto links = document.find("links");
        if (links == document.end() || !links->is_object())
        {
            return std::nullopt;
        }
        auto next = string_or(*links, "next");
        if (next.empty())
        {
            return std::nullopt;
        }
        return next;
    }

    std::string error_summary(const nlohmann::json &document)
    {
        std::string summary;
        const auto errors = document.find("errors");
        if (errors == document.end() || !errors->is_array())
        {
            return summary;
        }
        for (const auto &error : *errors)
        {
            auto text = string_or(error, "detail", string_or(error, "title"));
            if (text.empty())
            {
                continue;
            }
            if (!summary.empty())
            {
                summary += "; ";
            }
            summary += text;
        }
        return summary;
    }

} // namespace ascmedia::schema
