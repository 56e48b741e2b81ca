#include "ascmedia/client/app_store_api.hpp"

#include <algorithm>
#include <utility>

#include "ascmedia/error_codes.hpp"

namespace ascmedia::client
{

    namespace
    {

        std::string resource_path(std::string_view type, const std::string &id)
        {
            return "/v1/" + std::string(type) + "/" + id;
        }

        std::string created_id(const nlohmann::json &document)
        {
            const auto data = document.find("data");
            if (data != document.end() && data->is_object())
            {
                if (const auto id = data->find("id"); id != data->end() && id->is_string())
                {
                    return id->get<std::string>();
                }
            }
            throw Error(ErrorCode::InvalidResponse, "Create response without data.id");
        }

        const nlohmann::json &data_object(const nlohmann::json &document)
        {
            const auto data = document.find("data");
            if (data == document.end() || !data->is_object())
            {
                throw Error(ErrorCode::InvalidResponse, "Response without a data object");
            }
            return *data;
        }

    } // namespace

    AppStoreMediaApi::AppStoreMediaApi(HttpClient &http, TokenSource token, Logger &logger, std::string base_url)
        : http_(http), token_(std::move(token)), logger_(logger), base_url_(std::move(base_url))
    {
        while (!base_url_.empty() && base_url_.back() == '/')
        {
            base_url_.pop_back();
        }
    }

    nlohmann::json AppStoreMediaApi::call(const std::string &method, const std::string &path_or_url,
                                          const std::optional<nlohmann::json> &body, Conflict conflict)
    {
        HttpRequest request;
        request.method = method;
        request.url = path_or_url.starts_with("http") ? path_or_url : base_url_ + path_or_url;
        request.headers.emplace_back("Authorization", "Bearer " + token_());
        request.headers.emplace_back("Accept", "application/json");
        if (body)
        {
            request.headers.emplace_back("Content-Type", "application/json");
            request.body = body->dump();
        }

        const auto response = http_.send(request);
        if (!response.ok())
        {
            auto code = classify_status(response.status);
            if (response.status == 409 || response.status == 422)
            {
                code = conflict == Conflict::Reserve  ? ErrorCode::ReserveRejected
                       : conflict == Conflict::Commit ? ErrorCode::Integrity
                                                      : ErrorCode::InvalidResponse;
            }
            const auto document = nlohmann::json::parse(response.body, nullptr, false);
            auto detail = document.is_discarded() ? response.body.substr(0, 200) : schema::error_summary(document);
            auto message = method + " " + path_or_url + " returned " + std::to_string(response.status);
            if (!detail.empty())
            {
                message += ": " + detail;
            }
            logger_.warn("api", message);
            throw Error(code, message);
        }

        if (response.body.empty())
        {
            return nlohmann::json::object();
        }
        auto document = nlohmann::json::parse(response.body, nullptr, false);
        if (document.is_discarded())
        {
            throw Error(ErrorCode::InvalidResponse, method + " " + path_or_url + " returned malformed JSON");
        }
        return document;
    }

    std::vector<nlohmann::json> AppStoreMediaApi::get_all(const std::string &path)
    {
        std::vector<nlohmann::json> resources;
        std::optional<std::string> next = path;
        while (next)
        {
            const auto document = call("GET", *next);
            if (const auto data = document.find("data"); data != document.end() && data->is_array())
            {
                resources.insert(resources.end(), data->begin(), data->end());
            }
            next = schema::next_link(document);
        }
        return resources;
    }

    const std::vector<schema::Localization> &AppStoreMediaApi::localizations(const std::string &version_id)
    {
        std::lock_guard lock(cache_mutex_);
        auto it = localizations_.find(version_id);
        if (it == localizations_.end())
        {
            nlohmann::json document;
            document["data"] = get_all(resource_path("appStoreVersions", version_id) +
                                       "/appStoreVersionLocalizations?limit=200");
            it = localizations_.emplace(version_id, schema::decode_localizations(document)).first;
        }
        return it->second;
    }

    std::vector<RemoteAssetSet> AppStoreMediaApi::list_sets(const std::string &version_id)
    {
        {
            // Always list against the current localizations.
            std::lock_guard lock(cache_mutex_);
            localizations_.erase(version_id);
        }

        std::vector<RemoteAssetSet> sets;
        for (const auto &localization : localizations(version_id))
        {
            for (const auto kind : {AssetKind::Screenshot, AssetKind::Preview})
            {
                const auto path = resource_path("appStoreVersionLocalizations", localization.id) + "/" +
                                  std::string(schema::set_resource_type(kind)) + "?limit=50";
                for (const auto &resource : get_all(path))
                {
                    if (auto set = schema::decode_set(resource, kind, localization.locale))
                    {
                        sets.push_back(std::move(*set));
                    }
                }
            }
        }
        return sets;
    }

    std::vector<RemoteAsset> AppStoreMediaApi::list_assets(AssetKind kind, const std::string &set_id)
    {
        std::vector<RemoteAsset> assets;
        const auto path = resource_path(schema::set_resource_type(kind), set_id) + "/" +
                          std::string(schema::asset_resource_type(kind)) + "?limit=200";
        for (const auto &resource : get_all(path))
        {
            assets.push_back(schema::decode_asset(resource, kind));
        }
        return assets;
    }

    std::string AppStoreMediaApi::create_set(const std::string &version_id, const std::string &locale,
                                             const std::string &display_type, AssetKind kind)
    {
        const auto &known = localizations(version_id);
        const auto it = std::find_if(known.begin(), known.end(), [&](const schema::Localization &localization)
                                     { return localization.locale == locale; });
        if (it == known.end())
        {
            throw Error(ErrorCode::NotFound, "Locale '" + locale + "' is not set up on this version.");
        }

        const auto document = call("POST", "/v1/" + std::string(schema::set_resource_type(kind)),
                                   schema::encode_set_create(kind, it->id, display_type));
        auto id = created_id(document);
        logger_.log("api", "Created ", schema::set_resource_type(kind), " ", id, " for [", locale, "] ",
                    display_type);
        return id;
    }

    void AppStoreMediaApi::delete_set(AssetKind kind, const std::string &set_id)
    {
        call("DELETE", resource_path(schema::set_resource_type(kind), set_id));
        logger_.log("api", "Deleted ", schema::set_resource_type(kind), " ", set_id);
    }

    ReservedAsset AppStoreMediaApi::reserve_asset(AssetKind kind, const std::string &set_id,
                                                  const std::string &file_name, std::uint64_t file_size)
    {
        const auto document = call("POST", "/v1/" + std::string(schema::asset_resource_type(kind)),
                                   schema::encode_reserve(kind, set_id, file_name, file_size), Conflict::Reserve);
        return schema::decode_reservation(document);
    }

    void AppStoreMediaApi::put_chunk(const UploadOperation &operation, std::span<const std::byte> bytes)
    {
        HttpRequest request;
        request.method = operation.method.empty() ? "PUT" : operation.method;
        request.url = operation.url;
        for (const auto &header : operation.headers)
        {
            request.headers.emplace_back(header.name, header.value);
        }
        request.body.assign(reinterpret_cast<const char *>(bytes.data()), bytes.size());

        const auto response = http_.send(request);
        if (!response.ok())
        {
            throw Error(classify_status(response.status), "Chunk at offset " + std::to_string(operation.offset) +
                                                               " returned " + std::to_string(response.status));
        }
    }

    RemoteAsset AppStoreMediaApi::commit_asset(AssetKind kind, const std::string &asset_id,
                                               const std::string &checksum, bool uploaded)
    {
        const auto document = call("PATCH", resource_path(schema::asset_resource_type(kind), asset_id),
                                   schema::encode_commit(kind, asset_id, checksum, uploaded), Conflict::Commit);
        return schema::decode_asset(data_object(document), kind);
    }

    RemoteAsset AppStoreMediaApi::get_asset(AssetKind kind, const std::string &asset_id)
    {
        const auto document = call("GET", resource_path(schema::asset_resource_type(kind), asset_id));
        return schema::decode_asset(data_object(document), kind);
    }

    void AppStoreMediaApi::delete_asset(AssetKind kind, const std::string &asset_id)
    {
        call("DELETE", resource_path(schema::asset_resource_type(kind), asset_id));
    }

    void AppStoreMediaApi::reorder_set(AssetKind kind, const std::string &set_id,
                                       const std::vector<std::string> &ordered_asset_ids)
    {
        call("PATCH",
             resource_path(schema::set_resource_type(kind), set_id) + "/relationships/" +
                 std::string(schema::asset_resource_type(kind)),
             schema::encode_reorder(kind, ordered_asset_ids));
    }

    std::vector<std::byte> AppStoreMediaApi::fetch_bytes(const std::string &url)
    {
        HttpRequest request;
        request.url = url;
        const auto response = http_.send(request);
        if (!response.ok())
        {
            throw Error(classify_status(response.status), "Download returned " + std::to_string(response.status));
        }
        const auto *begin = reinterpret_cast<const std::byte *>(response.body.data());
        return std::vector<std::byte>(begin, begin + response.body.size());
    }

} // namespace ascmedia::client
