#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ascmedia/api_schema.hpp"
#include "ascmedia/client/http_transport.hpp"
#include "ascmedia/logger.hpp"
#include "ascmedia/media_api.hpp"

namespace ascmedia::client
{

    inline constexpr auto kDefaultApiBase = "https://api.appstoreconnect.apple.com";

    // MediaApi over the App Store Connect REST endpoints.
    class AppStoreMediaApi : public MediaApi
    {
    public:
        using TokenSource = std::function<std::string()>;

        AppStoreMediaApi(HttpClient &http, TokenSource token, Logger &logger, std::string base_url = kDefaultApiBase);

        std::vector<RemoteAssetSet> list_sets(const std::string &version_id) override;
        std::vector<RemoteAsset> list_assets(AssetKind kind, const std::string &set_id) override;
        std::string create_set(const std::string &version_id, const std::string &locale,
                               const std::string &display_type, AssetKind kind) override;
        void delete_set(AssetKind kind, const std::string &set_id) override;
        ReservedAsset reserve_asset(AssetKind kind, const std::string &set_id, const std::string &file_name,
                                    std::uint64_t file_size) override;
        void put_chunk(const UploadOperation &operation, std::span<const std::byte> bytes) override;
        RemoteAsset commit_asset(AssetKind kind, const std::string &asset_id, const std::string &checksum,
                                 bool uploaded) override;
        RemoteAsset get_asset(AssetKind kind, const std::string &asset_id) override;
        void delete_asset(AssetKind kind, const std::string &asset_id) override;
        void reorder_set(AssetKind kind, const std::string &set_id,
                         const std::vector<std::string> &ordered_asset_ids) override;
        std::vector<std::byte> fetch_bytes(const std::string &url) override;

    private:
        // How a 409/422 answer is reported for the call being made.
        enum class Conflict
        {
            Invalid,
            Reserve,
            Commit
        };

        nlohmann::json call(const std::string &method, const std::string &path_or_url,
                            const std::optional<nlohmann::json> &body = std::nullopt,
                            Conflict conflict = Conflict::Invalid);
        // Every `data` element across `links.next` pages.
        std::vector<nlohmann::json> get_all(const std::string &path);
        const std::vector<schema::Localization> &localizations(const std::string &version_id);

        HttpClient &http_;
        TokenSource token_;
        Logger &logger_;
        std::string base_url_;
        std::mutex cache_mutex_;
        std::map<std::string, std::vector<schema::Localization>> localizations_;
    };

} // namespace ascmedia::client
