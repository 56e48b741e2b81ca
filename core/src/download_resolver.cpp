#include "ascmedia/download_resolver.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <system_error>

#include "ascmedia/display_types.hpp"
#include "ascmedia/error_codes.hpp"
#include "ascmedia/upload_pipeline.hpp"

namespace ascmedia
{

    namespace
    {

        void replace_all(std::string &text, const std::string &token, const std::string &value)
        {
            for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + value.size()))
            {
                text.replace(pos, token.size(), value);
            }
        }

    } // namespace

    std::string resolve_image_url(const std::string &template_url, std::uint32_t width, std::uint32_t height,
                                  const std::string &file_name)
    {
        const auto extension = lowercase_extension(file_name);
        const std::string format = (extension == "jpg" || extension == "jpeg") ? "jpg" : "png";
        auto url = template_url;
        replace_all(url, "{w}", std::to_string(width));
        replace_all(url, "{h}", std::to_string(height));
        replace_all(url, "{f}", format);
        return url;
    }

    std::string delivery_url(const RemoteAsset &asset)
    {
        if (asset.kind == AssetKind::Screenshot)
        {
            if (asset.image && !asset.image->template_url.empty())
            {
                return resolve_image_url(asset.image->template_url, asset.image->width, asset.image->height,
                                         asset.file_name);
            }
        }
        else if (asset.video_url && !asset.video_url->empty())
        {
            return *asset.video_url;
        }
        const auto name = asset.file_name.empty() ? asset.id : asset.file_name;
        throw Error(ErrorCode::InvalidResponse, "No download URL available for '" + name + "'.");
    }

    std::string ordinal_file_name(const RemoteAsset &asset, std::size_t position)
    {
        // Remote names never choose the directory.
        auto name = std::filesystem::path(asset.file_name).filename().string();
        if (name.empty() || name == "." || name == "..")
        {
            name = asset.id + (asset.kind == AssetKind::Screenshot ? ".png" : ".mp4");
        }
        char prefix[24];
        std::snprintf(prefix, sizeof(prefix), "%02zu_", position);
        return prefix + name;
    }

    DownloadResolver::DownloadResolver(MediaApi &api, Logger &logger, std::optional<std::size_t> max_rate)
        : api_(api), logger_(logger), max_rate_(max_rate) {}

    std::filesystem::path DownloadResolver::download(const RemoteAsset &asset, std::size_t position,
                                                     const std::filesystem::path &directory)
    {
        const auto url = delivery_url(asset);
        const auto target = directory / ordinal_file_name(asset, position);
        auto partial = target;
        partial += ".part";

        const auto start = std::chrono::steady_clock::now();
        const auto bytes = api_.fetch_bytes(url);
        apply_rate_limit(max_rate_, bytes.size(), start);

        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            throw Error(ErrorCode::FileIo, "Cannot create folder '" + directory.string() + "': " + ec.message());
        }
        {
            std::ofstream out(partial, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw Error(ErrorCode::FileIo, "Cannot write file at '" + partial.string() + "'.");
            }
            out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!out)
            {
                out.close();
                std::filesystem::remove(partial, ec);
                throw Error(ErrorCode::FileIo, "Cannot write file at '" + partial.string() + "'.");
            }
        }
        std::filesystem::rename(partial, target, ec);
        if (ec)
        {
            const auto message = ec.message();
            std::filesystem::remove(partial, ec);
            throw Error(ErrorCode::FileIo, "Cannot move download into '" + target.string() + "': " + message);
        }
        logger_.log("download", "Wrote ", bytes.size(), " bytes of ", asset.id, " to ", target.string());
        return target;
    }

} // namespace ascmedia
