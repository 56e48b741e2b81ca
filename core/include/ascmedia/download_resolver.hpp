/**
 * ascmedia - Turns remote delivery descriptors into local files.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "ascmedia/logger.hpp"
#include "ascmedia/media_api.hpp"
#include "ascmedia/media_types.hpp"

namespace ascmedia
{

    // Substitutes {w}, {h} and {f}; the format is jpg for .jpg/.jpeg names and png otherwise.
    std::string resolve_image_url(const std::string &template_url, std::uint32_t width, std::uint32_t height,
                                  const std::string &file_name);

    // Concrete URL for the asset; Error(InvalidResponse) when the asset carries no descriptor.
    std::string delivery_url(const RemoteAsset &asset);

    // "<NN>_<name>", with <id>.png or <id>.mp4 standing in for a missing name.
    std::string ordinal_file_name(const RemoteAsset &asset, std::size_t position);

    class DownloadResolver
    {
    public:
        DownloadResolver(MediaApi &api, Logger &logger, std::optional<std::size_t> max_rate = std::nullopt);

        // Writes the asset into directory under its ordinal name and returns the final path.
        std::filesystem::path download(const RemoteAsset &asset, std::size_t position,
                                       const std::filesystem::path &directory);

    private:
        MediaApi &api_;
        Logger &logger_;
        std::optional<std::size_t> max_rate_;
    };

} // namespace ascmedia
