/**
 * ascmedia - Reserve, chunk transfer and checksum commit for a single file.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ascmedia/logger.hpp"
#include "ascmedia/media_api.hpp"
#include "ascmedia/media_types.hpp"

namespace ascmedia
{

    struct TransferOptions
    {
        std::size_t concurrency{4};        // parallel chunk transfers per asset
        std::size_t chunk_attempts{3};     // tries per upload operation
        std::size_t reserve_attempts{2};   // full reserve/transfer rounds before giving up
        std::chrono::milliseconds retry_backoff{500};
        std::optional<std::size_t> max_upload_rate;   // bytes per second
        std::optional<std::size_t> max_download_rate; // bytes per second
    };

    void apply_rate_limit(const std::optional<std::size_t> &rate, std::size_t bytes,
                          const std::chrono::steady_clock::time_point &start_time);

    class UploadPipeline
    {
    public:
        UploadPipeline(MediaApi &api, Logger &logger, TransferOptions options = {});

        // Uploads one file into the set and returns the committed asset.
        // Throws Error: ReserveRejected, NoUploadOperations, Transport, Integrity, FileIo.
        RemoteAsset upload(const LocalAssetFile &file, const std::string &set_id);

        // Deletes every item of the set in order; the first failed delete propagates.
        std::size_t clear_set(AssetKind kind, const std::string &set_id);

        const TransferOptions &options() const noexcept { return options_; }

    private:
        void transfer(const std::filesystem::path &path, const std::vector<UploadOperation> &operations);
        void transfer_operation(const std::filesystem::path &path, const UploadOperation &operation);
        void discard(AssetKind kind, const std::string &asset_id);

        MediaApi &api_;
        Logger &logger_;
        TransferOptions options_;
    };

} // namespace ascmedia
