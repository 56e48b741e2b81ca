/**
 * ascmedia - upload, download, verify and repair commands over a MediaApi.
 *
 * Progress is written to the supplied stream; every command returns the counts it
 * reports. Per-item failures are collected, never thrown. Failures that leave the
 * command nothing to work on (unreadable root folder, listing the version) propagate.
 */
#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "ascmedia/asset_index.hpp"
#include "ascmedia/completion_poller.hpp"
#include "ascmedia/logger.hpp"
#include "ascmedia/media_api.hpp"
#include "ascmedia/reorder_coordinator.hpp"
#include "ascmedia/repair_coordinator.hpp"
#include "ascmedia/set_resolver.hpp"
#include "ascmedia/state_verifier.hpp"
#include "ascmedia/summary.hpp"
#include "ascmedia/upload_pipeline.hpp"

namespace ascmedia
{

    struct UploadOptions
    {
        bool replace{};
        bool wait{};
        PollOptions poll;
    };

    // Scan warnings followed by a one-line count of what will be uploaded.
    void print_scan(const AssetIndex &index, std::ostream &out);

    class MediaSync
    {
    public:
        MediaSync(MediaApi &api, Logger &logger, std::ostream &out, TransferOptions options = {});

        // Scans root, prints the scan warnings and uploads what was found.
        OperationSummary upload(const std::filesystem::path &root, const std::string &version_id,
                                const UploadOptions &options);
        OperationSummary upload(const AssetIndex &index, const std::string &version_id,
                                const UploadOptions &options);

        OperationSummary download(const std::filesystem::path &root, const std::string &version_id);

        // Prints and returns the report. Never mutates remote state.
        VerifyReport verify(const std::string &version_id);

        // Repairs what the plan matched, then verifies again and prints the new report.
        OperationSummary repair(const RepairPlan &plan, const std::string &version_id);

        void set_poll_sleeper(CompletionPoller::Sleeper sleeper) { poll_sleeper_ = std::move(sleeper); }

    private:
        struct UploadedAsset
        {
            std::string id;
            AssetKind kind{AssetKind::Screenshot};
            std::string file_name;
        };

        void upload_group(const std::vector<LocalAssetFile> &files, SetResolver &resolver,
                          const UploadOptions &options, OperationSummary &summary,
                          std::vector<UploadedAsset> &uploaded);
        void wait_for_processing(const std::vector<UploadedAsset> &uploaded, const PollOptions &options,
                                 OperationSummary &summary);

        MediaApi &api_;
        Logger &logger_;
        std::ostream &out_;
        TransferOptions options_;
        UploadPipeline pipeline_;
        ReorderCoordinator reorder_;
        CompletionPoller::Sleeper poll_sleeper_;
    };

} // namespace ascmedia
