#include "ascmedia/media_sync.hpp"

#include "ascmedia/download_resolver.hpp"
#include "ascmedia/error_codes.hpp"

namespace ascmedia
{

    namespace
    {

        std::string_view progress_label(AssetKind kind) noexcept
        {
            return kind == AssetKind::Screenshot ? "Screenshot" : "Preview   ";
        }

        // Locale and display type come from the server and become directory names.
        bool safe_path_component(const std::string &name) noexcept
        {
            return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos &&
                   name.find('\\') == std::string::npos;
        }

    } // namespace

    void print_scan(const AssetIndex &index, std::ostream &out)
    {
        for (const auto &warning : index.warnings)
        {
            out << "Warning: " << warning.message << "\n";
        }
        if (index.empty())
        {
            out << "No media files found in '" << index.root.string() << "'." << std::endl;
            return;
        }
        out << "Found " << index.total_screenshots << " screenshot(s) and " << index.total_previews
            << " preview(s) in " << index.locale_count() << " locale(s)." << std::endl;
    }

    MediaSync::MediaSync(MediaApi &api, Logger &logger, std::ostream &out, TransferOptions options)
        : api_(api),
          logger_(logger),
          out_(out),
          options_(options),
          pipeline_(api, logger, options),
          reorder_(api, logger) {}

    OperationSummary MediaSync::upload(const std::filesystem::path &root, const std::string &version_id,
                                       const UploadOptions &options)
    {
        const auto index = scan_media_folder(root);
        print_scan(index, out_);
        return upload(index, version_id, options);
    }

    OperationSummary MediaSync::upload(const AssetIndex &index, const std::string &version_id,
                                       const UploadOptions &options)
    {
        OperationSummary summary;
        summary.skipped += index.warnings.size();
        logger_.log("scan", index.root.string(), ": ", index.total_screenshots, " screenshots, ",
                    index.total_previews, " previews, ", index.warnings.size(), " warnings");
        if (index.empty())
        {
            return summary;
        }

        SetResolver resolver(api_, version_id, logger_);
        resolver.refresh();

        std::vector<UploadedAsset> uploaded;
        for (const auto &group : index.groups)
        {
            for (const auto kind : {AssetKind::Screenshot, AssetKind::Preview})
            {
                const auto &files = group.files(kind);
                if (!files.empty())
                {
                    upload_group(files, resolver, options, summary, uploaded);
                }
            }
        }

        if (options.wait && !uploaded.empty())
        {
            wait_for_processing(uploaded, options.poll, summary);
        }
        return summary;
    }

    void MediaSync::upload_group(const std::vector<LocalAssetFile> &files, SetResolver &resolver,
                                 const UploadOptions &options, OperationSummary &summary,
                                 std::vector<UploadedAsset> &uploaded)
    {
        const auto key = files.front().key();
        out_ << describe(key) << ":" << std::endl;

        ResolvedSet resolved;
        try
        {
            resolved = resolver.resolve_or_create(key);
        }
        catch (const Error &error)
        {
            logger_.warn("upload", describe(key), ": ", error.what());
            if (error.code() == ErrorCode::NotFound)
            {
                out_ << "  Skipped: " << error.what() << std::endl;
                summary.skipped += files.size();
                return;
            }
            out_ << "  Failed: " << error.what() << std::endl;
            summary.record_failure(describe(key), error.code(), error.what(), files.size());
            return;
        }
        if (resolved.created)
        {
            out_ << "  Created " << to_string(key.kind) << " set." << std::endl;
        }

        if (options.replace && !resolved.created)
        {
            try
            {
                const auto removed = pipeline_.clear_set(key.kind, resolved.id);
                if (removed > 0)
                {
                    out_ << "  Deleted " << removed << " existing " << to_string(key.kind) << "(s)." << std::endl;
                }
            }
            catch (const Error &error)
            {
                // A partially cleared set is not replaced.
                out_ << "  Failed to delete existing items: " << error.what() << std::endl;
                summary.record_failure(describe(key), error.code(),
                                       std::string("Could not delete existing items: ") + error.what(),
                                       files.size());
                return;
            }
        }

        std::vector<std::string> new_ids;
        for (const auto &file : files)
        {
            out_ << "    " << progress_label(file.kind) << " " << file.position << "/" << files.size() << ": "
                 << file.file_name << "... " << std::flush;
            try
            {
                const auto asset = pipeline_.upload(file, resolved.id);
                new_ids.push_back(asset.id);
                uploaded.push_back(UploadedAsset{asset.id, file.kind, file.file_name});
                out_ << "Done." << std::endl;
                ++summary.succeeded;
            }
            catch (const Error &error)
            {
                out_ << "Failed: " << error.what() << std::endl;
                logger_.warn("upload", file.path.string(), ": ", error.what());
                summary.record_failure(file.path.string(), error.code(), error.what());
            }
        }

        if (new_ids.empty())
        {
            return;
        }
        try
        {
            // Existing items keep their order; new uploads follow in local order.
            const auto current = api_.list_assets(key.kind, resolved.id);
            std::vector<std::string> current_ids;
            current_ids.reserve(current.size());
            for (const auto &asset : current)
            {
                current_ids.push_back(asset.id);
            }
            reorder_.apply(key.kind, resolved.id, order_with_appended(current_ids, new_ids));
        }
        catch (const Error &error)
        {
            out_ << "  Reorder failed: " << error.what() << std::endl;
            summary.record_failure(describe(key) + " reorder", error.code(), error.what());
        }
    }

    void MediaSync::wait_for_processing(const std::vector<UploadedAsset> &uploaded, const PollOptions &options,
                                        OperationSummary &summary)
    {
        out_ << "\nWaiting for processing..." << std::endl;
        CompletionPoller poller(api_, logger_, options, poll_sleeper_);
        for (const auto &asset : uploaded)
        {
            out_ << "  " << asset.file_name << ": " << std::flush;
            try
            {
                const auto result = poller.wait(asset.kind, asset.id);
                out_ << to_string(result.outcome);
                if (result.outcome != PollOutcome::Complete)
                {
                    out_ << " (" << to_string(result.asset.state) << ")";
                }
                out_ << std::endl;
                if (result.outcome == PollOutcome::Failed)
                {
                    std::string message = "Processing failed";
                    for (const auto &error : result.asset.state_errors)
                    {
                        message += ": " + error;
                    }
                    --summary.succeeded;
                    summary.record_failure(asset.file_name, ErrorCode::Unsupported, message);
                }
            }
            catch (const Error &error)
            {
                out_ << "unknown (" << error.what() << ")" << std::endl;
                logger_.warn("upload", "Polling ", asset.id, " gave up: ", error.what());
            }
        }
    }

    OperationSummary MediaSync::download(const std::filesystem::path &root, const std::string &version_id)
    {
        OperationSummary summary;
        std::vector<UnlistedSet> unlisted;
        const auto sets = fetch_sets_with_items(api_, version_id, logger_, &unlisted);
        for (const auto &set : unlisted)
        {
            if (set.vanished())
            {
                out_ << describe(set.key) << ": not found, skipped." << std::endl;
                ++summary.skipped;
                continue;
            }
            out_ << describe(set.key) << ": could not be listed: " << set.message << std::endl;
            summary.record_failure(describe(set.key), set.code, set.message);
        }

        DownloadResolver resolver(api_, logger_, options_.max_download_rate);
        bool any = false;
        for (const auto &set : sets)
        {
            if (set.items.empty())
            {
                continue;
            }
            any = true;
            if (!safe_path_component(set.locale) || !safe_path_component(set.display_type))
            {
                const auto message = "Unusable folder name for locale '" + set.locale + "' and display type '" +
                                     set.display_type + "'";
                out_ << describe(set.key()) << ": " << message << ", skipped." << std::endl;
                logger_.warn("download", "Set ", set.id, ": ", message);
                summary.record_failure(describe(set.key()), ErrorCode::InvalidResponse, message);
                continue;
            }
            const auto directory = root / set.locale / set.display_type;
            out_ << describe(set.key()) << ":" << std::endl;
            for (std::size_t index = 0; index < set.items.size(); ++index)
            {
                const auto &asset = set.items[index];
                out_ << "  " << progress_label(set.kind) << " " << index + 1 << "/" << set.items.size() << ": "
                     << ordinal_file_name(asset, index + 1) << "... " << std::flush;
                try
                {
                    resolver.download(asset, index + 1, directory);
                    out_ << "Done." << std::endl;
                    ++summary.succeeded;
                }
                catch (const Error &error)
                {
                    out_ << "Failed: " << error.what() << std::endl;
                    logger_.warn("download", asset.id, ": ", error.what());
                    summary.record_failure(describe(set.key()) + " #" + std::to_string(index + 1), error.code(),
                                           error.what());
                }
            }
        }
        if (!any)
        {
            out_ << "No media found for this version." << std::endl;
        }
        return summary;
    }

    VerifyReport MediaSync::verify(const std::string &version_id)
    {
        StateVerifier verifier(api_, logger_);
        auto report = verifier.verify(version_id);
        print_report(report, out_);
        return report;
    }

    OperationSummary MediaSync::repair(const RepairPlan &plan, const std::string &version_id)
    {
        RepairCoordinator coordinator(api_, pipeline_, reorder_, logger_, out_);
        auto summary = coordinator.execute(plan);
        if (plan.task_count() == 0)
        {
            return summary;
        }

        out_ << "\nRe-verifying...\n" << std::endl;
        try
        {
            StateVerifier verifier(api_, logger_);
            print_report(verifier.verify(version_id), out_, true);
        }
        catch (const Error &error)
        {
            out_ << "Re-verify failed: " << error.what() << std::endl;
            logger_.warn("verify", "Re-verify of ", version_id, " failed: ", error.what());
        }
        return summary;
    }

} // namespace ascmedia
