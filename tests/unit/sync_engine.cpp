#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "ascmedia/asset_index.hpp"
#include "ascmedia/completion_poller.hpp"
#include "ascmedia/crypto.hpp"
#include "ascmedia/download_resolver.hpp"
#include "ascmedia/error_codes.hpp"
#include "ascmedia/logger.hpp"
#include "ascmedia/media_sync.hpp"
#include "ascmedia/reorder_coordinator.hpp"
#include "ascmedia/repair_coordinator.hpp"
#include "ascmedia/set_resolver.hpp"
#include "ascmedia/state_verifier.hpp"
#include "ascmedia/upload_pipeline.hpp"
#include "fake_media_api.hpp"

using namespace ascmedia;
using ascmedia::testing::FakeMediaApi;

namespace
{

    class TempTree
    {
    public:
        explicit TempTree(const std::string &name)
            : root_(std::filesystem::temp_directory_path() / name)
        {
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
            std::filesystem::create_directories(root_);
        }

        ~TempTree()
        {
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
        }

        const std::filesystem::path &root() const { return root_; }

        std::filesystem::path write(const std::filesystem::path &relative, const std::string &content)
        {
            const auto path = root_ / relative;
            std::filesystem::create_directories(path.parent_path());
            std::ofstream out(path, std::ios::binary);
            out << content;
            return path;
        }

    private:
        std::filesystem::path root_;
    };

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    TransferOptions fast_options()
    {
        TransferOptions options;
        options.retry_backoff = std::chrono::milliseconds(0);
        return options;
    }

    LocalAssetFile local_file(const std::filesystem::path &path, std::size_t position)
    {
        LocalAssetFile file;
        file.path = path;
        file.locale = "en-US";
        file.display_type = "APP_IPHONE_67";
        file.kind = AssetKind::Screenshot;
        file.position = position;
        file.file_name = path.filename().string();
        file.file_size = std::filesystem::file_size(path);
        return file;
    }

    bool contains(const std::string &haystack, const std::string &needle)
    {
        return haystack.find(needle) != std::string::npos;
    }

    void test_scan_classifies_and_orders()
    {
        TempTree tree("ascmedia_scan_test");
        tree.write("en-US/APP_IPHONE_67/b.png", "b");
        tree.write("en-US/APP_IPHONE_67/a.png", "a");
        tree.write("en-US/APP_IPHONE_67/A.jpg", "A");
        tree.write("en-US/APP_IPHONE_67/c.gif", "c");
        tree.write("en-US/APP_IPHONE_67/clip.mp4", "video");
        tree.write("en-US/APP_IPHONE_67/.DS_Store", "");
        tree.write("en-US/APP_IPHONE_67/nested/deep.png", "deep");
        tree.write("en-US/APP_WATCH_ULTRA/w.png", "w");
        tree.write("en-US/APP_WATCH_ULTRA/v.mp4", "v");
        tree.write("en-US/NOT_A_DEVICE/x.png", "x");
        tree.write("en-US/stray.png", "stray");
        tree.write("top.png", "top");

        const auto index = scan_media_folder(tree.root());
        assert(index.groups.size() == 2);
        assert(index.total_screenshots == 4);
        assert(index.total_previews == 1);
        assert(index.warnings.size() == 3);
        assert(index.locale_count() == 1);

        const auto *iphone = index.find("en-US", "APP_IPHONE_67");
        assert(iphone != nullptr);
        assert(iphone->screenshots.size() == 3);
        assert(iphone->screenshots[0].file_name == "A.jpg");
        assert(iphone->screenshots[1].file_name == "a.png");
        assert(iphone->screenshots[2].file_name == "b.png");
        for (std::size_t i = 0; i < iphone->screenshots.size(); ++i)
        {
            assert(iphone->screenshots[i].position == i + 1);
        }
        assert(iphone->previews.size() == 1);
        assert(iphone->previews[0].position == 1);
        assert(iphone->previews[0].kind == AssetKind::Preview);

        const auto *watch = index.find("en-US", "APP_WATCH_ULTRA");
        assert(watch != nullptr);
        assert(watch->screenshots.size() == 1);
        assert(watch->previews.empty());

        const GroupKey key{"en-US", "APP_IPHONE_67", AssetKind::Screenshot};
        assert(index.file_at(key, 2)->file_name == "a.png");
        assert(index.file_at(key, 4) == nullptr);
        assert(index.file_at(key, 0) == nullptr);
    }

    void test_scan_empty_and_missing_root()
    {
        TempTree tree("ascmedia_scan_empty");
        const auto index = scan_media_folder(tree.root());
        assert(index.empty());
        assert(index.warnings.empty());

        bool threw = false;
        try
        {
            scan_media_folder(tree.root() / "missing");
        }
        catch (const Error &error)
        {
            threw = error.code() == ErrorCode::NotFound;
        }
        assert(threw);
    }

    void test_set_resolver()
    {
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto empty_set = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);

        SetResolver resolver(api, api.version_id, logger);
        resolver.refresh();

        const auto existing = resolver.resolve_or_create({"en-US", "APP_IPHONE_67", AssetKind::Screenshot});
        assert(existing.id == empty_set);
        assert(!existing.created);

        // Same display type, other kind: a separate set.
        const auto preview = resolver.resolve_or_create({"en-US", "APP_IPHONE_67", AssetKind::Preview});
        assert(preview.created);
        assert(preview.id != empty_set);
        assert(api.count("create_set") == 1);

        // Created elsewhere after our listing: found by the re-check.
        const auto concurrent = api.add_set("en-US", "APP_IPAD_PRO_129", AssetKind::Screenshot);
        const auto found = resolver.resolve_or_create({"en-US", "APP_IPAD_PRO_129", AssetKind::Screenshot});
        assert(found.id == concurrent);
        assert(!found.created);
        assert(api.count("create_set") == 1);
    }

    void test_fetch_sets_skips_vanished()
    {
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto kept = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(kept, "a.png", AssetState::Complete);
        const auto gone = api.add_set("en-US", "APP_IPHONE_65", AssetKind::Screenshot);
        api.vanished_sets.insert(gone);

        const auto broken = api.add_set("de-DE", "APP_IPHONE_67", AssetKind::Screenshot);
        api.failing_listings.insert(broken);

        std::vector<UnlistedSet> unlisted;
        const auto sets = fetch_sets_with_items(api, api.version_id, logger, &unlisted);
        assert(sets.size() == 1);
        assert(sets[0].id == kept);
        assert(sets[0].items.size() == 1);
        assert(unlisted.size() == 2);
        assert(unlisted[0].set_id == gone);
        assert(unlisted[0].vanished());
        assert(unlisted[1].set_id == broken);
        assert(unlisted[1].code == ErrorCode::Transport);
        assert(!unlisted[1].vanished());
    }

    void test_pipeline_uploads_in_chunks()
    {
        TempTree tree("ascmedia_pipeline_chunks");
        const auto path = tree.write("shot.png", "0123456789abcdefghij");
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);

        UploadPipeline pipeline(api, logger, fast_options());
        const auto asset = pipeline.upload(local_file(path, 1), set_id);

        assert(asset.state == AssetState::UploadComplete);
        assert(asset.checksum == crypto::md5_file(path));
        assert(api.count("put_chunk") == 5);
        assert(api.count("commit_asset") == 1);
        assert(api.first_index("commit_asset") > api.last_index("put_chunk"));
        assert(api.content(asset.id) == "0123456789abcdefghij");
    }

    void test_pipeline_retries_chunk()
    {
        TempTree tree("ascmedia_pipeline_retry");
        const auto path = tree.write("shot.png", "0123456789");
        Logger logger(std::nullopt);
        FakeMediaApi api;
        api.chunk_failures = 1;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);

        auto options = fast_options();
        options.concurrency = 1;
        UploadPipeline pipeline(api, logger, options);
        const auto asset = pipeline.upload(local_file(path, 1), set_id);

        assert(api.count("reserve_asset") == 1);
        assert(api.count("put_chunk") == 4);
        assert(api.content(asset.id) == "0123456789");
    }

    void test_pipeline_restarts_from_reserve()
    {
        TempTree tree("ascmedia_pipeline_restart");
        const auto path = tree.write("shot.png", "0123456789");
        Logger logger(std::nullopt);
        FakeMediaApi api;
        api.chunk_failures = 3;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);

        auto options = fast_options();
        options.concurrency = 1;
        UploadPipeline pipeline(api, logger, options);
        const auto asset = pipeline.upload(local_file(path, 1), set_id);

        assert(api.count("reserve_asset") == 2);
        assert(api.count("delete_asset") == 1);
        assert(api.first_index("delete_asset") < api.last_index("reserve_asset"));
        assert(api.order(set_id) == std::vector<std::string>{asset.id});
    }

    void test_pipeline_gives_up_after_reserve_attempts()
    {
        TempTree tree("ascmedia_pipeline_exhausted");
        const auto path = tree.write("shot.png", "0123");
        Logger logger(std::nullopt);
        FakeMediaApi api;
        api.chunk_failures = 100;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);

        UploadPipeline pipeline(api, logger, fast_options());
        bool threw = false;
        try
        {
            pipeline.upload(local_file(path, 1), set_id);
        }
        catch (const Error &error)
        {
            threw = error.code() == ErrorCode::Transport;
        }
        assert(threw);
        assert(api.count("reserve_asset") == 2);
        assert(api.count("commit_asset") == 0);
        assert(api.order(set_id).empty());
    }

    void test_pipeline_integrity_error()
    {
        TempTree tree("ascmedia_pipeline_integrity");
        const auto path = tree.write("shot.png", "0123456789");
        Logger logger(std::nullopt);
        FakeMediaApi api;
        api.reject_checksum = true;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);

        UploadPipeline pipeline(api, logger, fast_options());
        bool threw = false;
        try
        {
            pipeline.upload(local_file(path, 1), set_id);
        }
        catch (const Error &error)
        {
            threw = error.code() == ErrorCode::Integrity && !error.retryable() &&
                    contains(error.what(), "shot.png");
        }
        assert(threw);
        assert(api.count("reserve_asset") == 1);
        assert(api.order(set_id).empty());
    }

    void test_pipeline_reserve_failures()
    {
        TempTree tree("ascmedia_pipeline_reserve");
        const auto path = tree.write("shot.png", "0123456789");
        Logger logger(std::nullopt);

        {
            FakeMediaApi api;
            api.reject_reserve = true;
            const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
            UploadPipeline pipeline(api, logger, fast_options());
            bool threw = false;
            try
            {
                pipeline.upload(local_file(path, 1), set_id);
            }
            catch (const Error &error)
            {
                threw = error.code() == ErrorCode::ReserveRejected;
            }
            assert(threw);
            assert(api.count("reserve_asset") == 1);
            assert(api.count("put_chunk") == 0);
            assert(api.count("delete_asset") == 0);
        }

        {
            FakeMediaApi api;
            api.empty_operations = true;
            const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
            UploadPipeline pipeline(api, logger, fast_options());
            bool threw = false;
            try
            {
                pipeline.upload(local_file(path, 1), set_id);
            }
            catch (const Error &error)
            {
                threw = error.code() == ErrorCode::NoUploadOperations;
            }
            assert(threw);
            assert(api.count("delete_asset") == 1);
            assert(api.order(set_id).empty());
        }
    }

    void test_clear_set_stops_on_failed_delete()
    {
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(set_id, "a.png", AssetState::Complete);
        const auto second = api.add_asset(set_id, "b.png", AssetState::Complete);
        api.failing_deletes.insert(second);

        UploadPipeline pipeline(api, logger, fast_options());
        bool threw = false;
        try
        {
            pipeline.clear_set(AssetKind::Screenshot, set_id);
        }
        catch (const Error &error)
        {
            threw = error.code() == ErrorCode::Transport;
        }
        assert(threw);
        assert(api.order(set_id) == std::vector<std::string>{second});
    }

    void test_upload_skips_unsupported_files()
    {
        TempTree tree("ascmedia_upload_skip");
        tree.write("en-US/APP_IPHONE_67/one.png", "first image");
        tree.write("en-US/APP_IPHONE_67/two.png", "second image");
        tree.write("en-US/APP_IPHONE_67/anim.gif", "gif");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto summary = sync.upload(tree.root(), api.version_id, UploadOptions{});

        assert(summary.succeeded == 2);
        assert(summary.skipped == 1);
        assert(summary.failed == 0);
        assert(summary.ok());
        assert(api.count("reserve_asset") == 2);
        assert(contains(out.str(), "anim.gif"));

        const auto set_id = api.set_id_for("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        assert(!set_id.empty());
        assert((api.file_names(set_id) == std::vector<std::string>{"one.png", "two.png"}));
        assert(api.count("reorder_set") == 1);
    }

    void test_upload_keeps_local_order()
    {
        TempTree tree("ascmedia_upload_order");
        tree.write("en-US/APP_IPHONE_67/03_c.png", "c");
        tree.write("en-US/APP_IPHONE_67/01_a.png", "a");
        tree.write("en-US/APP_IPHONE_67/02_b.png", "b");
        tree.write("en-US/APP_IPHONE_67/intro.mov", "video");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto summary = sync.upload(tree.root(), api.version_id, UploadOptions{});
        assert(summary.succeeded == 4);

        const auto screenshots = api.set_id_for("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        assert((api.file_names(screenshots) == std::vector<std::string>{"01_a.png", "02_b.png", "03_c.png"}));
        const auto previews = api.set_id_for("en-US", "APP_IPHONE_67", AssetKind::Preview);
        assert((api.file_names(previews) == std::vector<std::string>{"intro.mov"}));
        assert(api.count("reorder_set") == 2);
        assert(contains(out.str(), "Screenshot 1/3: 01_a.png... Done."));
    }

    void test_upload_appends_after_existing_items()
    {
        TempTree tree("ascmedia_upload_append");
        tree.write("en-US/APP_IPHONE_67/a.png", "a");
        tree.write("en-US/APP_IPHONE_67/b.png", "b");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(set_id, "old.png", AssetState::Complete);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto summary = sync.upload(tree.root(), api.version_id, UploadOptions{});
        assert(summary.succeeded == 2);
        assert((api.file_names(set_id) == std::vector<std::string>{"old.png", "a.png", "b.png"}));
        assert(api.count("delete_asset") == 0);
        assert(api.count("create_set") == 0);
    }

    void test_upload_replace_deletes_before_reserve()
    {
        TempTree tree("ascmedia_upload_replace");
        tree.write("en-US/APP_IPHONE_67/a.png", "a");
        tree.write("en-US/APP_IPHONE_67/b.png", "b");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(set_id, "old1.png", AssetState::Complete);
        api.add_asset(set_id, "old2.png", AssetState::Failed);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        UploadOptions options;
        options.replace = true;
        const auto summary = sync.upload(tree.root(), api.version_id, options);

        assert(summary.succeeded == 2);
        assert(api.count("delete_asset") == 2);
        assert(api.last_index("delete_asset") < api.first_index("reserve_asset"));
        assert((api.file_names(set_id) == std::vector<std::string>{"a.png", "b.png"}));
    }

    void test_upload_replace_aborts_set_on_delete_failure()
    {
        TempTree tree("ascmedia_upload_replace_fail");
        tree.write("en-US/APP_IPHONE_67/a.png", "a");
        tree.write("en-US/APP_IPHONE_67/b.png", "b");
        tree.write("en-US/APP_IPAD_PRO_129/c.png", "c");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        const auto stuck = api.add_asset(set_id, "old.png", AssetState::Complete);
        api.failing_deletes.insert(stuck);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        UploadOptions options;
        options.replace = true;
        const auto summary = sync.upload(tree.root(), api.version_id, options);

        // The iPad group still uploads.
        assert(summary.succeeded == 1);
        assert(summary.failed == 2);
        assert(!summary.ok());
        assert(api.count("reserve_asset") == 1);
        assert(api.order(set_id) == std::vector<std::string>{stuck});
    }

    void test_upload_skips_missing_locale()
    {
        TempTree tree("ascmedia_upload_locale");
        tree.write("de-DE/APP_IPHONE_67/a.png", "a");
        tree.write("en-US/APP_IPHONE_67/b.png", "b");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto summary = sync.upload(tree.root(), api.version_id, UploadOptions{});
        assert(summary.succeeded == 1);
        assert(summary.skipped == 1);
        assert(summary.failed == 0);
    }

    void test_upload_wait_polls_each_asset()
    {
        TempTree tree("ascmedia_upload_wait");
        tree.write("en-US/APP_IPHONE_67/a.png", "a");
        tree.write("en-US/APP_IPHONE_67/b.png", "b");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        api.poll_states = {AssetState::UploadComplete, AssetState::Complete, AssetState::Failed};

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        std::size_t sleeps = 0;
        sync.set_poll_sleeper([&](std::chrono::milliseconds)
                              { ++sleeps; });
        UploadOptions options;
        options.wait = true;
        options.poll.interval = std::chrono::milliseconds(10);
        options.poll.timeout = std::chrono::milliseconds(100);
        const auto summary = sync.upload(tree.root(), api.version_id, options);

        assert(api.count("get_asset") == 3);
        assert(sleeps == 1);
        assert(summary.succeeded == 1);
        assert(summary.failed == 1);
        assert(contains(out.str(), "a.png: complete"));
        assert(contains(out.str(), "b.png: failed"));
    }

    void test_round_trip_download()
    {
        TempTree source("ascmedia_roundtrip_src");
        TempTree target("ascmedia_roundtrip_dst");
        const auto image = source.write("en-US/APP_IPHONE_67/shot.png", "PNG bytes that span several chunks");
        const auto video = source.write("en-US/APP_IPHONE_67/clip.mp4", "MP4 bytes");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        assert(sync.upload(source.root(), api.version_id, UploadOptions{}).succeeded == 2);

        const auto summary = sync.download(target.root(), api.version_id);
        assert(summary.succeeded == 2);
        assert(summary.failed == 0);

        const auto downloaded_image = target.root() / "en-US" / "APP_IPHONE_67" / "01_shot.png";
        const auto downloaded_video = target.root() / "en-US" / "APP_IPHONE_67" / "01_clip.mp4";
        assert(crypto::md5_file(downloaded_image) == crypto::md5_file(image));
        assert(crypto::md5_file(downloaded_video) == crypto::md5_file(video));
        assert(!std::filesystem::exists(downloaded_image.string() + ".part"));
    }

    void test_download_names_and_partial_failure()
    {
        TempTree target("ascmedia_download_names");
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(set_id, "same.png", AssetState::Complete, "first");
        const auto broken = api.add_asset(set_id, "same.png", AssetState::Complete, "second");
        api.add_asset(set_id, "same.png", AssetState::Complete, "third");
        api.failing_fetches.insert(broken);
        api.add_set("en-US", "APP_IPAD_PRO_129", AssetKind::Screenshot);

        // A stale copy is replaced, not kept.
        const auto first = target.write("en-US/APP_IPHONE_67/01_same.png", "stale");

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto summary = sync.download(target.root(), api.version_id);

        assert(summary.succeeded == 2);
        assert(summary.failed == 1);
        assert(read_file(first) == "first");
        assert(!std::filesystem::exists(target.root() / "en-US" / "APP_IPHONE_67" / "02_same.png"));
        assert(read_file(target.root() / "en-US" / "APP_IPHONE_67" / "03_same.png") == "third");
        assert(!std::filesystem::exists(target.root() / "en-US" / "APP_IPAD_PRO_129"));
        assert(api.mutation_count() == 0);
    }

    void test_download_continues_after_listing_failure()
    {
        TempTree target("ascmedia_download_listing_failure");
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto broken = api.add_set("de-DE", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(broken, "lost.png", AssetState::Complete, "lost");
        api.failing_listings.insert(broken);
        const auto healthy = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(healthy, "kept.png", AssetState::Complete, "kept");
        const auto gone = api.add_set("fr-FR", "APP_IPHONE_67", AssetKind::Screenshot);
        api.vanished_sets.insert(gone);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto summary = sync.download(target.root(), api.version_id);

        assert(summary.succeeded == 1);
        assert(summary.failed == 1);
        assert(summary.skipped == 1);
        assert(summary.failures[0].code == ErrorCode::Transport);
        assert(summary.failures[0].subject == "[de-DE] APP_IPHONE_67 (screenshots)");
        assert(read_file(target.root() / "en-US" / "APP_IPHONE_67" / "01_kept.png") == "kept");
        assert(!std::filesystem::exists(target.root() / "de-DE"));
        assert(contains(out.str(), "could not be listed"));
        assert(contains(out.str(), "not found, skipped"));
    }

    void test_download_rejects_unsafe_folder_names()
    {
        TempTree target("ascmedia_download_unsafe/root");
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto escaping = api.add_set("..", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(escaping, "a.png", AssetState::Complete, "escaped");
        const auto nested = api.add_set("en-US", "x/../../y", AssetKind::Screenshot);
        api.add_asset(nested, "b.png", AssetState::Complete, "nested");
        const auto blank = api.add_set("", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(blank, "c.png", AssetState::Complete, "blank");
        const auto backslash = api.add_set("en-US", "..\\up", AssetKind::Screenshot);
        api.add_asset(backslash, "d.png", AssetState::Complete, "backslash");
        const auto safe = api.add_set("ja", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(safe, "e.png", AssetState::Complete, "safe");

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto summary = sync.download(target.root(), api.version_id);

        assert(summary.succeeded == 1);
        assert(summary.failed == 4);
        for (const auto &failure : summary.failures)
        {
            assert(failure.code == ErrorCode::InvalidResponse);
        }
        assert(api.count("fetch_bytes") == 1);
        assert(read_file(target.root() / "ja" / "APP_IPHONE_67" / "01_e.png") == "safe");
        assert(!std::filesystem::exists(target.root().parent_path() / "APP_IPHONE_67"));
        assert(!std::filesystem::exists(target.root() / "y"));
        assert(contains(out.str(), "Unusable folder name"));
    }

    void test_delivery_urls()
    {
        assert(resolve_image_url("https://cdn/{w}x{h}bb.{f}", 1290, 2796, "a.JPEG") == "https://cdn/1290x2796bb.jpg");
        assert(resolve_image_url("https://cdn/{w}x{h}bb.{f}", 640, 480, "a.png") == "https://cdn/640x480bb.png");
        assert(resolve_image_url("https://cdn/{w}/{w}", 7, 8, "noext") == "https://cdn/7/7");

        RemoteAsset screenshot;
        screenshot.id = "s1";
        screenshot.kind = AssetKind::Screenshot;
        assert(ordinal_file_name(screenshot, 3) == "03_s1.png");
        screenshot.file_name = "../escape.png";
        assert(ordinal_file_name(screenshot, 12) == "12_escape.png");

        bool threw = false;
        try
        {
            delivery_url(screenshot);
        }
        catch (const Error &error)
        {
            threw = error.code() == ErrorCode::InvalidResponse;
        }
        assert(threw);

        RemoteAsset preview;
        preview.id = "p1";
        preview.kind = AssetKind::Preview;
        preview.video_url = "https://cdn/video.mp4";
        assert(delivery_url(preview) == "https://cdn/video.mp4");
        assert(ordinal_file_name(preview, 1) == "01_p1.mp4");
    }

    void test_verify_reports_stuck_items()
    {
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(set_id, "a.png", AssetState::Complete);
        api.add_asset(set_id, "b.png", AssetState::UploadComplete);
        api.add_asset(set_id, "c.png", AssetState::Complete);
        api.add_set("en-US", "APP_IPHONE_65", AssetKind::Screenshot);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto report = sync.verify(api.version_id);

        assert(report.sets.size() == 1);
        assert(report.total() == 3);
        assert(report.stuck() == 1);
        assert(report.failed() == 0);
        assert(!report.all_complete());
        assert(report.sets[0].items[1].stuck());
        assert(report.sets[0].items[1].position == 2);
        assert(contains(out.str(), "#2  b.png    UPLOAD_COMPLETE"));
        assert(!contains(out.str(), "3/3 complete"));
        assert(contains(out.str(), "2 of 3 complete, 1 stuck."));
        assert(api.mutation_count() == 0);
    }

    void test_verify_compact_when_complete()
    {
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(set_id, "a.png", AssetState::Complete);
        api.add_asset(set_id, "b.png", AssetState::Complete);
        api.add_asset(set_id, "c.png", AssetState::Complete);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto report = sync.verify(api.version_id);

        assert(report.all_complete());
        assert(report.stuck() == 0);
        assert(contains(out.str(), "[en-US] APP_IPHONE_67: 3/3 complete"));
        assert(contains(out.str(), "All 3 media items complete."));
        assert(!contains(out.str(), "#1"));
        assert(api.mutation_count() == 0);
    }

    void test_verify_never_mutates()
    {
        Logger logger(std::nullopt);
        const std::vector<std::vector<AssetState>> compositions = {
            {},
            {AssetState::AwaitingUpload},
            {AssetState::Failed, AssetState::Complete},
            {AssetState::UploadComplete, AssetState::Unknown, AssetState::Complete},
        };
        for (const auto &states : compositions)
        {
            FakeMediaApi api;
            const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
            for (const auto state : states)
            {
                api.add_asset(set_id, "x.png", state);
            }
            const auto gone = api.add_set("fr-FR", "APP_IPHONE_67", AssetKind::Screenshot);
            api.vanished_sets.insert(gone);

            StateVerifier verifier(api, logger);
            const auto report = verifier.verify(api.version_id);
            assert(report.total() == states.size());
            assert(report.unlisted.size() == 1);
            assert(api.mutation_count() == 0);
        }
    }

    void test_verify_reports_listing_failure()
    {
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto healthy = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(healthy, "a.png", AssetState::Complete);
        api.add_asset(healthy, "b.png", AssetState::UploadComplete);
        const auto broken = api.add_set("fr-FR", "APP_IPHONE_67", AssetKind::Preview);
        api.add_asset(broken, "clip.mp4", AssetState::Complete);
        api.failing_listings.insert(broken);
        const auto gone = api.add_set("ja", "APP_IPHONE_67", AssetKind::Screenshot);
        api.vanished_sets.insert(gone);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto report = sync.verify(api.version_id);
        assert(report.total() == 2);
        assert(report.unlisted.size() == 2);
        assert(contains(out.str(), "[fr-FR] APP_IPHONE_67 (previews): could not be listed"));
        assert(contains(out.str(), "[ja] APP_IPHONE_67: not found, skipped"));

        const auto summary = verify_summary(report);
        assert(summary.succeeded == 1);
        assert(summary.skipped == 2);
        assert(summary.failed == 1);
        assert(summary.failures[0].code == ErrorCode::Transport);
        assert(!summary.ok());
    }

    void test_verify_summary_when_complete()
    {
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(set_id, "a.png", AssetState::Complete);
        api.add_asset(set_id, "b.png", AssetState::Complete);

        StateVerifier verifier(api, logger);
        const auto summary = verify_summary(verifier.verify(api.version_id));
        std::ostringstream out;
        print_summary(summary, out);
        assert(summary.ok());
        assert(contains(out.str(), "Succeeded: 2  Failed: 0  Skipped: 0"));
    }

    void test_repair_refuses_cardinality_mismatch()
    {
        TempTree tree("ascmedia_repair_mismatch");
        tree.write("en-US/APP_IPHONE_67/a.png", "a");
        tree.write("en-US/APP_IPHONE_67/b.png", "b");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(set_id, "a.png", AssetState::Complete);
        api.add_asset(set_id, "b.png", AssetState::UploadComplete);
        api.add_asset(set_id, "c.png", AssetState::Complete);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto report = sync.verify(api.version_id);
        const auto index = scan_media_folder(tree.root());
        const auto plan = plan_repair(report, index);

        assert(plan.task_count() == 0);
        assert(plan.conflicts.size() == 1);
        assert(plan.conflicts[0].remote_items == 3);
        assert(plan.conflicts[0].local_files == 2);

        const auto summary = sync.repair(plan, api.version_id);
        assert(summary.failed == 1);
        assert(summary.failures[0].code == ErrorCode::CardinalityMismatch);
        assert(api.mutation_count() == 0);
    }

    void test_repair_by_position()
    {
        TempTree tree("ascmedia_repair_position");
        tree.write("en-US/APP_IPHONE_67/1.png", "one");
        tree.write("en-US/APP_IPHONE_67/2.png", "two");
        tree.write("en-US/APP_IPHONE_67/3.png", "three");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        const auto first = api.add_asset(set_id, "renamed-a.png", AssetState::Complete);
        const auto stuck = api.add_asset(set_id, "renamed-b.png", AssetState::UploadComplete);
        const auto third = api.add_asset(set_id, "renamed-c.png", AssetState::Complete);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto report = sync.verify(api.version_id);
        const auto index = scan_media_folder(tree.root());
        const auto plan = plan_repair(report, index);
        assert(plan.task_count() == 1);
        assert(plan.sets[0].tasks[0].file->file_name == "2.png");

        const auto summary = sync.repair(plan, api.version_id);
        assert(summary.succeeded == 1);
        assert(summary.failed == 0);
        assert(api.count("delete_asset") == 1);
        assert(api.count("reorder_set") == 1);
        assert(api.first_index("delete_asset") < api.first_index("reserve_asset"));
        assert(api.last_index("reorder_set") > api.last_index("commit_asset"));

        const auto order = api.order(set_id);
        assert(order.size() == 3);
        assert(order[0] == first);
        assert(order[1] != stuck);
        assert(order[2] == third);
        assert(api.content(order[1]) == "two");
        assert(contains(out.str(), "Re-verifying"));
    }

    void test_repair_orders_current_contents()
    {
        TempTree tree("ascmedia_repair_current");
        tree.write("en-US/APP_IPHONE_67/1.png", "one");
        tree.write("en-US/APP_IPHONE_67/2.png", "two");
        tree.write("en-US/APP_IPHONE_67/3.png", "three");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        const auto first = api.add_asset(set_id, "a.png", AssetState::Complete);
        api.add_asset(set_id, "b.png", AssetState::UploadComplete);
        const auto third = api.add_asset(set_id, "c.png", AssetState::Complete);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto report = sync.verify(api.version_id);
        const auto plan = plan_repair(report, scan_media_folder(tree.root()));
        assert(plan.task_count() == 1);

        // Added by someone else while the operator was answering the prompt.
        const auto extra = api.add_asset(set_id, "extra.png", AssetState::Complete);

        const auto summary = sync.repair(plan, api.version_id);
        assert(summary.succeeded == 1);
        assert(summary.failed == 0);
        assert(api.count("reorder_set") == 1);
        assert(contains(out.str(), "order restored"));

        const auto order = api.order(set_id);
        assert(order.size() == 4);
        assert(order[0] == first);
        assert(api.content(order[1]) == "two");
        assert(order[2] == third);
        assert(order[3] == extra);
    }

    void test_repair_keeps_undeletable_reservation()
    {
        TempTree tree("ascmedia_repair_orphan");
        tree.write("en-US/APP_IPHONE_67/1.png", "one");
        tree.write("en-US/APP_IPHONE_67/2.png", "two");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        const auto first = api.add_asset(set_id, "a.png", AssetState::Complete);
        const auto stuck = api.add_asset(set_id, "b.png", AssetState::UploadComplete);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto plan = plan_repair(sync.verify(api.version_id), scan_media_folder(tree.root()));
        assert(plan.task_count() == 1);

        // Every upload attempt fails and the first reservation cannot be discarded.
        const std::string orphan = "asset-4";
        api.chunk_failures = 100;
        api.failing_deletes.insert(orphan);

        const auto summary = sync.repair(plan, api.version_id);
        assert(summary.succeeded == 0);
        assert(summary.failed == 1);
        assert(summary.failures[0].subject == "[en-US] APP_IPHONE_67 (screenshots) #2");
        assert(api.count("reorder_set") == 1);
        assert(!contains(out.str(), "reorder failed"));
        assert((api.order(set_id) == std::vector<std::string>{first, orphan}));
        assert(api.order(set_id)[1] != stuck);
    }

    void test_repair_delete_failure_keeps_item()
    {
        TempTree tree("ascmedia_repair_delete_fail");
        tree.write("en-US/APP_IPHONE_67/1.png", "one");
        tree.write("en-US/APP_IPHONE_67/2.png", "two");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        const auto failed = api.add_asset(set_id, "1.png", AssetState::Failed);
        const auto stuck = api.add_asset(set_id, "2.png", AssetState::AwaitingUpload);
        api.failing_deletes.insert(failed);

        std::ostringstream out;
        MediaSync sync(api, logger, out, fast_options());
        const auto report = sync.verify(api.version_id);
        const auto plan = plan_repair(report, scan_media_folder(tree.root()));
        assert(plan.task_count() == 2);

        const auto summary = sync.repair(plan, api.version_id);
        assert(summary.succeeded == 1);
        assert(summary.failed == 1);
        assert(api.count("reserve_asset") == 1);

        const auto order = api.order(set_id);
        assert(order.size() == 2);
        assert(order[0] == failed);
        assert(order[1] != stuck);
    }

    void test_repair_skips_groups_without_local_folder()
    {
        TempTree tree("ascmedia_repair_unmatched");
        tree.write("en-US/APP_IPAD_PRO_129/1.png", "one");

        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        api.add_asset(set_id, "1.png", AssetState::UploadComplete);

        StateVerifier verifier(api, logger);
        const auto plan = plan_repair(verifier.verify(api.version_id), scan_media_folder(tree.root()));
        assert(plan.task_count() == 0);
        assert(plan.conflicts.empty());
        assert(plan.unmatched == 1);
    }

    void test_reorder_coordinator()
    {
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        const auto a = api.add_asset(set_id, "a.png", AssetState::Complete);
        const auto b = api.add_asset(set_id, "b.png", AssetState::Complete);

        ReorderCoordinator reorder(api, logger);
        assert(!reorder.apply(AssetKind::Screenshot, set_id, {}));
        assert(api.count("reorder_set") == 0);

        assert(reorder.apply(AssetKind::Screenshot, set_id, {b, a}));
        assert((api.order(set_id) == std::vector<std::string>{b, a}));

        bool threw = false;
        try
        {
            reorder.apply(AssetKind::Screenshot, set_id, {a, a});
        }
        catch (const Error &error)
        {
            threw = error.code() == ErrorCode::InvalidArgument;
        }
        assert(threw);
        assert(api.count("reorder_set") == 1);

        const auto order = order_with_appended({"old", "n2", "orphan", "n1"}, {"n1", "n2", "lost"});
        assert((order == std::vector<std::string>{"old", "orphan", "n1", "n2"}));

        const auto repaired = order_with_replacements({"a", "c", "orphan", "r1", "r0"},
                                                      {{1, "r1"}, {0, "r0"}, {2, "lost"}, {9, "gone"}});
        assert((repaired == std::vector<std::string>{"r0", "r1", "a", "c", "orphan"}));
        const auto tail = order_with_replacements({"a", "r"}, {{5, "r"}});
        assert((tail == std::vector<std::string>{"a", "r"}));
    }

    void test_completion_poller()
    {
        Logger logger(std::nullopt);
        FakeMediaApi api;
        const auto set_id = api.add_set("en-US", "APP_IPHONE_67", AssetKind::Screenshot);
        const auto id = api.add_asset(set_id, "a.png", AssetState::UploadComplete);

        std::vector<std::chrono::milliseconds> sleeps;
        auto sleeper = [&](std::chrono::milliseconds delay)
        { sleeps.push_back(delay); };
        PollOptions options{std::chrono::milliseconds(10), std::chrono::milliseconds(30)};

        api.poll_states = {AssetState::AwaitingUpload, AssetState::UploadComplete, AssetState::Complete};
        CompletionPoller poller(api, logger, options, sleeper);
        auto result = poller.wait(AssetKind::Screenshot, id);
        assert(result.outcome == PollOutcome::Complete);
        assert(result.polls == 3);
        assert(sleeps.size() == 2);
        assert(sleeps[0] == std::chrono::milliseconds(10));

        sleeps.clear();
        api.set_state(id, AssetState::UploadComplete);
        result = poller.wait(AssetKind::Screenshot, id);
        assert(result.outcome == PollOutcome::TimedOut);
        assert(result.polls == 4);
        assert(sleeps.size() == 3);
        assert(result.asset.state == AssetState::UploadComplete);

        api.poll_transport_failures = 1;
        api.poll_states = {AssetState::Failed};
        result = poller.wait(AssetKind::Screenshot, id);
        assert(result.outcome == PollOutcome::Failed);
        assert(result.polls == 2);
    }

    void test_summary_output()
    {
        OperationSummary summary;
        summary.succeeded = 2;
        summary.skipped = 1;
        summary.record_failure("en-US/a.png", ErrorCode::Integrity, "checksum mismatch");
        std::ostringstream out;
        print_summary(summary, out);
        assert(contains(out.str(), "en-US/a.png: integrity_error: checksum mismatch"));
        assert(contains(out.str(), "Succeeded: 2  Failed: 1  Skipped: 1"));
        assert(!summary.ok());
    }

} // namespace

void run_sync_engine_tests()
{
    test_scan_classifies_and_orders();
    test_scan_empty_and_missing_root();
    test_set_resolver();
    test_fetch_sets_skips_vanished();
    test_pipeline_uploads_in_chunks();
    test_pipeline_retries_chunk();
    test_pipeline_restarts_from_reserve();
    test_pipeline_gives_up_after_reserve_attempts();
    test_pipeline_integrity_error();
    test_pipeline_reserve_failures();
    test_clear_set_stops_on_failed_delete();
    test_upload_skips_unsupported_files();
    test_upload_keeps_local_order();
    test_upload_appends_after_existing_items();
    test_upload_replace_deletes_before_reserve();
    test_upload_replace_aborts_set_on_delete_failure();
    test_upload_skips_missing_locale();
    test_upload_wait_polls_each_asset();
    test_round_trip_download();
    test_download_names_and_partial_failure();
    test_download_continues_after_listing_failure();
    test_download_rejects_unsafe_folder_names();
    test_delivery_urls();
    test_verify_reports_stuck_items();
    test_verify_compact_when_complete();
    test_verify_never_mutates();
    test_verify_reports_listing_failure();
    test_verify_summary_when_complete();
    test_repair_refuses_cardinality_mismatch();
    test_repair_by_position();
    test_repair_orders_current_contents();
    test_repair_keeps_undeletable_reservation();
    test_repair_delete_failure_keeps_item();
    test_repair_skips_groups_without_local_folder();
    test_reorder_coordinator();
    test_completion_poller();
    test_summary_output();
}
