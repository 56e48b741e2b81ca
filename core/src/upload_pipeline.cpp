#include "ascmedia/upload_pipeline.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <exception>
#include <fstream>
#include <span>
#include <thread>

#include "ascmedia/crypto.hpp"
#include "ascmedia/error_codes.hpp"

namespace ascmedia
{

    namespace
    {

        std::vector<std::byte> read_range(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t length)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                throw Error(ErrorCode::FileIo, "Cannot read file at '" + path.string() + "'.");
            }
            std::vector<std::byte> buffer(static_cast<std::size_t>(length));
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(length));
            if (static_cast<std::uint64_t>(in.gcount()) != length)
            {
                throw Error(ErrorCode::FileIo, "Short read from '" + path.string() + "'.");
            }
            return buffer;
        }

        void validate_operations(const ReservedAsset &reserved, std::uint64_t file_size)
        {
            for (const auto &operation : reserved.operations)
            {
                if (operation.url.empty() || operation.offset > file_size ||
                    operation.length > file_size - operation.offset)
                {
                    throw Error(ErrorCode::InvalidResponse,
                                "Upload operation for asset " + reserved.id + " is outside the file.");
                }
            }
        }

    } // namespace

    void apply_rate_limit(const std::optional<std::size_t> &rate, std::size_t bytes,
                          const std::chrono::steady_clock::time_point &start_time)
    {
        if (!rate || *rate == 0 || bytes == 0)
        {
            return;
        }
        const double expected_seconds = static_cast<double>(bytes) / static_cast<double>(*rate);
        const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
        if (elapsed < expected_seconds)
        {
            std::this_thread::sleep_for(std::chrono::duration<double>(expected_seconds - elapsed));
        }
    }

    UploadPipeline::UploadPipeline(MediaApi &api, Logger &logger, TransferOptions options)
        : api_(api), logger_(logger), options_(options)
    {
        options_.concurrency = std::max<std::size_t>(options_.concurrency, 1);
        options_.chunk_attempts = std::max<std::size_t>(options_.chunk_attempts, 1);
        options_.reserve_attempts = std::max<std::size_t>(options_.reserve_attempts, 1);
    }

    RemoteAsset UploadPipeline::upload(const LocalAssetFile &file, const std::string &set_id)
    {
        std::error_code ec;
        const auto file_size = std::filesystem::file_size(file.path, ec);
        if (ec)
        {
            throw Error(ErrorCode::FileIo, "Cannot read file at '" + file.path.string() + "'.");
        }
        const auto checksum = crypto::md5_file(file.path);

        for (std::size_t round = 1;; ++round)
        {
            // Reserve failures are final and leave nothing behind.
            const auto reserved = api_.reserve_asset(file.kind, set_id, file.file_name, file_size);
            if (reserved.id.empty())
            {
                throw Error(ErrorCode::InvalidResponse, "Reservation for '" + file.file_name + "' returned no ID.");
            }
            logger_.log("upload", "Reserved ", to_string(file.kind), " ", reserved.id, " for ", file.path.string(),
                        " (", reserved.operations.size(), " operations)");

            try
            {
                if (reserved.operations.empty())
                {
                    throw Error(ErrorCode::NoUploadOperations,
                                "No upload operations returned for '" + file.file_name + "'.");
                }
                validate_operations(reserved, file_size);
                transfer(file.path, reserved.operations);
            }
            catch (const Error &error)
            {
                discard(file.kind, reserved.id);
                if (!error.retryable() || round >= options_.reserve_attempts)
                {
                    throw;
                }
                logger_.warn("upload", "Restarting '", file.file_name, "' from reserve: ", error.what());
                continue;
            }

            try
            {
                auto committed = api_.commit_asset(file.kind, reserved.id, checksum, true);
                if (committed.id.empty())
                {
                    committed.id = reserved.id;
                }
                committed.kind = file.kind;
                logger_.log("upload", "Committed ", reserved.id, " checksum ", checksum, " state ",
                            to_string(committed.state));
                return committed;
            }
            catch (const Error &error)
            {
                logger_.warn("upload", "Commit of ", reserved.id, " failed: ", error.what());
                discard(file.kind, reserved.id);
                if (error.code() == ErrorCode::Integrity)
                {
                    throw Error(ErrorCode::Integrity,
                                "Checksum rejected for '" + file.path.string() + "': " + error.what());
                }
                throw;
            }
        }
    }

    void UploadPipeline::transfer(const std::filesystem::path &path, const std::vector<UploadOperation> &operations)
    {
        // Throttled transfers run one chunk at a time so the rate applies to the whole file.
        const auto workers = options_.max_upload_rate
                                 ? std::size_t{1}
                                 : std::min(options_.concurrency, operations.size());
        if (workers <= 1)
        {
            for (const auto &operation : operations)
            {
                transfer_operation(path, operation);
            }
            return;
        }

        std::vector<std::exception_ptr> failures(operations.size());
        asio::thread_pool pool(workers);
        for (std::size_t index = 0; index < operations.size(); ++index)
        {
            asio::post(pool, [this, &path, &operations, &failures, index]
                       {
                           try
                           {
                               transfer_operation(path, operations[index]);
                           }
                           catch (const std::exception &)
                           {
                               failures[index] = std::current_exception();
                           } });
        }
        pool.join();

        for (const auto &failure : failures)
        {
            if (failure)
            {
                std::rethrow_exception(failure);
            }
        }
    }

    void UploadPipeline::transfer_operation(const std::filesystem::path &path, const UploadOperation &operation)
    {
        const auto bytes = read_range(path, operation.offset, operation.length);
        auto backoff = options_.retry_backoff;
        for (std::size_t attempt = 1;; ++attempt)
        {
            const auto start = std::chrono::steady_clock::now();
            try
            {
                api_.put_chunk(operation, std::span<const std::byte>(bytes));
                apply_rate_limit(options_.max_upload_rate, bytes.size(), start);
                return;
            }
            catch (const Error &error)
            {
                if (!error.retryable() || attempt >= options_.chunk_attempts)
                {
                    throw;
                }
                logger_.warn("upload", "Chunk at offset ", operation.offset, " failed (attempt ", attempt, "): ",
                             error.what());
            }
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

    void UploadPipeline::discard(AssetKind kind, const std::string &asset_id)
    {
        try
        {
            api_.delete_asset(kind, asset_id);
            logger_.log("upload", "Deleted unfinished ", to_string(kind), " ", asset_id);
        }
        catch (const Error &error)
        {
            logger_.warn("upload", "Could not delete unfinished ", to_string(kind), " ", asset_id, ": ",
                         error.what());
        }
    }

    std::size_t UploadPipeline::clear_set(AssetKind kind, const std::string &set_id)
    {
        const auto items = api_.list_assets(kind, set_id);
        for (const auto &item : items)
        {
            api_.delete_asset(kind, item.id);
            logger_.log("upload", "Deleted ", to_string(kind), " ", item.id, " (", item.file_name, ") from set ",
                        set_id);
        }
        return items.size();
    }

} // namespace ascmedia
