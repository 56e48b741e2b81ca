#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace ascmedia::client
{

    enum class CommandKind
    {
        Help,
        Version,
        Configure,
        Upload,
        Download,
        Verify
    };

    struct ClientConfig
    {
        CommandKind command{CommandKind::Help};
        std::string version_id;
        std::optional<std::filesystem::path> folder;
        bool replace{};
        bool assume_yes{};
        bool wait{};
        std::size_t concurrency{4};
        std::optional<std::size_t> max_upload_rate;
        std::optional<std::size_t> max_download_rate;
        std::chrono::seconds poll_interval{5};
        std::chrono::seconds poll_timeout{300};
        std::optional<std::filesystem::path> log_path;
    };

    // Throws ascmedia::Error(InvalidArgument) with a message fit for the terminal.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace ascmedia::client
