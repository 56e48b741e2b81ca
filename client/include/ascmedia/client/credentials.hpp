#pragma once

#include <filesystem>
#include <string>

namespace ascmedia::client
{

    struct Credentials
    {
        std::string key_id;
        std::string issuer_id;
        std::filesystem::path private_key_path;
    };

    // ~/.ascmedia
    std::filesystem::path config_directory();

    // $ASCMEDIA_CONFIG, or config.json inside config_directory().
    std::filesystem::path config_file_path();

    // Trims, strips surrounding quotes and backslash escapes, expands a leading "~/".
    std::string expand_path(const std::string &input);

    // Throws Error(NotFound) when the file or the key it names is missing and
    // Error(InvalidArgument) when a field is absent.
    Credentials load_credentials(const std::filesystem::path &path);

    // Writes the file with owner-only permissions, creating its directory (0700) if needed.
    void save_credentials(const Credentials &credentials, const std::filesystem::path &path);

    // Copies the key next to the config file (0600) and returns the copy's path.
    std::filesystem::path install_private_key(const std::filesystem::path &source,
                                              const std::filesystem::path &directory);

} // namespace ascmedia::client
