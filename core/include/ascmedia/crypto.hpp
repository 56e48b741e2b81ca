/**
 * ascmedia - Content checksums and encodings built on OpenSSL and libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ascmedia::crypto
{

    void ensure_sodium_init();

    // Lower-case hex MD5, the checksum the commit call expects.
    std::string md5_bytes(std::span<const std::byte> data);

    std::string md5_stream(std::istream &input);

    std::string md5_file(const std::filesystem::path &path);

    std::string to_hex(std::span<const unsigned char> data);

    std::string base64url_encode(std::span<const unsigned char> data);

    std::vector<unsigned char> base64url_decode(std::string_view encoded);

} // namespace ascmedia::crypto
