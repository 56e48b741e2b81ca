#include "ascmedia/crypto.hpp"

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <openssl/evp.h>
#include <sodium.h>

#include "ascmedia/error_codes.hpp"

namespace ascmedia::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

        struct DigestContextDeleter
        {
            void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
        };

        using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

        DigestContext make_md5_context()
        {
            DigestContext ctx(EVP_MD_CTX_new());
            if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
            {
                throw std::runtime_error("EVP_DigestInit_ex(md5) failed");
            }
            return ctx;
        }

        std::string finish_md5(EVP_MD_CTX *ctx)
        {
            unsigned char digest[EVP_MAX_MD_SIZE];
            unsigned int length = 0;
            if (EVP_DigestFinal_ex(ctx, digest, &length) != 1)
            {
                throw std::runtime_error("EVP_DigestFinal_ex failed");
            }
            return to_hex(std::span<const unsigned char>(digest, length));
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string md5_bytes(std::span<const std::byte> data)
    {
        auto ctx = make_md5_context();
        if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
        {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
        return finish_md5(ctx.get());
    }

    std::string md5_stream(std::istream &input)
    {
        auto ctx = make_md5_context();
        std::vector<char> buffer(1024 * 1024);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                if (EVP_DigestUpdate(ctx.get(), buffer.data(), read_count) != 1)
                {
                    throw std::runtime_error("EVP_DigestUpdate failed");
                }
            }
        }
        return finish_md5(ctx.get());
    }

    std::string md5_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw Error(ErrorCode::FileIo, "Cannot read file at '" + path.string() + "'.");
        }
        return md5_stream(file);
    }

    std::string to_hex(std::span<const unsigned char> data)
    {
        ensure_initialized_once();
        std::string result(data.size() * 2 + 1, '\0');
        sodium_bin2hex(result.data(), result.size(), data.data(), data.size());
        result.resize(data.size() * 2);
        return result;
    }

    std::string base64url_encode(std::span<const unsigned char> data)
    {
        ensure_initialized_once();
        constexpr int kVariant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
        std::string result(sodium_base64_ENCODED_LEN(data.size(), kVariant), '\0');
        sodium_bin2base64(result.data(), result.size(), data.data(), data.size(), kVariant);
        result.resize(std::char_traits<char>::length(result.c_str()));
        return result;
    }

    std::vector<unsigned char> base64url_decode(std::string_view encoded)
    {
        ensure_initialized_once();
        std::vector<unsigned char> output(encoded.size());
        std::size_t decoded_length = 0;
        if (sodium_base642bin(output.data(), output.size(), encoded.data(), encoded.size(), nullptr, &decoded_length,
                              nullptr, sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0)
        {
            throw Error(ErrorCode::InvalidArgument, "Invalid base64url input");
        }
        output.resize(decoded_length);
        return output;
    }

} // namespace ascmedia::crypto
