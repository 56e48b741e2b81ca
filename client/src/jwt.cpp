#include "ascmedia/client/jwt.hpp"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <array>
#include <fstream>
#include <iterator>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "ascmedia/crypto.hpp"
#include "ascmedia/error_codes.hpp"

namespace ascmedia::client
{

    namespace
    {

        constexpr auto kAudience = "appstoreconnect-v1";
        constexpr std::size_t kCoordinateSize = 32;

        struct BioDeleter
        {
            void operator()(BIO *bio) const { BIO_free(bio); }
        };

        struct KeyDeleter
        {
            void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
        };

        struct DigestDeleter
        {
            void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
        };

        struct SignatureDeleter
        {
            void operator()(ECDSA_SIG *sig) const { ECDSA_SIG_free(sig); }
        };

        std::string encode_segment(const nlohmann::json &json)
        {
            const auto text = json.dump();
            return crypto::base64url_encode(
                std::span<const unsigned char>(reinterpret_cast<const unsigned char *>(text.data()), text.size()));
        }

        std::unique_ptr<EVP_PKEY, KeyDeleter> read_key(const std::string &pem)
        {
            std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
            if (!bio)
            {
                throw Error(ErrorCode::InternalError, "Cannot allocate key buffer");
            }
            std::unique_ptr<EVP_PKEY, KeyDeleter> key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
            if (!key)
            {
                throw Error(ErrorCode::AuthenticationFailed, "Private key is not a valid PEM key");
            }
            if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_EC || EVP_PKEY_bits(key.get()) != 256)
            {
                throw Error(ErrorCode::AuthenticationFailed, "Private key is not a P-256 EC key");
            }
            return key;
        }

        // DER ECDSA signature to the fixed-width R||S form JWS expects.
        std::array<unsigned char, 2 * kCoordinateSize> raw_signature(const std::vector<unsigned char> &der)
        {
            const unsigned char *cursor = der.data();
            std::unique_ptr<ECDSA_SIG, SignatureDeleter> sig(
                d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der.size())));
            if (!sig)
            {
                throw Error(ErrorCode::InternalError, "Cannot decode ECDSA signature");
            }
            const BIGNUM *r = nullptr;
            const BIGNUM *s = nullptr;
            ECDSA_SIG_get0(sig.get(), &r, &s);

            std::array<unsigned char, 2 * kCoordinateSize> raw{};
            if (BN_bn2binpad(r, raw.data(), kCoordinateSize) != static_cast<int>(kCoordinateSize) ||
                BN_bn2binpad(s, raw.data() + kCoordinateSize, kCoordinateSize) != static_cast<int>(kCoordinateSize))
            {
                throw Error(ErrorCode::InternalError, "ECDSA signature has an unexpected size");
            }
            return raw;
        }

    } // namespace

    TokenSigner::TokenSigner(std::string key_id, std::string issuer_id, std::string private_key_pem)
        : key_id_(std::move(key_id)), issuer_id_(std::move(issuer_id)), private_key_pem_(std::move(private_key_pem))
    {
        // Fail on a bad key now rather than on the first request.
        read_key(private_key_pem_);
    }

    std::unique_ptr<TokenSigner> TokenSigner::from_credentials(const Credentials &credentials)
    {
        std::ifstream in(credentials.private_key_path, std::ios::binary);
        if (!in.is_open())
        {
            throw Error(ErrorCode::NotFound,
                        "Private key file not found at " + credentials.private_key_path.string());
        }
        std::string pem((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return std::make_unique<TokenSigner>(credentials.key_id, credentials.issuer_id, std::move(pem));
    }

    std::string TokenSigner::token()
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        if (cached_.empty() || expires_at_ - now < kRenewMargin)
        {
            cached_ = sign(key_id_, issuer_id_, private_key_pem_, now, kLifetime);
            expires_at_ = now + kLifetime;
        }
        return cached_;
    }

    std::string TokenSigner::sign(const std::string &key_id, const std::string &issuer_id,
                                  const std::string &private_key_pem, std::chrono::system_clock::time_point issued_at,
                                  std::chrono::seconds lifetime)
    {
        crypto::ensure_sodium_init();
        const auto key = read_key(private_key_pem);

        const auto iat = std::chrono::duration_cast<std::chrono::seconds>(issued_at.time_since_epoch()).count();
        const nlohmann::json header = {{"alg", "ES256"}, {"kid", key_id}, {"typ", "JWT"}};
        const nlohmann::json claims = {
            {"iss", issuer_id},
            {"iat", iat},
            {"exp", iat + lifetime.count()},
            {"aud", kAudience},
        };
        const auto signing_input = encode_segment(header) + "." + encode_segment(claims);

        std::unique_ptr<EVP_MD_CTX, DigestDeleter> ctx(EVP_MD_CTX_new());
        std::size_t der_size = 0;
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1 ||
            EVP_DigestSign(ctx.get(), nullptr, &der_size,
                           reinterpret_cast<const unsigned char *>(signing_input.data()), signing_input.size()) != 1)
        {
            throw Error(ErrorCode::InternalError, "Cannot initialise ES256 signing");
        }
        std::vector<unsigned char> der(der_size);
        if (EVP_DigestSign(ctx.get(), der.data(), &der_size,
                           reinterpret_cast<const unsigned char *>(signing_input.data()), signing_input.size()) != 1)
        {
            throw Error(ErrorCode::InternalError, "ES256 signing failed");
        }
        der.resize(der_size);

        const auto raw = raw_signature(der);
        return signing_input + "." + crypto::base64url_encode(std::span<const unsigned char>(raw.data(), raw.size()));
    }

} // namespace ascmedia::client
