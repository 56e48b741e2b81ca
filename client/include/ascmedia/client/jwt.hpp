#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "ascmedia/client/credentials.hpp"

namespace ascmedia::client
{

    // ES256 bearer tokens for the App Store Connect API.
    class TokenSigner
    {
    public:
        static constexpr std::chrono::seconds kLifetime{20 * 60};
        static constexpr std::chrono::seconds kRenewMargin{60};

        TokenSigner(std::string key_id, std::string issuer_id, std::string private_key_pem);

        // Reads the PEM key named by the credentials.
        static std::unique_ptr<TokenSigner> from_credentials(const Credentials &credentials);

        // Cached token, re-signed when less than kRenewMargin of its lifetime is left.
        std::string token();

        // header.claims.signature with a raw 64-byte R||S signature.
        static std::string sign(const std::string &key_id, const std::string &issuer_id,
                                const std::string &private_key_pem, std::chrono::system_clock::time_point issued_at,
                                std::chrono::seconds lifetime = kLifetime);

    private:
        std::string key_id_;
        std::string issuer_id_;
        std::string private_key_pem_;
        std::mutex mutex_;
        std::string cached_;
        std::chrono::system_clock::time_point expires_at_{};
    };

} // namespace ascmedia::client
