/**
 * ascmedia - Error codes shared by the sync engine and the command-line client.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ascmedia
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        InvalidResponse = 2,
        NotFound = 3,
        Transport = 4,
        Integrity = 5,
        CardinalityMismatch = 6,
        ReserveRejected = 7,
        NoUploadOperations = 8,
        FileIo = 9,
        Unsupported = 10,
        AuthenticationFailed = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code_(code) {}

        ErrorCode code() const noexcept { return code_; }

        // Only transport failures are worth repeating at the operation level.
        bool retryable() const noexcept { return code_ == ErrorCode::Transport; }

    private:
        ErrorCode code_;
    };

} // namespace ascmedia
