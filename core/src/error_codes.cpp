#include "ascmedia/error_codes.hpp"

#include <array>

namespace ascmedia
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::InvalidResponse, "invalid_response"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Transport, "transport_error"},
            {ErrorCode::Integrity, "integrity_error"},
            {ErrorCode::CardinalityMismatch, "cardinality_mismatch"},
            {ErrorCode::ReserveRejected, "reserve_rejected"},
            {ErrorCode::NoUploadOperations, "no_upload_operations"},
            {ErrorCode::FileIo, "file_io"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace ascmedia
