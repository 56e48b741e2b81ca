/**
 * ascmedia - Per-command outcome counts.
 */
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "ascmedia/error_codes.hpp"

namespace ascmedia
{

    struct ItemFailure
    {
        std::string subject;
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
    };

    struct OperationSummary
    {
        std::size_t succeeded{};
        std::size_t failed{};
        std::size_t skipped{};
        std::vector<ItemFailure> failures;

        // `items` counts the files the failure stands for, such as every file of a refused group.
        void record_failure(std::string subject, ErrorCode code, std::string message, std::size_t items = 1);
        void merge(const OperationSummary &other);
        bool ok() const noexcept { return failed == 0; }
    };

    // Lists the failures, then "Succeeded: N  Failed: N  Skipped: N".
    void print_summary(const OperationSummary &summary, std::ostream &out);

} // namespace ascmedia
