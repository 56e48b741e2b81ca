#include "ascmedia/summary.hpp"

#include <utility>

namespace ascmedia
{

    void OperationSummary::record_failure(std::string subject, ErrorCode code, std::string message,
                                          std::size_t items)
    {
        failed += items;
        failures.push_back(ItemFailure{std::move(subject), code, std::move(message)});
    }

    void OperationSummary::merge(const OperationSummary &other)
    {
        succeeded += other.succeeded;
        failed += other.failed;
        skipped += other.skipped;
        failures.insert(failures.end(), other.failures.begin(), other.failures.end());
    }

    void print_summary(const OperationSummary &summary, std::ostream &out)
    {
        out << "\n";
        if (!summary.failures.empty())
        {
            out << "Failures:\n";
            for (const auto &failure : summary.failures)
            {
                out << "  " << failure.subject << ": " << to_string(failure.code) << ": " << failure.message << "\n";
            }
        }
        out << "Succeeded: " << summary.succeeded << "  Failed: " << summary.failed << "  Skipped: "
            << summary.skipped << std::endl;
    }

} // namespace ascmedia
