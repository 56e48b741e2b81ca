#include "ascmedia/state_verifier.hpp"

#include <algorithm>

namespace ascmedia
{

    namespace
    {

        std::string set_label(const GroupKey &key)
        {
            auto label = "[" + key.locale + "] " + key.display_type;
            if (key.kind == AssetKind::Preview)
            {
                label += " (previews)";
            }
            return label;
        }

        std::string plural(std::size_t count, const std::string &noun)
        {
            return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
        }

    } // namespace

    std::size_t SetStatus::complete_count() const
    {
        return static_cast<std::size_t>(
            std::count_if(items.begin(), items.end(), [](const ItemStatus &item)
                          { return item.complete(); }));
    }

    std::size_t VerifyReport::total() const
    {
        std::size_t count = 0;
        for (const auto &set : sets)
        {
            count += set.items.size();
        }
        return count;
    }

    std::size_t VerifyReport::complete() const
    {
        std::size_t count = 0;
        for (const auto &set : sets)
        {
            count += set.complete_count();
        }
        return count;
    }

    std::size_t VerifyReport::stuck() const
    {
        std::size_t count = 0;
        for (const auto &set : sets)
        {
            count += static_cast<std::size_t>(std::count_if(set.items.begin(), set.items.end(),
                                                            [](const ItemStatus &item)
                                                            { return item.stuck(); }));
        }
        return count;
    }

    std::size_t VerifyReport::failed() const
    {
        std::size_t count = 0;
        for (const auto &set : sets)
        {
            count += static_cast<std::size_t>(std::count_if(set.items.begin(), set.items.end(),
                                                            [](const ItemStatus &item)
                                                            { return item.failed(); }));
        }
        return count;
    }

    SetStatus set_status(const RemoteAssetSet &set)
    {
        SetStatus status;
        status.set_id = set.id;
        status.key = set.key();
        status.items.reserve(set.items.size());
        for (std::size_t index = 0; index < set.items.size(); ++index)
        {
            const auto &asset = set.items[index];
            status.items.push_back(ItemStatus{index + 1, asset.id, asset.file_name, asset.state, asset.state_errors});
        }
        return status;
    }

    StateVerifier::StateVerifier(MediaApi &api, Logger &logger)
        : api_(api), logger_(logger) {}

    VerifyReport StateVerifier::verify(const std::string &version_id)
    {
        VerifyReport report;
        for (const auto &set : fetch_sets_with_items(api_, version_id, logger_, &report.unlisted))
        {
            if (set.items.empty())
            {
                continue;
            }
            report.sets.push_back(set_status(set));
        }
        logger_.log("verify", "Version ", version_id, ": ", report.complete(), "/", report.total(), " complete, ",
                    report.stuck(), " stuck, ", report.failed(), " failed");
        return report;
    }

    void print_report(const VerifyReport &report, std::ostream &out, bool after_repair)
    {
        for (const auto &unlisted : report.unlisted)
        {
            out << set_label(unlisted.key)
                << (unlisted.vanished() ? ": not found, skipped (" : ": could not be listed (") << unlisted.message
                << ")\n";
        }
        if (report.empty())
        {
            out << "No media found for this version." << std::endl;
            return;
        }

        for (const auto &set : report.sets)
        {
            if (set.all_complete())
            {
                out << set_label(set.key) << ": " << set.items.size() << "/" << set.items.size() << " complete\n";
                continue;
            }
            out << set_label(set.key) << ":\n";
            for (const auto &item : set.items)
            {
                out << "  #" << item.position << "  " << item.file_name << "    "
                    << (item.complete() ? std::string("complete") : std::string(to_string(item.state))) << "\n";
                for (const auto &error : item.errors)
                {
                    out << "      " << error << "\n";
                }
            }
        }

        out << "\n";
        const auto total = report.total();
        if (report.all_complete())
        {
            out << "All " << plural(total, "media item") << " complete." << std::endl;
            return;
        }
        out << report.complete() << " of " << total << " complete, " << report.stuck()
            << (after_repair ? " still stuck" : " stuck");
        if (report.failed() > 0)
        {
            out << ", " << report.failed() << " failed";
        }
        out << "." << std::endl;
    }

    OperationSummary verify_summary(const VerifyReport &report)
    {
        OperationSummary summary;
        summary.succeeded = report.complete();
        summary.skipped = report.needs_repair();
        for (const auto &set : report.unlisted)
        {
            if (set.vanished())
            {
                ++summary.skipped;
                continue;
            }
            summary.record_failure(describe(set.key), set.code, set.message);
        }
        return summary;
    }

} // namespace ascmedia
