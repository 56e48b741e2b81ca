#include "ascmedia/client/session.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <utility>

#include "ascmedia/client/credentials.hpp"
#include "ascmedia/error_codes.hpp"
#include "ascmedia/version.hpp"

namespace ascmedia::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string plural(std::size_t count, const std::string &noun)
        {
            return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)) {}

    int ClientSession::run()
    {
        try
        {
            return dispatch();
        }
        catch (const Error &ex)
        {
            std::cerr << "ERROR: " << to_string(ex.code()) << std::endl;
            std::cerr << ex.what() << std::endl;
            logger_.log("error", "fatal: ", to_string(ex.code()), ": ", ex.what());
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: internal_error" << std::endl;
            std::cerr << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
        }
        return 1;
    }

    int ClientSession::dispatch()
    {
        switch (config_.command)
        {
        case CommandKind::Help:
            std::cout << usage();
            return 0;
        case CommandKind::Version:
            std::cout << "ascmedia " << version() << std::endl;
            return 0;
        case CommandKind::Configure:
            return handle_configure();
        case CommandKind::Upload:
            return handle_upload();
        case CommandKind::Download:
            return handle_download();
        case CommandKind::Verify:
            return handle_verify();
        }
        return 1;
    }

    void ClientSession::connect()
    {
        const auto credentials = load_credentials(config_file_path());
        signer_ = TokenSigner::from_credentials(credentials);
        transport_ = std::make_unique<HttpTransport>(logger_);

        std::string base = kDefaultApiBase;
        if (const char *overridden = std::getenv("ASCMEDIA_API_BASE"); overridden && *overridden)
        {
            base = overridden;
        }
        api_ = std::make_unique<AppStoreMediaApi>(
            *transport_, [signer = signer_.get()]
            { return signer->token(); },
            logger_, base);
        logger_.log("info", "using ", base, " with key ", credentials.key_id);
    }

    bool ClientSession::ask_yes_no(const std::string &question) const
    {
        std::cout << question << " [y/N] " << std::flush;
        if (config_.assume_yes)
        {
            std::cout << "y (auto)" << std::endl;
            return true;
        }
        std::string answer;
        if (!std::getline(std::cin, answer))
        {
            std::cout << std::endl;
            return false;
        }
        answer = to_lower(trim(answer));
        return answer == "y" || answer == "yes";
    }

    std::string ClientSession::prompt_line(const std::string &label)
    {
        while (true)
        {
            std::cout << label << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                throw Error(ErrorCode::InvalidArgument, "Input ended at '" + trim(label) + "'");
            }
            line = trim(line);
            if (!line.empty())
            {
                return line;
            }
            std::cout << "Value cannot be empty. Try again." << std::endl;
        }
    }

    TransferOptions ClientSession::transfer_options() const
    {
        TransferOptions options;
        options.concurrency = config_.concurrency;
        options.max_upload_rate = config_.max_upload_rate;
        options.max_download_rate = config_.max_download_rate;
        return options;
    }

    int ClientSession::finish(const OperationSummary &summary)
    {
        print_summary(summary, std::cout);
        logger_.log("info", "succeeded=", summary.succeeded, " failed=", summary.failed, " skipped=",
                    summary.skipped);
        return summary.ok() ? 0 : 1;
    }

    int ClientSession::handle_configure()
    {
        std::cout << "====================================" << std::endl;
        std::cout << "App Store Connect API Configuration" << std::endl;
        std::cout << "====================================" << std::endl;
        std::cout << std::endl;
        std::cout << "You can find your API key at:" << std::endl;
        std::cout << "https://appstoreconnect.apple.com/access/integrations/api" << std::endl;
        std::cout << std::endl;

        Credentials credentials;
        credentials.key_id = prompt_line("Key ID: ");
        credentials.issuer_id = prompt_line("Issuer ID: ");
        const auto source = std::filesystem::path(expand_path(prompt_line("Private key (.p8) path: ")));

        const auto config_path = config_file_path();
        credentials.private_key_path = install_private_key(source, config_path.parent_path());
        // Reject a key that cannot sign before it is saved.
        TokenSigner::from_credentials(credentials);
        save_credentials(credentials, config_path);
        logger_.log("info", "saved credentials for key ", credentials.key_id);

        std::cout << std::endl;
        std::cout << "Private key copied to " << credentials.private_key_path.string() << std::endl;
        std::cout << "Config saved to " << config_path.string() << std::endl;
        std::cout << "Permissions set to owner-only access." << std::endl;
        return 0;
    }

    int ClientSession::handle_upload()
    {
        const auto index = scan_media_folder(*config_.folder);
        print_scan(index, std::cout);
        if (index.empty())
        {
            OperationSummary summary;
            summary.skipped = index.warnings.size();
            return finish(summary);
        }

        std::cout << std::endl;
        if (config_.replace)
        {
            std::cout << "Existing items in the matching sets will be deleted first." << std::endl;
        }
        if (!ask_yes_no("Upload " + plural(index.total_screenshots + index.total_previews, "file") +
                        " to version " + config_.version_id + "?"))
        {
            std::cout << "Cancelled." << std::endl;
            return 0;
        }
        std::cout << std::endl;

        connect();
        MediaSync sync(*api_, logger_, std::cout, transfer_options());
        UploadOptions options;
        options.replace = config_.replace;
        options.wait = config_.wait;
        options.poll.interval = config_.poll_interval;
        options.poll.timeout = config_.poll_timeout;
        return finish(sync.upload(index, config_.version_id, options));
    }

    int ClientSession::handle_download()
    {
        connect();
        MediaSync sync(*api_, logger_, std::cout, transfer_options());
        return finish(sync.download(*config_.folder, config_.version_id));
    }

    int ClientSession::handle_verify()
    {
        connect();
        MediaSync sync(*api_, logger_, std::cout, transfer_options());
        const auto report = sync.verify(config_.version_id);
        if (report.all_complete())
        {
            return finish(verify_summary(report));
        }
        if (!config_.folder)
        {
            std::cout << "Use --folder to provide the media folder and repair unfinished items." << std::endl;
            return finish(verify_summary(report));
        }

        const auto index = scan_media_folder(*config_.folder);
        for (const auto &warning : index.warnings)
        {
            std::cout << "Warning: " << warning.message << std::endl;
        }
        const auto plan = plan_repair(report, index);
        if (plan.unmatched > 0)
        {
            std::cout << plural(plan.unmatched, "unfinished item") << " without a local folder will be skipped."
                      << std::endl;
        }

        const auto tasks = plan.task_count();
        if (tasks == 0 && plan.conflicts.empty())
        {
            std::cout << "No matching local files found for unfinished items." << std::endl;
            return finish(verify_summary(report));
        }
        if (tasks > 0)
        {
            std::cout << std::endl;
            if (!ask_yes_no("Repair " + plural(tasks, "item") + "?"))
            {
                std::cout << "Cancelled." << std::endl;
                return 0;
            }
            std::cout << std::endl;
        }
        return finish(sync.repair(plan, config_.version_id));
    }

} // namespace ascmedia::client
