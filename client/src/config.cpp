#include "ascmedia/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

#include "ascmedia/error_codes.hpp"

namespace ascmedia::client
{

    namespace
    {

        std::string next_value(int &index, int argc, char *argv[], const std::string &flag, const char *what)
        {
            if (index >= argc)
            {
                throw Error(ErrorCode::InvalidArgument, flag + " requires " + what);
            }
            return argv[index++];
        }

        std::size_t parse_count(const std::string &flag, const std::string &value)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed == value.size() && value.front() != '-')
                {
                    return static_cast<std::size_t>(parsed);
                }
            }
            catch (const std::logic_error &)
            {
                // Reported below with the flag name.
            }
            throw Error(ErrorCode::InvalidArgument, flag + " expects a non-negative number, got '" + value + "'");
        }

        CommandKind command_from_string(const std::string &name)
        {
            if (name == "help" || name == "--help" || name == "-h")
            {
                return CommandKind::Help;
            }
            if (name == "--version")
            {
                return CommandKind::Version;
            }
            if (name == "configure")
            {
                return CommandKind::Configure;
            }
            if (name == "upload")
            {
                return CommandKind::Upload;
            }
            if (name == "download")
            {
                return CommandKind::Download;
            }
            if (name == "verify")
            {
                return CommandKind::Verify;
            }
            throw Error(ErrorCode::InvalidArgument, "Unknown command: " + name);
        }

        bool takes_version(CommandKind command)
        {
            return command == CommandKind::Upload || command == CommandKind::Download ||
                   command == CommandKind::Verify;
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        if (argc < 2)
        {
            return config;
        }

        int index = 1;
        config.command = command_from_string(argv[index++]);
        if (takes_version(config.command))
        {
            if (index >= argc || std::string(argv[index]).starts_with("--"))
            {
                throw Error(ErrorCode::InvalidArgument, "Missing <version-id>");
            }
            config.version_id = argv[index++];
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(next_value(index, argc, argv, arg, "a file path"));
            }
            else if (arg == "--folder" && takes_version(config.command))
            {
                config.folder = std::filesystem::path(next_value(index, argc, argv, arg, "a directory"));
            }
            else if (arg == "--yes" &&
                     (config.command == CommandKind::Upload || config.command == CommandKind::Verify))
            {
                config.assume_yes = true;
            }
            else if (arg == "--replace" && config.command == CommandKind::Upload)
            {
                config.replace = true;
            }
            else if (arg == "--wait" && config.command == CommandKind::Upload)
            {
                config.wait = true;
            }
            else if (arg == "--concurrency" && config.command == CommandKind::Upload)
            {
                config.concurrency = parse_count(arg, next_value(index, argc, argv, arg, "a value"));
                if (config.concurrency == 0)
                {
                    throw Error(ErrorCode::InvalidArgument, "--concurrency must be at least 1");
                }
            }
            else if (arg == "--max-upload-rate" && config.command == CommandKind::Upload)
            {
                config.max_upload_rate =
                    parse_count(arg, next_value(index, argc, argv, arg, "a value (bytes per second)"));
            }
            else if (arg == "--max-download-rate" && config.command == CommandKind::Download)
            {
                config.max_download_rate =
                    parse_count(arg, next_value(index, argc, argv, arg, "a value (bytes per second)"));
            }
            else if (arg == "--poll-interval" && config.command == CommandKind::Upload)
            {
                config.poll_interval =
                    std::chrono::seconds(parse_count(arg, next_value(index, argc, argv, arg, "seconds")));
            }
            else if (arg == "--poll-timeout" && config.command == CommandKind::Upload)
            {
                config.poll_timeout =
                    std::chrono::seconds(parse_count(arg, next_value(index, argc, argv, arg, "seconds")));
            }
            else
            {
                throw Error(ErrorCode::InvalidArgument, "Unknown argument: " + arg);
            }
        }

        if ((config.command == CommandKind::Upload || config.command == CommandKind::Download) && !config.folder)
        {
            throw Error(ErrorCode::InvalidArgument, "--folder is required");
        }
        return config;
    }

    std::string usage()
    {
        return "Usage: ascmedia <command> [options] [--log <file>]\n"
               "\n"
               "Commands:\n"
               "  configure                         Store API key ID, issuer ID and .p8 key\n"
               "  upload <version-id> --folder <dir> [--replace] [--yes] [--wait]\n"
               "         [--concurrency N] [--max-upload-rate <bps>]\n"
               "         [--poll-interval <s>] [--poll-timeout <s>]\n"
               "  download <version-id> --folder <dir> [--max-download-rate <bps>]\n"
               "  verify <version-id> [--folder <dir>] [--yes]\n"
               "  help                              Show this help\n"
               "  --version                         Print the version\n"
               "\n"
               "Folder layout: <dir>/<locale>/<display type>/<files>\n";
    }

} // namespace ascmedia::client
