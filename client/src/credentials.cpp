#include "ascmedia/client/credentials.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "ascmedia/error_codes.hpp"

namespace ascmedia::client
{

    namespace
    {
        constexpr auto kConfigDir = ".ascmedia";
        constexpr auto kConfigFile = "config.json";

        constexpr auto kOwnerOnlyDir = std::filesystem::perms::owner_all;
        constexpr auto kOwnerOnlyFile = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;

        std::filesystem::path home_directory()
        {
            const char *home = std::getenv("HOME");
            if (!home || !*home)
            {
                throw Error(ErrorCode::InvalidArgument, "HOME is not set");
            }
            return std::filesystem::path(home);
        }

        void restrict_permissions(const std::filesystem::path &path, std::filesystem::perms perms)
        {
            std::error_code ec;
            std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace, ec);
            if (ec)
            {
                throw Error(ErrorCode::FileIo, "Cannot set permissions on '" + path.string() + "': " + ec.message());
            }
        }

        std::string required_field(const nlohmann::json &json, const char *name, const std::filesystem::path &path)
        {
            const auto it = json.find(name);
            if (it == json.end() || !it->is_string() || it->get<std::string>().empty())
            {
                throw Error(ErrorCode::InvalidArgument,
                            "Configuration at " + path.string() + " has no '" + name + "'.");
            }
            return it->get<std::string>();
        }
    } // namespace

    std::filesystem::path config_directory()
    {
        return home_directory() / kConfigDir;
    }

    std::filesystem::path config_file_path()
    {
        if (const char *overridden = std::getenv("ASCMEDIA_CONFIG"); overridden && *overridden)
        {
            return std::filesystem::path(expand_path(overridden));
        }
        return config_directory() / kConfigFile;
    }

    std::string expand_path(const std::string &input)
    {
        const auto begin = input.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
        {
            return "";
        }
        const auto end = input.find_last_not_of(" \t\r\n");
        std::string result = input.substr(begin, end - begin + 1);

        if (result.size() >= 2 && (result.front() == '\'' || result.front() == '"') && result.back() == result.front())
        {
            result = result.substr(1, result.size() - 2);
        }

        std::string unescaped;
        unescaped.reserve(result.size());
        for (const char ch : result)
        {
            if (ch != '\\')
            {
                unescaped.push_back(ch);
            }
        }

        if (unescaped.starts_with("~/"))
        {
            return (home_directory() / unescaped.substr(2)).string();
        }
        return unescaped;
    }

    Credentials load_credentials(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            throw Error(ErrorCode::NotFound, "No configuration found at " + path.string() +
                                                 ".\nRun 'ascmedia configure' to set up your API credentials.");
        }

        std::ifstream in(path);
        if (!in.is_open())
        {
            throw Error(ErrorCode::FileIo, "Cannot read configuration at " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw Error(ErrorCode::InvalidArgument, "Configuration at " + path.string() + " is not valid JSON: " +
                                                        ex.what());
        }
        if (!json.is_object())
        {
            throw Error(ErrorCode::InvalidArgument, "Configuration at " + path.string() + " is not a JSON object.");
        }

        Credentials credentials;
        credentials.key_id = required_field(json, "key_id", path);
        credentials.issuer_id = required_field(json, "issuer_id", path);
        credentials.private_key_path = expand_path(required_field(json, "private_key_path", path));
        if (!std::filesystem::exists(credentials.private_key_path, ec))
        {
            throw Error(ErrorCode::NotFound,
                        "Private key file not found at " + credentials.private_key_path.string());
        }
        return credentials;
    }

    void save_credentials(const Credentials &credentials, const std::filesystem::path &path)
    {
        const auto directory = path.parent_path();
        if (!directory.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(directory, ec);
            if (ec)
            {
                throw Error(ErrorCode::FileIo, "Cannot create '" + directory.string() + "': " + ec.message());
            }
            restrict_permissions(directory, kOwnerOnlyDir);
        }

        const nlohmann::json json = {
            {"issuer_id", credentials.issuer_id},
            {"key_id", credentials.key_id},
            {"private_key_path", credentials.private_key_path.string()},
        };
        {
            std::ofstream out(path, std::ios::trunc);
            if (!out.is_open())
            {
                throw Error(ErrorCode::FileIo, "Cannot write configuration at " + path.string());
            }
            out << json.dump(2) << '\n';
        }
        restrict_permissions(path, kOwnerOnlyFile);
    }

    std::filesystem::path install_private_key(const std::filesystem::path &source,
                                              const std::filesystem::path &directory)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(source, ec))
        {
            throw Error(ErrorCode::NotFound, "File not found at '" + source.string() + "'.");
        }
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            throw Error(ErrorCode::FileIo, "Cannot create '" + directory.string() + "': " + ec.message());
        }
        restrict_permissions(directory, kOwnerOnlyDir);

        const auto destination = directory / source.filename();
        if (std::filesystem::equivalent(source, destination, ec))
        {
            restrict_permissions(destination, kOwnerOnlyFile);
            return destination;
        }
        std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
        {
            throw Error(ErrorCode::FileIo, "Cannot copy key to '" + destination.string() + "': " + ec.message());
        }
        restrict_permissions(destination, kOwnerOnlyFile);
        return destination;
    }

} // namespace ascmedia::client
