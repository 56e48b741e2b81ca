#include <iostream>
#include <utility>

#include "ascmedia/client/config.hpp"
#include "ascmedia/client/session.hpp"
#include "ascmedia/error_codes.hpp"
#include "ascmedia/logger.hpp"

int main(int argc, char *argv[])
{
    using ascmedia::client::ClientSession;

    try
    {
        const auto config = ascmedia::client::parse_arguments(argc, argv);
        ascmedia::Logger logger(config.log_path);
        ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const ascmedia::Error &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        std::cerr << ascmedia::client::usage();
        return 2;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
