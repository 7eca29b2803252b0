#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "ferry/client/config.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/session.hpp"
#include "ferry/version.hpp"

int main(int argc, char *argv[])
{
    const std::string program = argc > 0 ? argv[0] : "ferry_client";
    ferry::client::ClientConfig config;
    try
    {
        config = ferry::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n\n"
                  << "Ferry sender " << ferry::version() << "\n"
                  << ferry::client::usage(program);
        return EXIT_FAILURE;
    }

    if (config.show_help)
    {
        std::cout << "Ferry sender " << ferry::version() << " - file transfer over a SOCKS5 proxy such as Tor\n\n"
                  << ferry::client::usage(program);
        return EXIT_SUCCESS;
    }

    ferry::client::Logger logger(config.log_path);
    logger.log("info", "ferry sender ", ferry::version());
    ferry::client::ClientSession session(std::move(config), std::move(logger));
    return session.run() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
