#include <iostream>
#include <string>

#include "pandrive/client/config.hpp"
#include "pandrive/client/logger.hpp"
#include "pandrive/client/session.hpp"
#include "pandrive/crypto.hpp"
#include "pandrive/version.hpp"

int main(int argc, char *argv[])
{
    if (argc == 2 && std::string(argv[1]) == "--version")
    {
        std::cout << "pandrive " << pandrive::kVersion << std::endl;
        return 0;
    }
    try
    {
        pandrive::crypto::ensure_sodium_init();
        const auto config = pandrive::client::parse_arguments(argc, argv);
        pandrive::client::Logger logger(config.log_path, config.verbose);
        pandrive::client::ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
