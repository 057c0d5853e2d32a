#include <iostream>

#include "ftecho/client/client.hpp"
#include "ftecho/client/config.hpp"
#include "ftecho/client/logger.hpp"
#include "ftecho/client/shell.hpp"

int main(int argc, char *argv[])
{
    try
    {
        const auto config = ftecho::client::parse_arguments(argc, argv);
        ftecho::client::Client client(ftecho::client::Logger(config.log_path));
        if (config.host)
        {
            try
            {
                client.connect(*config.host, config.port);
                std::cout << "Connected to " << *config.host << ':' << config.port << std::endl;
            }
            catch (const std::exception &ex)
            {
                std::cout << "Error: " << ex.what() << std::endl;
            }
        }
        ftecho::client::Shell shell(client, std::cin, std::cout);
        return shell.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
