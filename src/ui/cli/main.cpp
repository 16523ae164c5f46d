#include "AcdcCli.hpp"

#include "acdc/core/EncodingPolicy.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        std::vector<std::string> args{};
        for (int i{ 1 }; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }

        acdc::ui::cli::AcdcCli cli{ std::cout, std::cerr, acdc::core::encodingPolicyFromEnvironment() };
        return cli.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
