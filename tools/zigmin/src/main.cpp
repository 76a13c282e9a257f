// tools/zigmin/src/main.cpp
#include "cli/Options.hpp"
#include "driver/Runner.hpp"
#include <zigmin/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    const auto opt = zigmin_cli::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        zigmin_cli::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == zigmin_cli::cli::Mode::kVersion) {
        std::cout << zigmin::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == zigmin_cli::cli::Mode::kUsage) {
        std::cout << zigmin::k_version_string << "\n";
        zigmin_cli::cli::print_usage(std::cout);
        return 0;
    }

    return zigmin_cli::driver::run(opt);
}
