#include "cli/CommandRunner.hpp"
#include "config/Precision.hpp"
#include "config/Settings.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    auto settings = mcore::config::Settings::from_environment();

    try {
        mcore::config::Precision::configure(settings.precision);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << std::endl;
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        std::cerr << mcore::cli::CommandRunner::usage();
        return 1;
    }

    std::cerr << "[money_core] command=" << args[0]
              << " default_scale=" << mcore::config::Precision::default_scale() << std::endl;

    mcore::cli::CommandRunner runner(settings);
    auto result = runner.run(args, std::cin);

    if (!result.output.empty()) {
        std::cout << result.output << std::endl;
    }
    if (result.exit_code != 0) {
        std::cerr << "[error] " << result.error << std::endl;
    }
    return result.exit_code;
}
