#include <ulidkit/cli.hpp>
#include <ulidkit/log.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace ulidkit;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto opts = cli::parse_args(args);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n\n" << cli::usage();
        return 1;
    }

    auto cfg = cli::load_config(opts.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply_logging();
    if (opts.value().verbose) log::set_level(log::Debug);

    auto status = cli::run(opts.value(), cfg.value(), std::cout);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
