#include <fnr/cli/app.hpp>
#include <fnr/cli/options.hpp>
#include <fnr/log.hpp>

#include <iostream>

int main(int argc, char** argv) {
    fnr::log::init_from_env();

    fnr::RunOptions opts;
    if (auto code = fnr::parse_command_line(argc, argv, opts)) {
        return *code;
    }
    return fnr::run(opts, std::cout, std::cerr);
}
