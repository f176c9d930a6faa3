#include "readygate/cli/cli.hpp"
#include "readygate/source/endpoint_source.hpp"

#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return readygate::cli::run(args, readygate::source::capture_environment());
}
