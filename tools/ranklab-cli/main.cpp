#include <ranklab/cli/ranklab_cli.h>

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; RankLabCLI::run() adjusts based on flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        ranklab::cli::RankLabCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
