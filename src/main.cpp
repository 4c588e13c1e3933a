#include "shuttle_api.hpp"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string source;
    std::string target;
    MoveOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--source" && i + 1 < argc) {
            source = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            target = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            options.configFile = argv[++i];
        } else if (arg == "--mount-root" && i + 1 < argc) {
            options.mountRoot = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            source.clear();
            break;
        }
    }

    if (source.empty() || target.empty()) {
        std::cerr << "Please provide source and target as --source [source] and --target [target]." << std::endl;
        std::cerr << "Usage: " << argv[0] << " --source <location> --target <location> [--config <path>] [--mount-root <dir>]" << std::endl;
        return 1;
    }

    auto result = ShuttleAPI::moveFiles(source, target, options);
    if (!result) {
        std::cerr << "Error: " << result.error() << std::endl;
        return 1;
    }

    std::cout << "Transfer completed successfully." << std::endl;
    return 0;
}
