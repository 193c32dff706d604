#include <iostream>
#include <string>
#include <memory> // For std::shared_ptr
#include <vector>

#include "core/errors.h"
#include "core/identity.h"
#include "core/key_service.h"
#include "storage/ipfs_key_importer.h"
#include "utils/config.h"

namespace {

void printUsage() {
    std::cout << "Usage: detkey [--config <file.json>] [--no-import] <keyname>" << std::endl;
}

struct CommandLine {
    std::string configPath;
    bool importKey = true;
    std::string keyName;
};

// Returns false when the arguments do not form a valid invocation.
bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return false;
            }
            cmd.configPath = argv[++i];
        } else if (arg == "--no-import") {
            cmd.importKey = false;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                positional.emplace_back(argv[i]);
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            return false;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 1) {
        return false;
    }
    cmd.keyName = positional.front();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage();
        return 1;
    }

    AppConfig config;
    try {
        if (!cmd.configPath.empty()) {
            config = AppConfig::loadFromFile(cmd.configPath);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    IdentityDeriver deriver(config.streamCapacity, config.identifierHash);

    try {
        DerivedIdentity identity;
        if (cmd.importKey) {
            auto importer = std::make_shared<IpfsKeyImporter>(config.apiEndpoint,
                                                              config.connectTimeoutSeconds,
                                                              config.requestTimeoutSeconds,
                                                              config.verbose);
            KeyService service(deriver, importer, config.verbose);
            identity = service.deriveAndImport(cmd.keyName);
        } else {
            identity = deriver.deriveIdentity(cmd.keyName);
        }

        std::cout << identity.identifier << " " << cmd.keyName << std::endl;
        if (!cmd.importKey) {
            std::cout << identity.exportedKey;
        }
    } catch (const std::exception& e) {
        std::cerr << "Operation failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
