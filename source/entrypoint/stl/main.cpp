#include "credential.hpp"
#include "endpoint.hpp"
#include "logger.hpp"
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

void printUsage() {
    std::cout << "Usage: ovhauth <command> [arguments] [--verbose]\n";
    std::cout << "Commands:\n";
    std::cout << "  show [--config <path>]   Load credentials (default: " << Credential::DEFAULT_CONFIG_PATH << ")\n";
    std::cout << "  host <endpoint>          Print the API host for an endpoint\n";
    std::cout << "  endpoints                List known endpoints\n";
    std::cout << "Options:\n";
    std::cout << "  --verbose  Enable detailed output\n";
}

// Keeps the first four characters of a secret.
std::string mask(const std::string& secret) {
    if (secret.empty()) return "(empty)";
    if (secret.size() <= 4) return std::string(secret.size(), '*');
    return secret.substr(0, 4) + std::string(secret.size() - 4, '*');
}

int showCredential(const std::optional<std::string>& configPath) {
    auto result = configPath ? Credential::load(*configPath) : Credential::loadDefault();
    if (!result) {
        std::cerr << "Error: " << Credential::errorToString(result.error()) << "\n";
        return 1;
    }
    const Credential& credential = *result;
    std::cout << "Host:               " << credential.host() << "\n";
    std::cout << "Application key:    " << credential.applicationKey() << "\n";
    std::cout << "Application secret: " << mask(credential.applicationSecret()) << "\n";
    std::cout << "Consumer key:       " << mask(credential.consumerKey()) << "\n";
    if (credential.sourcePath()) {
        std::cout << "Source:             " << *credential.sourcePath() << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--verbose") {
            Logger::verboseMode = true;
        } else {
            args.emplace_back(argv[i]);
        }
    }
    if (args.empty()) {
        printUsage();
        return 1;
    }

    const std::string& command = args[0];
    if (command == "show") {
        std::optional<std::string> configPath;
        if (args.size() == 3 && args[1] == "--config") {
            configPath = args[2];
        } else if (args.size() != 1) {
            printUsage();
            return 1;
        }
        return showCredential(configPath);
    }
    if (command == "host" && args.size() == 2) {
        if (!EndpointResolver::isKnown(args[1])) {
            Logger::log(LogLevel::WARNING, "Unknown endpoint '" + args[1] + "', using default host");
        }
        std::cout << EndpointResolver::resolve(args[1]) << "\n";
        return 0;
    }
    if (command == "endpoints" && args.size() == 1) {
        for (const auto& [endpoint, host] : EndpointResolver::knownEndpoints()) {
            std::cout << std::left << std::setw(16) << endpoint << host << "\n";
        }
        return 0;
    }

    printUsage();
    return 1;
}
