#include "web_server.hpp"
#include "captcha_config.hpp"
#include "challenge_manager.hpp"
#include <iostream>
#include <string>
#include <memory>
#include <optional>
#include <filesystem>
#include <signal.h>

// Global server instance for signal handling
std::unique_ptr<WebServer> global_server;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ". Shutting down gracefully..." << std::endl;
    if (global_server) {
        global_server->stop();
    }
    exit(0);
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --port PORT          Server port (default: 8080)\n"
              << "  --config PATH        JSON configuration file\n"
              << "  --max-failures N     Wrong full inputs before a challenge is regenerated (default: 10)\n"
              << "  --format FORMAT      Image format: jpeg or png (default: jpeg)\n"
              << "  --help               Show this help message\n"
              << "Environment: CAPTCHA_MAX_FAILURES, CAPTCHA_IMAGE_FORMAT, CAPTCHA_IMAGE_QUALITY, CAPTCHA_SEED\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    // Default configuration
    int port = 8080;
    std::string config_path;
    std::optional<int> max_failures;
    std::optional<std::string> image_format;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
                if (port < 1 || port > 65535) {
                    std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                    return 1;
                }
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid port number" << std::endl;
                return 1;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--max-failures" && i + 1 < argc) {
            try {
                max_failures = std::stoi(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid failure threshold" << std::endl;
                return 1;
            }
        } else if (arg == "--format" && i + 1 < argc) {
            image_format = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!config_path.empty() && !std::filesystem::exists(config_path)) {
        std::cerr << "Error: Configuration file does not exist: " << config_path << std::endl;
        return 1;
    }

    // Setup signal handlers for graceful shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        // Defaults < config file < environment < command line
        CaptchaConfig config = config_path.empty() ? CaptchaConfig() : CaptchaConfig::loadFromFile(config_path);
        config.applyEnvironment();
        config.applyOverrides(max_failures, image_format);

        std::cout << "=== Arrow Captcha Service ===" << std::endl;
        std::cout << "Port: " << port << std::endl;
        std::cout << "Configuration: " << config.toJson().dump() << std::endl;
        std::cout << "=============================" << std::endl;

        ChallengeManager manager(config);

        global_server = std::make_unique<WebServer>(manager);

        if (!global_server->initialize()) {
            std::cerr << "Failed to initialize server" << std::endl;
            return 1;
        }

        std::cout << "\nServer ready! Available endpoints:" << std::endl;
        std::cout << "  GET    /health                 - Health check" << std::endl;
        std::cout << "  POST   /captcha/<id>           - Generate a challenge {\"zoom\": 1-4}" << std::endl;
        std::cout << "  GET    /captcha/<id>           - Challenge status" << std::endl;
        std::cout << "  GET    /captcha/<id>/image     - Encoded challenge image" << std::endl;
        std::cout << "  POST   /captcha/<id>/input     - Submit one symbol {\"symbol\": 0-2}" << std::endl;
        std::cout << "  DELETE /captcha/<id>           - Remove a challenge" << std::endl;
        std::cout << "\nPress Ctrl+C to stop the server." << std::endl;

        // Start server (blocking call)
        global_server->start(port);
        global_server.reset();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
