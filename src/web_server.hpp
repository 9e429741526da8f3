#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "challenge_manager.hpp"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

using json = nlohmann::json;

// Example host: exposes a ChallengeManager over HTTP.
// The manager is owned by the caller and must outlive the server.
class WebServer {
public:
    explicit WebServer(ChallengeManager& manager);
    ~WebServer() = default;

    // Register routes
    bool initialize();

    // Start server (blocking)
    void start(int port = 8080);

    void stop();

    // Zoom from a generate request, 1 when absent. nullopt unless it is an integer in 1..4.
    static std::optional<int> readZoom(const json& request_data);

    // Symbol from an input request, kept at full width so oversized values
    // cannot wrap into a valid symbol. nullopt when missing or not an integer.
    static std::optional<int64_t> readSymbol(const json& request_data);

private:
    ChallengeManager& manager;

    crow::SimpleApp app;

    bool initialized;

    // Endpoint handlers
    crow::response handleHealthCheck(const crow::request& req);
    crow::response handleGenerateChallenge(const crow::request& req, const std::string& session_id);
    crow::response handleChallengeInfo(const crow::request& req, const std::string& session_id);
    crow::response handleChallengeImage(const crow::request& req, const std::string& session_id);
    crow::response handleSubmitInput(const crow::request& req, const std::string& session_id);
    crow::response handleRemoveChallenge(const crow::request& req, const std::string& session_id);

    // Helper methods
    json parseRequestBody(const std::string& body);
    json createErrorResponse(const std::string& error_message, int status_code = 400);
    json createSuccessResponse(const json& data);
    crow::response createResponse(int status_code, const json& data);

    // Validation methods
    bool validateGenerateRequest(const json& request_data);
    bool validateInputRequest(const json& request_data);

    class Timer {
    private:
        std::chrono::high_resolution_clock::time_point start_time;
    public:
        Timer() : start_time(std::chrono::high_resolution_clock::now()) {}

        int64_t elapsed_ms() const {
            auto end_time = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
        }
    };
};

#endif // WEB_SERVER_HPP
