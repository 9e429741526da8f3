#include "web_server.hpp"
#include "captcha_errors.hpp"
#include <iostream>
#include <ctime>

WebServer::WebServer(ChallengeManager& manager) : manager(manager), initialized(false) {
}

bool WebServer::initialize() {
    try {
        // Health check endpoint
        CROW_ROUTE(app, "/health").methods("GET"_method)
        ([this](const crow::request& req) {
            return handleHealthCheck(req);
        });

        // Challenge generation (replaces any challenge for the id)
        CROW_ROUTE(app, "/captcha/<string>").methods("POST"_method)
        ([this](const crow::request& req, std::string session_id) {
            return handleGenerateChallenge(req, session_id);
        });

        CROW_ROUTE(app, "/captcha/<string>").methods("GET"_method)
        ([this](const crow::request& req, std::string session_id) {
            return handleChallengeInfo(req, session_id);
        });

        CROW_ROUTE(app, "/captcha/<string>").methods("DELETE"_method)
        ([this](const crow::request& req, std::string session_id) {
            return handleRemoveChallenge(req, session_id);
        });

        // Encoded image payload
        CROW_ROUTE(app, "/captcha/<string>/image").methods("GET"_method)
        ([this](const crow::request& req, std::string session_id) {
            return handleChallengeImage(req, session_id);
        });

        // One arrow symbol per request
        CROW_ROUTE(app, "/captcha/<string>/input").methods("POST"_method)
        ([this](const crow::request& req, std::string session_id) {
            return handleSubmitInput(req, session_id);
        });

        initialized = true;
        std::cout << "Web server initialized successfully!" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error initializing web server: " << e.what() << std::endl;
        return false;
    }
}

void WebServer::start(int port) {
    if (!initialized) {
        std::cerr << "Server not initialized. Call initialize() first." << std::endl;
        return;
    }

    std::cout << "Starting server on port " << port << std::endl;
    app.port(port).multithreaded().run();
}

void WebServer::stop() {
    app.stop();
}

crow::response WebServer::handleHealthCheck(const crow::request& req) {
    json health_data = {
        {"status", "healthy"},
        {"active_challenges", manager.activeCount()},
        {"image_format", manager.config().image_format},
        {"max_failures", manager.config().max_failures},
        {"version", "1.0.0"},
        {"timestamp", std::time(nullptr)}
    };

    return createResponse(200, createSuccessResponse(health_data));
}

crow::response WebServer::handleGenerateChallenge(const crow::request& req, const std::string& session_id) {
    Timer timer;

    try {
        json request_data = json::object();
        if (!req.body.empty()) {
            request_data = parseRequestBody(req.body);
        }

        std::optional<int> zoom;
        if (validateGenerateRequest(request_data)) {
            zoom = readZoom(request_data);
        }
        if (!zoom) {
            return createResponse(400, createErrorResponse("Invalid request format. Required: zoom (integer 1-4)"));
        }

        manager.generate(session_id, *zoom);

        auto info = manager.getChallengeInfo(session_id);
        if (!info) {
            // Removed by a concurrent request before we could describe it
            return createResponse(409, createErrorResponse("Challenge was removed concurrently", 409));
        }

        json response_data = info->toJson();
        response_data["processing_time_ms"] = timer.elapsed_ms();
        response_data["error"] = nullptr;
        return createResponse(201, createSuccessResponse(response_data));

    } catch (const InvalidArgument& e) {
        return createResponse(400, createErrorResponse(e.what()));
    } catch (const CaptchaError& e) {
        std::cerr << "Error generating challenge: " << e.what() << std::endl;
        json error_response = createErrorResponse("Challenge generation failed", 500);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(500, error_response);
    } catch (const std::exception& e) {
        std::cerr << "Error generating challenge: " << e.what() << std::endl;
        return createResponse(500, createErrorResponse("Internal server error", 500));
    }
}

crow::response WebServer::handleChallengeInfo(const crow::request& req, const std::string& session_id) {
    auto info = manager.getChallengeInfo(session_id);
    if (!info) {
        return createResponse(404, createErrorResponse("Challenge not found", 404));
    }
    return createResponse(200, createSuccessResponse(info->toJson()));
}

crow::response WebServer::handleChallengeImage(const crow::request& req, const std::string& session_id) {
    auto image = manager.getChallenge(session_id);
    if (!image) {
        return createResponse(404, createErrorResponse("Challenge not found", 404));
    }

    crow::response res(200);
    res.body.assign(image->begin(), image->end());
    res.add_header("Access-Control-Allow-Origin", "*");
    res.add_header("Content-Type", manager.contentType());
    res.add_header("Cache-Control", "no-store");
    return res;
}

crow::response WebServer::handleSubmitInput(const crow::request& req, const std::string& session_id) {
    try {
        json request_data = parseRequestBody(req.body);

        std::optional<int64_t> symbol;
        if (validateInputRequest(request_data)) {
            symbol = readSymbol(request_data);
        }
        if (!symbol) {
            return createResponse(400, createErrorResponse("Invalid request format. Required: symbol (integer)"));
        }

        InputOutcome outcome = manager.submitInput(session_id, *symbol);
        if (outcome == InputOutcome::ABSENT) {
            return createResponse(404, createErrorResponse("Challenge not found", 404));
        }

        json response_data = {
            {"session_id", session_id},
            {"status", inputOutcomeToString(outcome)}
        };
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const CaptchaError& e) {
        // Regeneration after too many failures could not render a new challenge
        std::cerr << "Error handling captcha input: " << e.what() << std::endl;
        return createResponse(500, createErrorResponse("Challenge regeneration failed", 500));
    } catch (const std::exception& e) {
        std::cerr << "Error handling captcha input: " << e.what() << std::endl;
        return createResponse(400, createErrorResponse(e.what()));
    }
}

crow::response WebServer::handleRemoveChallenge(const crow::request& req, const std::string& session_id) {
    manager.removeChallenge(session_id);
    return createResponse(200, createSuccessResponse({{"session_id", session_id}, {"removed", true}}));
}

json WebServer::parseRequestBody(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid JSON in request body");
    }
}

json WebServer::createErrorResponse(const std::string& error_message, int status_code) {
    return json{
        {"success", false},
        {"error", error_message},
        {"status_code", status_code}
    };
}

json WebServer::createSuccessResponse(const json& data) {
    json response = data;
    response["success"] = true;
    return response;
}

crow::response WebServer::createResponse(int status_code, const json& data) {
    crow::response res(status_code, data.dump());
    res.add_header("Access-Control-Allow-Origin", "*");
    res.add_header("Content-Type", "application/json");
    return res;
}

bool WebServer::validateGenerateRequest(const json& request_data) {
    if (!request_data.is_object()) {
        return false;
    }
    // Range is checked by the manager so the error message comes from one place
    return !request_data.contains("zoom") || request_data["zoom"].is_number_integer();
}

bool WebServer::validateInputRequest(const json& request_data) {
    return request_data.is_object() &&
           request_data.contains("symbol") &&
           request_data["symbol"].is_number_integer();
}

std::optional<int> WebServer::readZoom(const json& request_data) {
    if (!request_data.is_object()) {
        return std::nullopt;
    }
    if (!request_data.contains("zoom")) {
        return 1;
    }

    const json& zoom = request_data["zoom"];
    if (!zoom.is_number_integer()) {
        return std::nullopt;
    }
    // Unsigned values above the int64 range would wrap on conversion
    if (zoom.is_number_unsigned() &&
        zoom.get<uint64_t>() > static_cast<uint64_t>(ImageSynthesizer::MAX_ZOOM)) {
        return std::nullopt;
    }

    int64_t value = zoom.get<int64_t>();
    if (value < ImageSynthesizer::MIN_ZOOM || value > ImageSynthesizer::MAX_ZOOM) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<int64_t> WebServer::readSymbol(const json& request_data) {
    if (!request_data.is_object() || !request_data.contains("symbol")) {
        return std::nullopt;
    }

    const json& symbol = request_data["symbol"];
    if (!symbol.is_number_integer()) {
        return std::nullopt;
    }
    if (symbol.is_number_unsigned() &&
        symbol.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        // Still an integer, just not one of ours: ignored like any other invalid symbol
        return std::numeric_limits<int64_t>::max();
    }
    return symbol.get<int64_t>();
}
