/**
 * OpenRouterClient.hpp - Chat completions client for the OpenRouter API
 */

#pragma once

#include <string>

namespace lh {

struct Config;

struct HttpResponse {
    bool success = false;   // transport succeeded (any status)
    long status = 0;
    std::string body;
    std::string error;
};

class OpenRouterClient {
public:
    explicit OpenRouterClient(const Config& config);
    ~OpenRouterClient();

    // One POST, returns choices[0].message.content.
    // Throws Error(API_REQUEST_FAILED) or Error(INVALID_JSON_RESPONSE).
    std::string complete(const std::string& prompt);

    const std::string& model() const { return model_; }

    static std::string buildRequestBody(const std::string& model, const std::string& prompt);
    static std::string extractContent(const std::string& body);

    // Throws Error(API_REQUEST_FAILED) on transport failure or a non-2xx status,
    // adding error.message from a JSON body when there is one
    static void checkResponse(const HttpResponse& response);

    static std::string getEndpoint();
    static std::string getDefaultModel();

private:
    const Config& config_;
    std::string model_;

    HttpResponse post(const std::string& body);
};

} // namespace lh
