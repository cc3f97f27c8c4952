/**
 * OpenRouterClient.cpp - Chat completions client for the OpenRouter API
 *
 * Uses libcurl for the HTTPS POST and nlohmann::json for the payloads.
 */

#include "lh/OpenRouterClient.hpp"
#include "lh/Config.hpp"
#include "lh/Console.hpp"
#include "lh/Error.hpp"

#include <memory>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lh {

static const std::string OPENROUTER_ENDPOINT = "https://openrouter.ai/api/v1/chat/completions";
static const std::string DEFAULT_MODEL = "anthropic/claude-3.7-sonnet";
static const double TEMPERATURE = 0.7;
static const int MAX_TOKENS = 1000;

namespace {

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlHeadersDeleter {
    void operator()(curl_slist* headers) const { curl_slist_free_all(headers); }
};

size_t curlWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

} // anonymous namespace

OpenRouterClient::OpenRouterClient(const Config& config)
    : config_(config),
      model_(config.model_name.value_or(DEFAULT_MODEL)) {}

OpenRouterClient::~OpenRouterClient() = default;

std::string OpenRouterClient::getEndpoint() {
    return OPENROUTER_ENDPOINT;
}

std::string OpenRouterClient::getDefaultModel() {
    return DEFAULT_MODEL;
}

std::string OpenRouterClient::buildRequestBody(const std::string& model, const std::string& prompt) {
    json request_body = {
        {"model", model},
        {"messages", json::array({
            {{"role", "user"}, {"content", prompt}}
        })},
        {"temperature", TEMPERATURE},
        {"max_tokens", MAX_TOKENS}
    };
    // Man pages and help output are not guaranteed to be valid UTF-8
    return request_body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string OpenRouterClient::extractContent(const std::string& body) {
    try {
        json res_json = json::parse(body);

        if (!res_json.is_object() || !res_json.contains("choices") || !res_json["choices"].is_array()) {
            throw Error(ErrorCode::INVALID_JSON_RESPONSE, "Response has no choices array");
        }

        const auto& choices = res_json["choices"];
        if (choices.empty()) {
            throw Error(ErrorCode::INVALID_JSON_RESPONSE, "No choices in OpenRouter response");
        }

        return choices[0].at("message").at("content").get<std::string>();
    } catch (const json::exception& e) {
        throw Error(ErrorCode::INVALID_JSON_RESPONSE,
                    std::string("Failed to parse OpenRouter JSON response: ") + e.what());
    }
}

void OpenRouterClient::checkResponse(const HttpResponse& response) {
    if (!response.success) {
        throw Error(ErrorCode::API_REQUEST_FAILED, "OpenRouter request failed: " + response.error);
    }

    if (response.status / 100 == 2) {
        return;
    }

    std::string message = "OpenRouter API error: HTTP " + std::to_string(response.status);
    try {
        json error_json = json::parse(response.body);
        if (error_json.contains("error") && error_json["error"].contains("message")) {
            message += " - " + error_json["error"]["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Body is not JSON; the status alone is reported
    }
    throw Error(ErrorCode::API_REQUEST_FAILED, message);
}

HttpResponse OpenRouterClient::post(const std::string& body) {
    HttpResponse response;

    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        response.error = "Failed to initialize curl";
        return response;
    }

    std::string auth = "Authorization: Bearer " + config_.api_key.value_or("");

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, auth.c_str());
    std::unique_ptr<curl_slist, CurlHeadersDeleter> headers(raw_headers);

    curl_easy_setopt(curl.get(), CURLOPT_URL, OPENROUTER_ENDPOINT.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = std::string("Curl error: ") + curl_easy_strerror(res);
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    response.success = true;
    return response;
}

std::string OpenRouterClient::complete(const std::string& prompt) {
    std::string body = buildRequestBody(model_, prompt);

    LH_DEBUG(config_, "Making OpenRouter request with model: " << model_);
    LH_DEBUG(config_, "OpenRouter JSON payload size: " << body.size() << " bytes");
    LH_DEBUG(config_, "OpenRouter JSON payload preview: " << console::preview(body, 300) << "...");

    HttpResponse response = post(body);

    LH_DEBUG(config_, "OpenRouter HTTP response status: " << response.status);
    LH_DEBUG(config_, "OpenRouter response body size: " << response.body.size() << " bytes");
    LH_DEBUG(config_, "OpenRouter response body preview: "
                      << console::preview(response.body, 500) << "...");

    checkResponse(response);
    return extractContent(response.body);
}

} // namespace lh
