/**
 * @file http_classifier.cpp
 * @brief Implementation of HttpClassifier
 */

#include "http_classifier.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace taskweave {

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

struct HttpClassifier::Impl {
    CURL* curl;

    Impl() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl = curl_easy_init();
        if (!curl) {
            throw DependencyError("network", "Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
        curl_global_cleanup();
    }
};

HttpClassifier::HttpClassifier(HttpClassifierConfig config)
    : config_(std::move(config)) {
    if (config_.url.empty()) {
        throw ConfigurationError("Classifier URL is empty");
    }
    impl_ = std::make_unique<Impl>();
}

HttpClassifier::~HttpClassifier() = default;

std::string HttpClassifier::classify(const WorkUnit& unit, const std::vector<HandlerDescriptor>& candidates) {
    HttpResponse response = post(build_request_body(unit, candidates, config_.model));
    std::string handler = parse_response(response);

    Logger::get_instance().log_debug("http_classifier", "Classified work unit",
        {{"work_unit_id", unit.id}, {"handler", handler},
         {"duration_ms", std::to_string(response.duration.count())}});
    return handler;
}

std::string HttpClassifier::build_request_body(const WorkUnit& unit,
                                               const std::vector<HandlerDescriptor>& candidates,
                                               const std::string& model) {
    nlohmann::json body;
    body["input"] = flatten_text(unit.input);
    body["kind"] = kind_to_string(unit.kind);
    if (!model.empty()) {
        body["model"] = model;
    }
    nlohmann::json options = nlohmann::json::array();
    for (const auto& candidate : candidates) {
        options.push_back({{"name", candidate.name}, {"description", candidate.description}});
    }
    body["candidates"] = options;
    return body.dump();
}

std::string HttpClassifier::error_kind_for_status(long status_code) {
    if (status_code < 400) return "";
    if (status_code == 408) return "timeout";
    if (status_code == 429 || status_code == 503) return "server_busy";
    if (status_code >= 500) return "server_error";
    return "client_error";
}

std::string HttpClassifier::parse_response(const HttpResponse& response) {
    std::string kind = error_kind_for_status(response.status_code);
    if (!kind.empty()) {
        throw DependencyError(kind, "Classifier returned HTTP " + std::to_string(response.status_code),
                              static_cast<int>(response.status_code));
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        if (!j.is_object() || !j.contains("handler") || !j["handler"].is_string()) {
            throw DependencyError("invalid_response", "Classifier response has no 'handler' string",
                                  static_cast<int>(response.status_code));
        }
        return j["handler"].get<std::string>();
    } catch (const nlohmann::json::parse_error& e) {
        throw DependencyError("invalid_response", std::string("Classifier response is not JSON: ") + e.what(),
                              static_cast<int>(response.status_code));
    }
}

HttpResponse HttpClassifier::post(const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto start = std::chrono::steady_clock::now();

    curl_easy_reset(impl_->curl);
    curl_easy_setopt(impl_->curl, CURLOPT_URL, config_.url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS, config_.timeout_ms);
    curl_easy_setopt(impl_->curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(impl_->curl, CURLOPT_POST, 1L);
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    struct curl_slist* curl_headers = nullptr;
    curl_headers = curl_slist_append(curl_headers, "Content-Type: application/json");
    for (const auto& [key, value] : config_.headers) {
        std::string header_line = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header_line.c_str());
    }
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, curl_headers);

    std::string response_body;
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &response_body);

    CURLcode res = curl_easy_perform(impl_->curl);
    curl_slist_free_all(curl_headers);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (res != CURLE_OK) {
        std::string kind = res == CURLE_OPERATION_TIMEDOUT ? "timeout" : "network";
        throw DependencyError(kind, std::string("CURL error: ") + curl_easy_strerror(res));
    }

    long status_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &status_code);

    return HttpResponse{status_code, response_body, duration};
}

} // namespace taskweave
