/**
 * @file http_classifier.hpp
 * @brief Intent classifier backed by an HTTP endpoint (libcurl)
 *
 * POSTs {"input", "kind", "model", "candidates": [{name, description}]} and
 * expects {"handler": "<name>"} back. The client performs a single request
 * per call; retries, timeouts and circuit breaking come from the Resilience
 * Pipeline wrapping classify().
 *
 * Failures are raised as DependencyError with a kind the retry layer
 * understands:
 *   curl transport error -> "network"       HTTP 408      -> "timeout"
 *   HTTP 429 / 503       -> "server_busy"   other 5xx     -> "server_error"
 *   other 4xx            -> "client_error"  bad body      -> "invalid_response"
 */

#ifndef TASKWEAVE_HTTP_CLASSIFIER_HPP
#define TASKWEAVE_HTTP_CLASSIFIER_HPP

#include "router.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace taskweave {

struct HttpResponse {
    long status_code;
    std::string body;
    std::chrono::milliseconds duration;
};

struct HttpClassifierConfig {
    std::string url;
    std::string model;
    long timeout_ms;
    std::map<std::string, std::string> headers;   ///< e.g. Authorization (masked in logs)

    HttpClassifierConfig() : timeout_ms(5000) {}
};

class HttpClassifier : public IClassifier {
public:
    /**
     * @throws ConfigurationError If the URL is empty
     * @throws DependencyError If libcurl cannot be initialized
     */
    explicit HttpClassifier(HttpClassifierConfig config);
    ~HttpClassifier() override;

    HttpClassifier(const HttpClassifier&) = delete;
    HttpClassifier& operator=(const HttpClassifier&) = delete;

    std::string classify(const WorkUnit& unit, const std::vector<HandlerDescriptor>& candidates) override;

    static std::string build_request_body(const WorkUnit& unit,
                                          const std::vector<HandlerDescriptor>& candidates,
                                          const std::string& model);

    /**
     * @brief Map an HTTP status to a DependencyError kind, empty for 2xx/3xx
     */
    static std::string error_kind_for_status(long status_code);

    /**
     * @brief Extract the handler name from a response
     *
     * @throws DependencyError For error statuses or malformed bodies
     */
    static std::string parse_response(const HttpResponse& response);

private:
    HttpResponse post(const std::string& body);

    struct Impl;
    std::unique_ptr<Impl> impl_;
    HttpClassifierConfig config_;
    std::mutex mutex_;   ///< A curl easy handle is not shareable between threads
};

} // namespace taskweave

#endif // TASKWEAVE_HTTP_CLASSIFIER_HPP
