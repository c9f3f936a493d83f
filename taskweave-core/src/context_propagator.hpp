/**
 * @file context_propagator.hpp
 * @brief Carries ambient correlation context across threads and queued tasks
 *
 * Each thread owns an ambient PropagationToken (correlation_id, trace_id and
 * free-form bound fields) that the Logger merges into every entry. Work handed
 * to another thread loses that context unless it is captured on the submitting
 * thread and restored on the executing one:
 *
 *   @code
 *   auto token = ContextPropagator::capture();
 *   std::thread worker([token]() {
 *       auto scope = ContextPropagator::restore(token);
 *       Logger::get_instance().log_info("worker", "running");  // carries correlation_id
 *   });
 *   @endcode
 *
 * WorkerPool and propagating_async do this automatically. Queued tasks carry
 * the token inside their serialized envelope instead (see TaskQueue).
 */

#ifndef TASKWEAVE_CONTEXT_PROPAGATOR_HPP
#define TASKWEAVE_CONTEXT_PROPAGATOR_HPP

#include <nlohmann/json.hpp>
#include <future>
#include <map>
#include <string>
#include <utility>

namespace taskweave {

/**
 * @brief Immutable snapshot of ambient context
 */
struct PropagationToken {
    std::string correlation_id;
    std::string trace_id;
    std::map<std::string, std::string> fields;  ///< Extra bound keys (request_id, conversation_id, ...)

    bool empty() const {
        return correlation_id.empty() && trace_id.empty() && fields.empty();
    }

    nlohmann::json to_json() const;

    /**
     * @brief Rebuild a token from its serialized form
     *
     * Missing or non-string values yield empty fields; a non-object input yields
     * an empty token. Never throws.
     */
    static PropagationToken from_json(const nlohmann::json& j);
};

/**
 * @brief RAII guard that reinstates the previous ambient context on destruction
 */
class ScopedContext {
public:
    explicit ScopedContext(PropagationToken previous);
    ~ScopedContext();

    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;
    ScopedContext(ScopedContext&&) = delete;
    ScopedContext& operator=(ScopedContext&&) = delete;

private:
    PropagationToken previous_;
};

class ContextPropagator {
public:
    /**
     * @brief Snapshot the calling thread's ambient context
     */
    static PropagationToken capture();

    /**
     * @brief Install a token as the calling thread's ambient context
     *
     * @return Guard restoring whatever was ambient before
     */
    static ScopedContext restore(const PropagationToken& token);

    /**
     * @brief Bind a key on the current thread's context
     *
     * "correlation_id" and "trace_id" update the dedicated fields.
     */
    static void bind(const std::string& key, const std::string& value);

    /**
     * @brief Clear the current thread's context (used by intake after a request)
     */
    static void clear();

    static const PropagationToken& current();

    /**
     * @brief Generate a random RFC 4122 version 4 identifier
     */
    static std::string generate_id();

    /**
     * @brief Wrap a callable so it runs under the context captured now
     */
    template <typename Fn>
    static auto wrap(Fn fn) {
        PropagationToken token = capture();
        return [token, fn = std::move(fn)]() mutable {
            ScopedContext scope = restore(token);
            return fn();
        };
    }
};

/**
 * @brief std::async replacement that propagates the caller's ambient context
 */
template <typename Fn>
auto propagating_async(Fn fn) -> std::future<decltype(fn())> {
    return std::async(std::launch::async, ContextPropagator::wrap(std::move(fn)));
}

} // namespace taskweave

#endif // TASKWEAVE_CONTEXT_PROPAGATOR_HPP
