/**
 * @file observability.hpp
 * @brief Structured observability events for engine decision points
 *
 * Every decision point (routing, middleware stage, breaker transition, retry,
 * delegation, lifecycle step) emits an ObservabilityEvent. Events are:
 * - logged immediately through the Logger
 * - delivered synchronously to registered listeners
 * - buffered for batch export, drained by flush() (called during shutdown)
 */

#ifndef TASKWEAVE_OBSERVABILITY_HPP
#define TASKWEAVE_OBSERVABILITY_HPP

#include "logger.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace taskweave {

struct ObservabilityEvent {
    std::string name;                ///< Decision point, e.g. "routing", "circuit_breaker_opened"
    std::string outcome;             ///< "ok", "failed", "blocked", "skipped", rule name, ...
    std::string work_unit_id;
    std::string conversation_id;
    double duration_ms;
    LogLevel level;
    std::map<std::string, std::string> attributes;
    std::chrono::system_clock::time_point emitted_at;

    ObservabilityEvent()
        : duration_ms(0.0), level(LogLevel::INFO),
          emitted_at(std::chrono::system_clock::now()) {}

    ObservabilityEvent(const std::string& event_name, const std::string& event_outcome)
        : name(event_name), outcome(event_outcome), duration_ms(0.0), level(LogLevel::INFO),
          emitted_at(std::chrono::system_clock::now()) {}
};

/**
 * @brief Fan-out point for observability events
 *
 * Thread-safe. Listeners run on the emitting thread, outside the internal lock.
 */
class EventEmitter {
public:
    using Listener = std::function<void(const ObservabilityEvent&)>;
    using Exporter = std::function<void(const std::vector<ObservabilityEvent>&)>;

    /**
     * @param buffer_capacity Max events held for export; the oldest are dropped beyond it
     */
    explicit EventEmitter(size_t buffer_capacity = 1024);

    void emit(ObservabilityEvent event);

    void add_listener(Listener listener);
    void add_exporter(Exporter exporter);

    /**
     * @brief Hand buffered events to exporters and clear the buffer
     *
     * @return Number of events drained
     */
    size_t flush();

    /**
     * @brief Events buffered since the last flush
     */
    std::vector<ObservabilityEvent> recent() const;

    size_t emitted_count() const;
    size_t dropped_count() const;

private:
    mutable std::mutex mutex_;
    size_t capacity_;
    std::deque<ObservabilityEvent> buffer_;
    std::vector<Listener> listeners_;
    std::vector<Exporter> exporters_;
    size_t emitted_;
    size_t dropped_;
};

} // namespace taskweave

#endif // TASKWEAVE_OBSERVABILITY_HPP
