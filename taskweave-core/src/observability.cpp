/**
 * @file observability.cpp
 * @brief Implementation of EventEmitter
 */

#include "observability.hpp"
#include "context_propagator.hpp"
#include <exception>

namespace taskweave {

EventEmitter::EventEmitter(size_t buffer_capacity)
    : capacity_(buffer_capacity == 0 ? 1 : buffer_capacity), emitted_(0), dropped_(0) {}

void EventEmitter::emit(ObservabilityEvent event) {
    // Resilience layers emit without knowing the unit; the ambient context does
    if (event.work_unit_id.empty() || event.conversation_id.empty()) {
        const PropagationToken& ambient = ContextPropagator::current();
        auto pick = [&ambient](std::string& target, const char* key) {
            auto it = ambient.fields.find(key);
            if (target.empty() && it != ambient.fields.end()) {
                target = it->second;
            }
        };
        pick(event.work_unit_id, "work_unit_id");
        pick(event.conversation_id, "conversation_id");
    }

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (buffer_.size() >= capacity_) {
            buffer_.pop_front();
            ++dropped_;
        }
        buffer_.push_back(event);
        ++emitted_;
        listeners = listeners_;
    }

    std::map<std::string, std::string> fields = event.attributes;
    fields["event"] = event.name;
    fields["outcome"] = event.outcome;
    if (!event.work_unit_id.empty()) {
        fields["work_unit_id"] = event.work_unit_id;
    }
    if (!event.conversation_id.empty()) {
        fields["conversation_id"] = event.conversation_id;
    }
    if (event.duration_ms > 0.0) {
        fields["duration_ms"] = std::to_string(event.duration_ms);
    }
    Logger::get_instance().log(event.level, event.name, fields);

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            Logger::get_instance().log_warning("observability", "Event listener failed",
                                               {{"event_name", event.name}, {"error", e.what()}});
        }
    }
}

void EventEmitter::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void EventEmitter::add_exporter(Exporter exporter) {
    std::lock_guard<std::mutex> lock(mutex_);
    exporters_.push_back(std::move(exporter));
}

size_t EventEmitter::flush() {
    std::vector<ObservabilityEvent> batch;
    std::vector<Exporter> exporters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.assign(buffer_.begin(), buffer_.end());
        buffer_.clear();
        exporters = exporters_;
    }

    for (const auto& exporter : exporters) {
        try {
            exporter(batch);
        } catch (const std::exception& e) {
            Logger::get_instance().log_warning("observability", "Event export failed",
                                               {{"batch_size", std::to_string(batch.size())},
                                                {"error", e.what()}});
        }
    }
    Logger::get_instance().flush();
    return batch.size();
}

std::vector<ObservabilityEvent> EventEmitter::recent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ObservabilityEvent>(buffer_.begin(), buffer_.end());
}

size_t EventEmitter::emitted_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return emitted_;
}

size_t EventEmitter::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace taskweave
