/**
 * @file context_propagator.cpp
 * @brief Thread-local ambient context storage
 */

#include "context_propagator.hpp"
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace taskweave {

namespace {

PropagationToken& ambient() {
    thread_local PropagationToken token;
    return token;
}

} // anonymous namespace

nlohmann::json PropagationToken::to_json() const {
    nlohmann::json j;
    j["correlation_id"] = correlation_id;
    j["trace_id"] = trace_id;
    j["fields"] = fields;
    return j;
}

PropagationToken PropagationToken::from_json(const nlohmann::json& j) {
    PropagationToken token;
    if (!j.is_object()) {
        return token;
    }
    // Non-string ids from a foreign producer are dropped, never thrown
    auto id_field = [&j](const char* key) {
        auto it = j.find(key);
        return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
    };
    token.correlation_id = id_field("correlation_id");
    token.trace_id = id_field("trace_id");
    if (j.contains("fields") && j["fields"].is_object()) {
        for (const auto& [key, value] : j["fields"].items()) {
            if (value.is_string()) {
                token.fields[key] = value.get<std::string>();
            }
        }
    }
    return token;
}

ScopedContext::ScopedContext(PropagationToken previous)
    : previous_(std::move(previous)) {}

ScopedContext::~ScopedContext() {
    ambient() = std::move(previous_);
}

PropagationToken ContextPropagator::capture() {
    return ambient();
}

ScopedContext ContextPropagator::restore(const PropagationToken& token) {
    PropagationToken previous = ambient();
    ambient() = token;
    return ScopedContext(std::move(previous));
}

void ContextPropagator::bind(const std::string& key, const std::string& value) {
    PropagationToken& token = ambient();
    if (key == "correlation_id") {
        token.correlation_id = value;
    } else if (key == "trace_id") {
        token.trace_id = value;
    } else {
        token.fields[key] = value;
    }
}

void ContextPropagator::clear() {
    ambient() = PropagationToken();
}

const PropagationToken& ContextPropagator::current() {
    return ambient();
}

std::string ContextPropagator::generate_id() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t high = dist(rng);
    uint64_t low = dist(rng);

    // version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << "-"
        << std::setw(4) << ((high >> 16) & 0xFFFF) << "-"
        << std::setw(4) << (high & 0xFFFF) << "-"
        << std::setw(4) << (low >> 48) << "-"
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

} // namespace taskweave
