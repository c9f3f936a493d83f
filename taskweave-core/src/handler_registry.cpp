/**
 * @file handler_registry.cpp
 * @brief Implementation of HandlerRegistry
 */

#include "handler_registry.hpp"
#include "errors.hpp"

namespace taskweave {

void HandlerRegistry::register_handler(const HandlerDescriptor& descriptor, Handler handler) {
    if (descriptor.name.empty()) {
        throw ConfigurationError("Handler name cannot be empty");
    }
    if (!handler) {
        throw ConfigurationError("Handler '" + descriptor.name + "' has no callable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (registry_.find(descriptor.name) != registry_.end()) {
        throw ConfigurationError("Handler already registered: " + descriptor.name);
    }
    registry_[descriptor.name] = Entry{descriptor, std::move(handler)};
    order_.push_back(descriptor.name);
}

Handler HandlerRegistry::get_handler(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        throw ConfigurationError("Unknown handler: " + name + ". Available handlers: " + available_names());
    }
    return it->second.handler;
}

HandlerDescriptor HandlerRegistry::get_descriptor(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        throw ConfigurationError("Unknown handler: " + name + ". Available handlers: " + available_names());
    }
    return it->second.descriptor;
}

bool HandlerRegistry::is_registered(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.find(name) != registry_.end();
}

std::vector<HandlerDescriptor> HandlerRegistry::list_handlers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HandlerDescriptor> descriptors;
    descriptors.reserve(order_.size());
    for (const auto& name : order_) {
        descriptors.push_back(registry_.at(name).descriptor);
    }
    return descriptors;
}

std::vector<std::string> HandlerRegistry::list_handler_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t HandlerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

std::string HandlerRegistry::available_names() const {
    std::string names;
    for (const auto& name : order_) {
        if (!names.empty()) names += ", ";
        names += name;
    }
    return names.empty() ? "(none)" : names;
}

} // namespace taskweave
