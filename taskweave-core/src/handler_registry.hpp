/**
 * @file handler_registry.hpp
 * @brief Registry of named handlers and their routing metadata
 *
 * Design Pattern: Registry
 * - Handlers register under a unique name with a descriptor (kinds, keywords)
 * - The Router resolves work units to names; the Coordinator fetches the callable
 * - Registration order is preserved and breaks ties between equally good matches
 */

#ifndef TASKWEAVE_HANDLER_REGISTRY_HPP
#define TASKWEAVE_HANDLER_REGISTRY_HPP

#include "handler_interface.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace taskweave {

/**
 * @brief Thread-safe handler registry
 *
 * Usage Example:
 *   @code
 *   HandlerRegistry registry;
 *   HandlerDescriptor billing("billing");
 *   billing.keywords = {"invoice", "refund"};
 *   registry.register_handler(billing, [](const WorkUnit& unit, const DelegationContext&) {
 *       return HandlerResult({{"answer", "refund issued"}});
 *   });
 *   @endcode
 */
class HandlerRegistry {
public:
    /**
     * @brief Register a handler
     *
     * @throws ConfigurationError If the name is empty, already registered, or the handler is empty
     */
    void register_handler(const HandlerDescriptor& descriptor, Handler handler);

    /**
     * @throws ConfigurationError If no handler has this name
     */
    Handler get_handler(const std::string& name) const;

    /**
     * @throws ConfigurationError If no handler has this name
     */
    HandlerDescriptor get_descriptor(const std::string& name) const;

    bool is_registered(const std::string& name) const;

    /**
     * @brief Descriptors in registration order
     */
    std::vector<HandlerDescriptor> list_handlers() const;

    std::vector<std::string> list_handler_names() const;

    size_t size() const;

private:
    struct Entry {
        HandlerDescriptor descriptor;
        Handler handler;
    };

    std::string available_names() const;   // caller holds mutex_

    mutable std::mutex mutex_;
    std::map<std::string, Entry> registry_;
    std::vector<std::string> order_;
};

} // namespace taskweave

#endif // TASKWEAVE_HANDLER_REGISTRY_HPP
