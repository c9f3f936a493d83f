/**
 * @file bulkhead.hpp
 * @brief Per-dependency concurrency limiter
 */

#ifndef TASKWEAVE_BULKHEAD_HPP
#define TASKWEAVE_BULKHEAD_HPP

#include "observability.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace taskweave {

/**
 * @brief Bulkhead parameters (0 is the unset placeholder)
 */
struct BulkheadConfig {
    size_t capacity;                          ///< Max concurrent calls
    std::chrono::milliseconds wait_timeout;   ///< Max wait for a free slot

    BulkheadConfig()
        : capacity(0), wait_timeout(0) {}

    BulkheadConfig(size_t max_concurrent, std::chrono::milliseconds wait)
        : capacity(max_concurrent), wait_timeout(wait) {}
};

/**
 * @brief Counting semaphore with a bounded wait
 *
 * Must be owned by a std::shared_ptr: permits keep the bulkhead alive, so a
 * slot held by an abandoned attempt is returned when that attempt finishes,
 * even if the registry that created the bulkhead is gone.
 */
class Bulkhead : public std::enable_shared_from_this<Bulkhead> {
public:
    /**
     * @brief RAII slot; returned to the bulkhead on destruction
     */
    class Permit {
    public:
        Permit() = default;
        explicit Permit(std::shared_ptr<Bulkhead> owner) : owner_(std::move(owner)) {}
        ~Permit() { release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        Permit(Permit&& other) noexcept : owner_(std::move(other.owner_)) {}
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = std::move(other.owner_);
            }
            return *this;
        }

        bool held() const { return owner_ != nullptr; }

        void release() {
            if (owner_) {
                owner_->release_slot();
                owner_.reset();
            }
        }

    private:
        std::shared_ptr<Bulkhead> owner_;
    };

    Bulkhead(std::string dependency, BulkheadConfig config, EventEmitter& events);

    Bulkhead(const Bulkhead&) = delete;
    Bulkhead& operator=(const Bulkhead&) = delete;

    /**
     * @brief Take a slot, waiting up to wait_timeout
     *
     * @throws BulkheadTimeoutError If no slot frees up in time
     */
    Permit acquire();

    size_t in_flight() const;
    size_t peak_in_flight() const;
    size_t capacity() const { return config_.capacity; }

private:
    void release_slot();

    std::string dependency_;
    BulkheadConfig config_;
    EventEmitter& events_;

    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    size_t in_flight_;
    size_t peak_in_flight_;
};

} // namespace taskweave

#endif // TASKWEAVE_BULKHEAD_HPP
