// RangeCast - Seekable media delivery engine
// Cooperative cancellation flag shared between a consumer and its workers

#ifndef RANGECAST_CORE_CANCELLATION_HPP
#define RANGECAST_CORE_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace rangecast {
namespace core {

/**
 * @brief Shared flag checked at suspension points (between backend parts,
 * while waiting on a fill).
 *
 * Copies share the same flag. A default-constructed token can be cancelled
 * like any other.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace core
} // namespace rangecast

#endif // RANGECAST_CORE_CANCELLATION_HPP
