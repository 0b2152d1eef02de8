#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace odata_client {

class CancellationToken;

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex callbacks_mutex;
    uint64_t next_callback_id = 1;
    std::map<uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

// ----------------------------------------------------------------------

// Deregisters its callback on destruction. A callback that is already running
// on another thread may still complete after the registration is gone.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id);
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    void Reset();

private:
    std::shared_ptr<detail::CancellationState> state;
    uint64_t id = 0;
};

// ----------------------------------------------------------------------

class CancellationToken {
friend class CancellationSource;

public:
    // A default constructed token can never be cancelled
    CancellationToken() = default;

    bool CanBeCancelled() const { return state != nullptr; }
    bool IsCancellationRequested() const;

    // Runs `callback` on cancellation, or immediately if already cancelled
    CancellationRegistration Register(std::function<void()> callback) const;

private:
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state;
};

// ----------------------------------------------------------------------

class CancellationSource {
public:
    CancellationSource();

    CancellationToken Token() const;
    void Cancel();
    bool IsCancellationRequested() const;

private:
    std::shared_ptr<detail::CancellationState> state;
};

} // namespace odata_client
