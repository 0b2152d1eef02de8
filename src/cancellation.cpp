#include <vector>

#include "cancellation.hpp"
#include "tracing.hpp"

namespace odata_client {

CancellationRegistration::CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
    : state(std::move(state)), id(id)
{ }

CancellationRegistration::~CancellationRegistration()
{
    Reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state(std::move(other.state)), id(other.id)
{
    other.id = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept
{
    if (this != &other) {
        Reset();
        state = std::move(other.state);
        id = other.id;
        other.id = 0;
    }
    return *this;
}

void CancellationRegistration::Reset()
{
    if (state && id != 0) {
        std::lock_guard<std::mutex> lock(state->callbacks_mutex);
        state->callbacks.erase(id);
    }
    state.reset();
    id = 0;
}

// ----------------------------------------------------------------------

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state(std::move(state))
{ }

bool CancellationToken::IsCancellationRequested() const
{
    return state != nullptr && state->cancelled.load();
}

CancellationRegistration CancellationToken::Register(std::function<void()> callback) const
{
    if (!state) {
        return CancellationRegistration();
    }

    {
        std::lock_guard<std::mutex> lock(state->callbacks_mutex);
        if (!state->cancelled.load()) {
            auto id = state->next_callback_id++;
            state->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state, id);
        }
    }

    callback();
    return CancellationRegistration();
}

// ----------------------------------------------------------------------

CancellationSource::CancellationSource()
    : state(std::make_shared<detail::CancellationState>())
{ }

CancellationToken CancellationSource::Token() const
{
    return CancellationToken(state);
}

void CancellationSource::Cancel()
{
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(state->callbacks_mutex);
        if (state->cancelled.exchange(true)) {
            return;
        }
        for (auto &entry : state->callbacks) {
            to_run.emplace_back(std::move(entry.second));
        }
        state->callbacks.clear();
    }

    ODATA_CLIENT_TRACE_DEBUG("CANCELLATION", "Cancellation requested, running " + std::to_string(to_run.size()) + " callback(s)");
    for (auto &callback : to_run) {
        callback();
    }
}

bool CancellationSource::IsCancellationRequested() const
{
    return state->cancelled.load();
}

} // namespace odata_client
