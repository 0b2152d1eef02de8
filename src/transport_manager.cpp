#include <chrono>

#include "odata_error.hpp"
#include "tracing.hpp"
#include "transport_manager.hpp"

namespace odata_client {

std::string TransportStateToString(TransportState state)
{
    switch (state) {
    case TransportState::UNINITIALIZED: return "Uninitialized";
    case TransportState::TRANSPORT_ACQUIRED: return "TransportAcquired";
    case TransportState::DISPOSED: return "Disposed";
    default: return "Unknown";
    }
}

// ----------------------------------------------------------------------

TransportManager::TransportManager(const ClientSettings &settings)
    : settings(settings)
{ }

TransportManager::~TransportManager()
{
    Release();
}

std::shared_ptr<HttpTransport> TransportManager::Acquire()
{
    std::lock_guard<std::mutex> lock(transport_mutex);
    if (released.load()) {
        throw ODataClientException(ErrorKind::DISPOSED_STATE, "Cannot access a disposed client");
    }

    if (!transport) {
        transport = CreateTransport();
        ODATA_CLIENT_TRACE_DEBUG("TRANSPORT_MANAGER", "Transport created for " + settings.base_address.ToString());
    }
    return transport;
}

void TransportManager::Release()
{
    std::shared_ptr<HttpTransport> to_dispose;
    {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (released.exchange(true)) {
            return;
        }
        to_dispose = std::move(transport);
        transport.reset();
    }

    if (to_dispose) {
        to_dispose->Dispose();
        ODATA_CLIENT_TRACE_DEBUG("TRANSPORT_MANAGER", "Transport released for " + settings.base_address.ToString());
    }
}

TransportState TransportManager::State() const
{
    std::lock_guard<std::mutex> lock(transport_mutex);
    if (released.load()) {
        return TransportState::DISPOSED;
    }
    return transport ? TransportState::TRANSPORT_ACQUIRED : TransportState::UNINITIALIZED;
}

bool TransportManager::IsReleased() const
{
    return released.load();
}

TransportOptions TransportManager::EffectiveOptions() const
{
    TransportOptions options;
    if (settings.timeout >= std::chrono::milliseconds(1)) {
        options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(settings.timeout).count();
    }
    if (settings.on_apply_transport_options.has_value()) {
        settings.on_apply_transport_options.value()(options);
    }
    return options;
}

std::shared_ptr<HttpTransport> TransportManager::CreateTransport() const
{
    auto options = EffectiveOptions();
    if (settings.transport_factory.has_value()) {
        auto custom = settings.transport_factory.value()(options);
        if (!custom) {
            throw ODataClientException(ErrorKind::TRANSPORT, "Transport factory returned no transport");
        }
        return custom;
    }
    return std::make_shared<HttplibTransport>(options);
}

} // namespace odata_client
