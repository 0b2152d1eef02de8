#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "client_settings.hpp"
#include "http_transport.hpp"

namespace odata_client {

enum class TransportState {
    UNINITIALIZED,
    TRANSPORT_ACQUIRED,
    DISPOSED
};

std::string TransportStateToString(TransportState state);

// ----------------------------------------------------------------------

// Owns the single transport of one client. The transport is built by the
// first Acquire and reused until Release; a released manager never builds
// another one.
class TransportManager {
public:
    explicit TransportManager(const ClientSettings &settings);
    ~TransportManager();

    TransportManager(const TransportManager&) = delete;
    TransportManager& operator=(const TransportManager&) = delete;

    // Throws ODataClientException(DISPOSED_STATE) after Release
    std::shared_ptr<HttpTransport> Acquire();
    void Release();

    TransportState State() const;
    bool IsReleased() const;

    // Options the transport is (or will be) built with
    TransportOptions EffectiveOptions() const;

private:
    std::shared_ptr<HttpTransport> CreateTransport() const;

    ClientSettings settings;

    mutable std::mutex transport_mutex;
    std::shared_ptr<HttpTransport> transport;
    std::atomic<bool> released{false};
};

} // namespace odata_client
