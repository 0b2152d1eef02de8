#include "client_settings.hpp"

namespace odata_client {

ClientSettings::ClientSettings(const std::string &base_address)
    : base_address(base_address)
{ }

} // namespace odata_client
