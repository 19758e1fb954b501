#pragma once

#include <mcplex/discovery/server_descriptor.h>

namespace mcplex::discovery {

/**
 * Connects to a backend described by a ServerDescriptor and queries its capabilities.
 *
 * Implementations return a copy of the descriptor marked Connected (capability lists
 * populated) or Error (errorMessage set). Ordinary connection failures must be reported
 * through the returned status rather than thrown; the discovery engine still guards
 * every call against exceptions.
 */
class ICapabilityProber {
public:
    virtual ~ICapabilityProber() = default;
    virtual ServerDescriptor probe(const ServerDescriptor& server) = 0;
};

} // namespace mcplex::discovery
