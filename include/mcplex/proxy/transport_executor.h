#pragma once

#include <mcplex/core/types.h>
#include <mcplex/discovery/server_descriptor.h>
#include <mcplex/proxy/elicitation.h>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace mcplex::proxy {

using json = nlohmann::json;

/**
 * Wire-level side of the proxy: opens backend sessions and executes forwarded calls.
 *
 * invoke() receives backend-native identifiers (unprefixed tool name, resource URI,
 * prompt name). When the backend asks for input mid-call the executor calls `elicit`,
 * which blocks until the operator resolves the request.
 */
class ITransportExecutor {
public:
    using ElicitationCallback =
        std::function<ElicitationOutcome(const std::string& message, const json& requestedSchema)>;

    virtual ~ITransportExecutor() = default;

    virtual Result<void> connect(const discovery::ServerDescriptor& server) = 0;
    virtual void disconnect(const std::string& serverName) = 0;

    virtual Result<json> invoke(const std::string& serverName, discovery::CapabilityKind kind,
                                const std::string& capabilityId, const json& arguments,
                                const ElicitationCallback& elicit) = 0;
};

} // namespace mcplex::proxy
