#pragma once

#include <mcplex/core/types.h>
#include <mcplex/discovery/server_descriptor.h>

#include <optional>
#include <string>

namespace mcplex::discovery {

struct ValidatedEntry {
    std::string name;
    ServerKind kind{ServerKind::StdIO};
    ConnectionParams connection;
};

/**
 * Structural checks for one server entry, by declared kind:
 *  - stdio requires `command`; `args` must be an array, `env` an object
 *  - http/sse require `url`; `headers` must be an object
 * Failures carry ErrorCode::ValidationError and an operator-facing message.
 */
class ServerValidator {
public:
    static Result<ValidatedEntry> validate(const std::string& name, const json& entry);

    // Kind named by the entry's `type` field (stdio when absent), if recognisable.
    static std::optional<ServerKind> declaredKind(const json& entry);
};

// Descriptor for a raw entry: validated connection params, or Error status with the reason.
ServerDescriptor describeEntry(const std::string& sourcePath, const std::string& name,
                               const json& entry);

} // namespace mcplex::discovery
