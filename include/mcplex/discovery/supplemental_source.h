#pragma once

#include <mcplex/discovery/server_descriptor.h>

#include <filesystem>
#include <vector>

namespace mcplex::discovery {

// Auto-detected server locations outside the explicitly configured sources.
class ISupplementalSource {
public:
    virtual ~ISupplementalSource() = default;
    virtual std::vector<ServerDescriptor> discover() = 0;
};

/**
 * Reads the MCP configuration files written by other clients. Entries are validated but
 * not probed; invalid ones come back in Error status like any other source.
 */
class ClientConfigSupplementalSource : public ISupplementalSource {
public:
    explicit ClientConfigSupplementalSource(std::vector<std::filesystem::path> paths);

    std::vector<ServerDescriptor> discover() override;

private:
    std::vector<std::filesystem::path> paths_;
};

} // namespace mcplex::discovery
