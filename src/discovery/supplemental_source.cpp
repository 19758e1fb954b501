#include <mcplex/discovery/source_loader.h>
#include <mcplex/discovery/server_validator.h>
#include <mcplex/discovery/supplemental_source.h>

#include <spdlog/spdlog.h>

namespace mcplex::discovery {

ClientConfigSupplementalSource::ClientConfigSupplementalSource(
    std::vector<std::filesystem::path> paths)
    : paths_(std::move(paths)) {}

std::vector<ServerDescriptor> ClientConfigSupplementalSource::discover() {
    std::vector<ServerDescriptor> out;
    for (const auto& path : paths_) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            continue;

        auto loaded = SourceLoader::loadSource(path);
        if (!loaded) {
            spdlog::debug("[Discovery] Ignoring client config {}: {}", path.string(),
                          loaded.error().message);
            continue;
        }
        for (const auto& entry : loaded.value().entries) {
            out.push_back(describeEntry(loaded.value().path, entry.name, entry.config));
        }
    }
    return out;
}

} // namespace mcplex::discovery
