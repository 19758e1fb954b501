#pragma once

#include <mcplex/discovery/capability_prober.h>
#include <mcplex/discovery/server_descriptor.h>
#include <mcplex/discovery/server_validator.h>
#include <mcplex/discovery/source_loader.h>
#include <mcplex/discovery/supplemental_source.h>

#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace mcplex::discovery {

struct DiscoveryOptions {
    // Worker threads used to probe servers of one source concurrently.
    std::size_t probeThreads{8};
};

struct DiscoveryReport {
    std::vector<ConfigSource> sources;
    std::vector<SkippedSource> skipped;
};

/**
 * Turns configuration sources into validated, probed ConfigSource snapshots.
 *
 * Failures are contained at the smallest unit: an unparsable source is skipped with a
 * reason, an invalid or unreachable server becomes an Error-status descriptor. A run
 * always returns one descriptor for every entry it started with.
 *
 * Without a prober the engine validates only; valid servers stay Disconnected.
 */
class DiscoveryEngine {
public:
    DiscoveryEngine(SourceLoader loader, std::shared_ptr<ICapabilityProber> prober,
                    DiscoveryOptions options = {});
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    void addSupplementalSource(std::shared_ptr<ISupplementalSource> source);

    LoadReport loadSources() const { return loader_.loadSources(); }

    // Per source: validate every entry, probe the valid ones concurrently, wait for all.
    DiscoveryReport discoverHierarchical();

    // Hierarchical run flattened with collision renaming, then supplemental servers merged.
    std::vector<ServerDescriptor> discoverFlat();

    // Probes all entries of one already-loaded source.
    ConfigSource discoverSource(const RawSource& source);

    // Re-probes one server; the input is left untouched.
    ServerDescriptor refreshServer(const ServerDescriptor& server);

    /**
     * Flattens sources into one list. A name already taken by an earlier source is
     * suffixed "#2", "#3", ... and keeps its declared name in `originalName`.
     */
    static std::vector<ServerDescriptor> flatten(const std::vector<ConfigSource>& sources);

    // Same renaming over an already flat list; names that are unique stay as they are.
    static std::vector<ServerDescriptor> renameCollisions(std::vector<ServerDescriptor> servers);

    // Appends supplemental servers whose name is not already present.
    static void mergeSupplemental(std::vector<ServerDescriptor>& servers,
                                  std::vector<ServerDescriptor> supplemental);

private:
    ServerDescriptor probeOne(ServerDescriptor server);

    SourceLoader loader_;
    std::shared_ptr<ICapabilityProber> prober_;
    std::vector<std::shared_ptr<ISupplementalSource>> supplemental_;
    boost::asio::thread_pool pool_;
};

} // namespace mcplex::discovery
