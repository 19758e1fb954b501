#include <mcplex/discovery/discovery_engine.h>

#include <spdlog/spdlog.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <future>
#include <unordered_set>

namespace mcplex::discovery {

DiscoveryEngine::DiscoveryEngine(SourceLoader loader, std::shared_ptr<ICapabilityProber> prober,
                                 DiscoveryOptions options)
    : loader_(std::move(loader)), prober_(std::move(prober)),
      pool_(std::max<std::size_t>(options.probeThreads, 1)) {}

DiscoveryEngine::~DiscoveryEngine() {
    pool_.join();
}

void DiscoveryEngine::addSupplementalSource(std::shared_ptr<ISupplementalSource> source) {
    if (source)
        supplemental_.push_back(std::move(source));
}

ServerDescriptor DiscoveryEngine::probeOne(ServerDescriptor server) {
    const std::string name = server.name;
    const std::string sourcePath = server.sourcePath;
    const std::string originalName = server.originalName;
    try {
        auto probed = prober_->probe(server);
        // The prober reports status and capabilities; identity stays with the engine.
        probed.name = name;
        probed.sourcePath = sourcePath;
        probed.originalName = originalName;
        if (probed.status == ServerStatus::Disconnected) {
            probed.markError("Probe finished without a connection status");
        }
        return probed;
    } catch (const std::exception& e) {
        spdlog::error("[Discovery] Unexpected error initializing server '{}': {}", name,
                      e.what());
        server.markError(std::string("Initialization failed: ") + e.what());
    } catch (...) {
        spdlog::error("[Discovery] Unexpected non-standard error initializing server '{}'", name);
        server.markError("Initialization failed: unknown error");
    }
    return server;
}

ConfigSource DiscoveryEngine::discoverSource(const RawSource& source) {
    ConfigSource out;
    out.path = source.path;
    out.servers.reserve(source.entries.size());

    std::vector<std::pair<std::size_t, std::future<ServerDescriptor>>> pending;
    for (const auto& entry : source.entries) {
        auto server = describeEntry(source.path, entry.name, entry.config);
        if (server.status == ServerStatus::Error) {
            spdlog::warn("[Discovery] Invalid config for server '{}': {}", entry.name,
                         server.errorMessage.value_or(""));
        } else if (prober_) {
            const std::size_t index = out.servers.size();
            pending.emplace_back(
                index, boost::asio::co_spawn(
                           pool_,
                           [this, server]() -> boost::asio::awaitable<ServerDescriptor> {
                               co_return probeOne(server);
                           },
                           boost::asio::use_future));
        }
        out.servers.push_back(std::move(server));
    }

    // Fan-in: every probe of this source completes before the source is emitted.
    for (auto& [index, future] : pending) {
        try {
            out.servers[index] = future.get();
        } catch (const std::exception& e) {
            spdlog::error("[Discovery] Probe task for '{}' failed: {}", out.servers[index].name,
                          e.what());
            out.servers[index].markError(std::string("Initialization failed: ") + e.what());
        }
    }

    const auto connected = std::count_if(out.servers.begin(), out.servers.end(),
                                         [](const ServerDescriptor& s) {
                                             return s.status == ServerStatus::Connected;
                                         });
    spdlog::info("[Discovery] {}: {} server(s), {} connected", out.path, out.servers.size(),
                 connected);
    return out;
}

DiscoveryReport DiscoveryEngine::discoverHierarchical() {
    auto loaded = loader_.loadSources();

    DiscoveryReport report;
    report.skipped = std::move(loaded.skipped);
    for (const auto& raw : loaded.sources) {
        auto source = discoverSource(raw);
        if (!source.servers.empty())
            report.sources.push_back(std::move(source));
    }

    std::size_t total = 0;
    for (const auto& s : report.sources)
        total += s.servers.size();
    spdlog::info("[Discovery] Total config files: {}, total servers: {}, skipped files: {}",
                 report.sources.size(), total, report.skipped.size());
    return report;
}

std::vector<ServerDescriptor> DiscoveryEngine::flatten(const std::vector<ConfigSource>& sources) {
    std::vector<ServerDescriptor> out;
    for (const auto& source : sources)
        out.insert(out.end(), source.servers.begin(), source.servers.end());
    return renameCollisions(std::move(out));
}

std::vector<ServerDescriptor>
DiscoveryEngine::renameCollisions(std::vector<ServerDescriptor> servers) {
    std::unordered_set<std::string> taken;
    for (auto& server : servers) {
        if (server.originalName.empty())
            server.originalName = server.name;

        if (taken.count(server.name)) {
            int counter = 2;
            std::string unique;
            do {
                unique = server.name + "#" + std::to_string(counter++);
            } while (taken.count(unique));
            spdlog::warn("[Discovery] Server '{}' already exists; renaming entry from {} to "
                         "'{}'",
                         server.name, server.sourcePath, unique);
            server.name = std::move(unique);
        }
        taken.insert(server.name);
    }
    return servers;
}

void DiscoveryEngine::mergeSupplemental(std::vector<ServerDescriptor>& servers,
                                        std::vector<ServerDescriptor> supplemental) {
    std::unordered_set<std::string> existing;
    for (const auto& s : servers)
        existing.insert(s.name);

    for (auto& s : supplemental) {
        if (existing.insert(s.name).second) {
            servers.push_back(std::move(s));
        } else {
            spdlog::debug("[Discovery] Supplemental server '{}' shadowed by configured server",
                          s.name);
        }
    }
}

std::vector<ServerDescriptor> DiscoveryEngine::discoverFlat() {
    auto report = discoverHierarchical();
    auto servers = flatten(report.sources);

    for (const auto& source : supplemental_) {
        std::vector<ServerDescriptor> found;
        try {
            found = source->discover();
        } catch (const std::exception& e) {
            spdlog::warn("[Discovery] Supplemental discovery failed: {}", e.what());
            continue;
        }
        mergeSupplemental(servers, std::move(found));
    }
    return servers;
}

ServerDescriptor DiscoveryEngine::refreshServer(const ServerDescriptor& server) {
    ServerDescriptor fresh = server;
    fresh.status = ServerStatus::Disconnected;
    fresh.errorMessage.reset();
    fresh.tools.clear();
    fresh.resources.clear();
    fresh.prompts.clear();
    if (!prober_)
        return fresh;
    return probeOne(std::move(fresh));
}

} // namespace mcplex::discovery
