/**
 * @file main.cpp
 * @brief crdtperf sync node demo
 *
 * Runs one node against a set of in-process peers. A synthetic replication
 * engine produces deltas and conflicts; the node compresses, schedules and
 * batches them while monitoring samples health. On exit the health report is
 * printed and the metrics export is written to disk.
 */

#include "crdtperf/crdtperf.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <random>
#include <thread>

// Global shutdown flag
std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down...\n";
    g_running = false;
}

int main(int argc, char* argv[]) {
    using namespace crdtperf;

    // Parse command line arguments
    std::string config_path;
    std::string export_path = "crdt_metrics_export.json";
    double duration_s = 20.0;
    int peer_count = 3;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--export" && i + 1 < argc) {
            export_path = argv[++i];
        } else if (arg == "--duration" && i + 1 < argc) {
            duration_s = std::stod(argv[++i]);
        } else if (arg == "--peers" && i + 1 < argc) {
            peer_count = std::stoi(argv[++i]);
        } else if (arg == "--help") {
            std::cout << "crdtperf sync node\n\n"
                      << "Usage: " << argv[0] << " [options]\n\n"
                      << "Options:\n"
                      << "  --config <file>    XML node configuration\n"
                      << "  --export <file>    Metrics export path (default: crdt_metrics_export.json)\n"
                      << "  --duration <sec>   Run time (default: 20)\n"
                      << "  --peers <n>        Simulated peers (default: 3)\n"
                      << "  --help             Show this help\n";
            return 0;
        }
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "========================================\n";
    std::cout << "   crdtperf sync node\n";
    std::cout << "========================================\n";
    std::cout << "Version: " << GetVersionString() << "\n\n";

    config::NodeConfig node_config;
    if (config_path.empty()) {
        node_config = config::NodeConfig::defaults();
        node_config.node_id = "demo-node";
        node_config.optimizer.lazy_sync = optimize::LazySyncConfig::responsive();
        node_config.monitoring.sampling_interval = std::chrono::seconds(2);
    } else {
        try {
            config::ConfigLoader loader;
            loader.add_search_path("./examples/sync_node");
            node_config = loader.load_node_config(config_path);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load configuration: " << e.what() << "\n";
            return 1;
        }
    }

    NodeContext node(node_config);
    auto log = core::logging::get_logger("sync_node");

    std::mt19937 rng(42);
    std::atomic<UInt64> version{0};

    // Synthetic deltas: mostly small, occasionally large
    node.optimizer().set_delta_provider([&](const PeerId& peer) -> std::optional<nlohmann::json> {
        nlohmann::json operations = nlohmann::json::array();
        const int count = (version.fetch_add(1) % 5 == 0) ? 400 : 8;
        for (int i = 0; i < count; ++i) {
            operations.push_back({{"op", "set"},
                                  {"key", "doc/" + std::to_string(i)},
                                  {"value", "payload for " + peer}});
        }
        return nlohmann::json{{"version", version.load()}, {"operations", operations}};
    });

    // Loopback peers accept everything they can decode
    node.optimizer().set_transport(
        [&](const PeerId& peer, const std::vector<UInt8>& bytes, optimize::CompressionAlgorithm algorithm) {
            nlohmann::json decoded;
            Status status = node.optimizer().decode_received_delta(bytes, algorithm, decoded);
            if (!succeeded(status)) {
                log->warn("Peer {} rejected delta: {}", peer, status_to_string(status));
                return false;
            }
            return true;
        });

    node.optimizer().set_default_conflict_resolver(
        [](const std::string&, std::vector<ConflictRecord>& group) {
            for (auto& conflict : group) {
                conflict.mark_resolved("last_writer_wins", true);
            }
        });

    node.set_engine_probe([]() {
        EngineHealth health;
        health.data_consistency_score = 0.98;
        health.partition_resilience = 0.95;
        return health;
    });

    Status status = node.start();
    if (!succeeded(status)) {
        std::cerr << "Failed to start node: " << status_to_string(status) << "\n";
        return 1;
    }

    std::vector<PeerId> peers;
    for (int i = 0; i < peer_count; ++i) {
        peers.push_back("peer-" + std::to_string(i + 1));
    }

    const auto deadline = SteadyClock::now() + std::chrono::duration_cast<Duration>(Seconds(duration_s));
    std::uniform_int_distribution<int> activity(0, 150);
    std::uniform_int_distribution<int> conflict_roll(0, 9);
    UInt64 conflict_seq = 0;

    while (g_running && SteadyClock::now() < deadline) {
        for (const auto& peer : peers) {
            const int ops = activity(rng);
            node.optimizer().record_peer_activity(peer, static_cast<UInt64>(ops));
            node.optimizer().schedule_optimized_sync(peer, ops > 100 ? "high" : (ops < 20 ? "low" : "normal"));
        }

        if (conflict_roll(rng) < 3) {
            ConflictRecord conflict;
            conflict.conflict_id = "conflict-" + std::to_string(++conflict_seq);
            conflict.conflict_type = (conflict_seq % 2 == 0) ? "concurrent_update" : "delete_update";
            conflict.detected_at = WallClock::now();
            conflict.involved_peers = {node_config.node_id, peers.front()};
            node.report_conflict(std::move(conflict));
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    node.monitoring().sample_now();
    node.shutdown();

    auto report = node.monitoring().get_comprehensive_health_report();
    std::cout << "\nHealth report\n" << report.to_json().dump(2) << "\n";

    std::ofstream out(export_path);
    if (!out) {
        std::cerr << "Cannot write metrics export to " << export_path << "\n";
        return 1;
    }
    out << node.monitoring().export_metrics();
    std::cout << "Metrics exported to " << export_path << "\n";
    return 0;
}
