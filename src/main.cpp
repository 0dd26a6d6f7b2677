#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "coherency_manager.hpp"
#include "gossip_transport.hpp"
#include "node_config.hpp"
#include "seqlock_store.hpp"
#include "slot_arena.hpp"

namespace
{
    const char *kDemoKey = "BSC:PCS:WBNB-USDT";

    pricemesh::NodeConfig defaultConfig()
    {
        pricemesh::NodeConfig config;
        config.node_id = "bsc-a";
        config.signing = pricemesh::SigningConfig::signedWith("pricemesh-demo-key");
        return config;
    }

    struct Node
    {
        Node(const pricemesh::NodeConfig &config, pricemesh::LoopbackBus &bus)
            : arena(config.shared_memory_name.empty()
                        ? pricemesh::SlotArena::anonymous(config.capacity)
                        : pricemesh::SlotArena::createShared(config.shared_memory_name, config.capacity)),
              store(arena, config.store),
              transport(bus, config.node_id),
              manager(config.node_id, store, transport, config.makeSigner(), config.coherency)
        {
        }

        pricemesh::SlotArena arena;
        pricemesh::SeqlockStore store;
        pricemesh::LoopbackTransport transport;
        pricemesh::CoherencyManager manager;
    };

    void printPrice(const Node &node)
    {
        auto entry = node.store.get(kDemoKey);
        std::cout << node.manager.nodeId() << " " << kDemoKey << ": ";
        if (!entry)
        {
            std::cout << "<none>" << std::endl;
            return;
        }
        std::cout << std::fixed << std::setprecision(2) << entry->price
                  << " @ t=" << entry->timestamp
                  << " (version " << entry->version << ")" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    pricemesh::NodeConfig config_a;
    try
    {
        config_a = argc > 1 ? pricemesh::NodeConfig::fromFile(argv[1]) : defaultConfig();
        pricemesh::configureLogging(config_a.log_level);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    // The peer shares everything except its identity and its segment
    pricemesh::NodeConfig config_b = config_a;
    config_b.node_id = config_a.node_id + "-peer";
    config_b.shared_memory_name.clear();

    try
    {
        pricemesh::LoopbackBus bus;
        auto node_a = std::make_unique<Node>(config_a, bus);
        auto node_b = std::make_unique<Node>(config_b, bus);

        std::cout << "=== pricemesh demo ===" << std::endl;

        node_b->store.set(kDemoKey, 30100000.0, 90);
        node_a->store.set(kDemoKey, 30150000.0, 100);
        printPrice(*node_a);
        printPrice(*node_b);

        std::cout << "\nRunning one gossip round on each node..." << std::endl;
        node_a->manager.runRound();
        node_b->manager.runRound();
        printPrice(*node_a);
        printPrice(*node_b);

        std::cout << "\n=== " << node_a->manager.nodeId() << " ===" << std::endl;
        std::cout << node_a->manager.statusJson().dump(2) << std::endl;
        std::cout << "\n=== " << node_b->manager.nodeId() << " ===" << std::endl;
        std::cout << node_b->manager.statusJson().dump(2) << std::endl;

        const bool shared = node_a->arena.isShared();
        const std::string segment = node_a->arena.name();
        node_b.reset();
        node_a.reset();
        if (shared)
        {
            pricemesh::SlotArena::removeShared(segment);
        }
    }
    catch (const std::exception &e)
    {
        spdlog::error("Demo failed: {}", e.what());
        return 1;
    }

    return 0;
}
