#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include "gossip_codec.hpp"
#include "gossip_transport.hpp"
#include "message_signer.hpp"
#include "optimized_containers.hpp"
#include "performance_monitor.hpp"
#include "seqlock_store.hpp"
#include "vector_clock.hpp"

namespace pricemesh
{
    struct CoherencyConfig
    {
        std::chrono::milliseconds gossip_interval{1000};
        // Larger rounds are split over several messages
        std::size_t max_entries_per_message = 512;
        std::chrono::milliseconds suspicion_timeout{5000};
        std::chrono::milliseconds failure_timeout{15000};
        // How long a dead peer stays in the peer table before it is forgotten
        std::chrono::milliseconds dead_peer_retention{300000};
        // Every Nth round resends every value this node originated; 0 disables
        std::uint64_t full_sync_interval_rounds = 60;
    };

    enum class RoundResult
    {
        Published,
        PublishFailed,
        Skipped
    };

    enum class PeerStatus
    {
        Alive,
        Suspected,
        Dead
    };

    const char *toString(PeerStatus status);

    struct PeerInfo
    {
        std::string node_id;
        std::chrono::steady_clock::time_point last_seen;
        PeerStatus status = PeerStatus::Alive;
        std::uint64_t messages = 0;
        // Our own clock component as last reported by this peer
        std::uint64_t acknowledged_round = 0;
    };

    struct CoherencyStats
    {
        std::uint64_t rounds_published = 0;
        std::uint64_t rounds_skipped = 0;
        std::uint64_t entries_published = 0;
        std::uint64_t publish_failures = 0;
        std::uint64_t messages_accepted = 0;
        std::uint64_t auth_rejected = 0;
        std::uint64_t decode_rejected = 0;
        std::uint64_t entries_applied = 0;
        std::uint64_t entries_stale = 0;
        std::uint64_t entries_rejected = 0;
        std::uint64_t conflicts_resolved = 0;
        std::uint64_t invariant_violations = 0;
        std::uint64_t resync_rounds = 0;
        std::uint64_t gaps_detected = 0;
        std::uint64_t peers_rejected = 0;
    };

    // Keeps one node's SeqlockStore causally consistent with its peers.
    //
    // Outbound: every gossip interval, drain the slots written locally since the
    // last round, bump this node's clock component once, sign and publish.
    // Inbound: verify, decode, merge the remote clock, then apply each entry
    // through the store's own staleness check. Equal timestamps with different
    // prices go to the lexicographically larger origin node id.
    //
    // Each frame names a baseline round. A receiver whose component for the
    // sender is behind that baseline has missed a round: it keeps the component
    // where it is, and the sender, seeing the lag in the receiver's clock, resends
    // everything it published after the lagging round.
    class CoherencyManager
    {
    public:
        // Receives internal faults found while handling inbound frames, which
        // are never thrown back into the transport.
        using FaultHandler = std::function<void(const std::string &)>;

        CoherencyManager(std::string node_id,
                         SeqlockStore &store,
                         GossipTransport &transport,
                         MessageSigner signer,
                         CoherencyConfig config = CoherencyConfig{});
        ~CoherencyManager();

        CoherencyManager(const CoherencyManager &) = delete;
        CoherencyManager &operator=(const CoherencyManager &) = delete;

        // Runs rounds on a timer thread until stop().
        void start();
        void stop();
        bool isRunning() const { return running_.load(); }

        // One outbound round. Returns Skipped if another round is in flight.
        RoundResult runRound();

        // Transport callback for every inbound frame. Never throws.
        void onMessageReceived(const Bytes &message);

        // Install before start() and before the transport delivers anything.
        void setFaultHandler(FaultHandler handler);

        const std::string &nodeId() const { return node_id_; }
        VectorClock clock() const;
        std::vector<PeerInfo> peers() const;
        CoherencyStats stats() const;
        const PerformanceMonitor &latency() const { return monitor_; }

        nlohmann::json statusJson() const;
        std::string prometheusMetrics() const;

    private:
        struct Counters
        {
            std::atomic<std::uint64_t> rounds_published{0};
            std::atomic<std::uint64_t> rounds_skipped{0};
            std::atomic<std::uint64_t> entries_published{0};
            std::atomic<std::uint64_t> publish_failures{0};
            std::atomic<std::uint64_t> messages_accepted{0};
            std::atomic<std::uint64_t> auth_rejected{0};
            std::atomic<std::uint64_t> decode_rejected{0};
            std::atomic<std::uint64_t> entries_applied{0};
            std::atomic<std::uint64_t> entries_stale{0};
            std::atomic<std::uint64_t> entries_rejected{0};
            std::atomic<std::uint64_t> conflicts_resolved{0};
            std::atomic<std::uint64_t> invariant_violations{0};
            std::atomic<std::uint64_t> resync_rounds{0};
            std::atomic<std::uint64_t> gaps_detected{0};
            std::atomic<std::uint64_t> peers_rejected{0};
        };

        void onStoreWrite(SlotIndex index, WriteSource source);
        void requeue(SlotIndex index);
        bool publishFrame(const GossipMessage &message);
        void applyEntry(const GossipEntry &entry, const std::string &sender, OriginId origin);
        void reportFault(const std::string &what);

        void touchPeer(const std::string &node_id, std::uint64_t acknowledged_round);
        void refreshPeers();
        // Lowest round of ours any live peer has acknowledged; empty with no live peers.
        std::optional<std::uint64_t> slowestAcknowledgedRound() const;
        PeerStatus statusFor(std::chrono::steady_clock::duration age) const;

        void scheduleNextRound();

        const std::string node_id_;
        SeqlockStore &store_;
        GossipTransport &transport_;
        const MessageSigner signer_;
        const CoherencyConfig config_;

        DirtySet dirty_;
        FaultHandler fault_handler_;

        // Round state, only touched by the round in flight
        std::vector<std::uint64_t> published_round_;
        std::uint64_t last_complete_round_ = 0;

        mutable std::mutex clock_mutex_;
        VectorClock clock_;

        mutable std::mutex peers_mutex_;
        std::map<std::string, PeerInfo> peers_;

        mutable Counters counters_;
        PerformanceMonitor monitor_;

        std::atomic<bool> round_in_flight_{false};
        std::atomic<bool> running_{false};
        boost::asio::io_context io_;
        boost::asio::steady_timer timer_;
        std::thread timer_thread_;
    };

} // namespace pricemesh
