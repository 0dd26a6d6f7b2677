#include "coherency_manager.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace pricemesh
{
    namespace
    {
        std::uint64_t load(const std::atomic<std::uint64_t> &counter)
        {
            return counter.load(std::memory_order_relaxed);
        }

        void bump(std::atomic<std::uint64_t> &counter, std::uint64_t by = 1)
        {
            counter.fetch_add(by, std::memory_order_relaxed);
        }

        struct InFlightGuard
        {
            std::atomic<bool> &flag;
            ~InFlightGuard() { flag.store(false, std::memory_order_release); }
        };
    }

    const char *toString(PeerStatus status)
    {
        switch (status)
        {
        case PeerStatus::Alive:
            return "alive";
        case PeerStatus::Suspected:
            return "suspected";
        case PeerStatus::Dead:
            return "dead";
        }
        return "unknown";
    }

    CoherencyManager::CoherencyManager(std::string node_id,
                                       SeqlockStore &store,
                                       GossipTransport &transport,
                                       MessageSigner signer,
                                       CoherencyConfig config)
        : node_id_(std::move(node_id)),
          store_(store),
          transport_(transport),
          signer_(std::move(signer)),
          config_(config),
          dirty_(store.capacity()),
          published_round_(store.capacity(), 0),
          timer_(io_)
    {
        if (node_id_.empty() || node_id_.size() > UINT16_MAX)
        {
            throw std::invalid_argument("node id must be 1..65535 bytes");
        }
        if (config_.gossip_interval.count() <= 0)
        {
            throw std::invalid_argument("gossip interval must be positive");
        }
        if (config_.max_entries_per_message == 0)
        {
            throw std::invalid_argument("max_entries_per_message must be positive");
        }
        if (store_.isReadOnly())
        {
            throw std::invalid_argument("coherency manager needs a writable store");
        }

        store_.setLocalOrigin(node_id_);

        store_.setWriteCallback([this](SlotIndex index, WriteSource source)
                                { onStoreWrite(index, source); });
        transport_.setMessageCallback([this](const Bytes &message)
                                      { onMessageReceived(message); });

        spdlog::info("Coherency manager initialized: node {}, gossip interval {} ms, signing {}",
                     node_id_, config_.gossip_interval.count(), signer_.isSigned() ? "hmac-sha256" : "disabled");
    }

    CoherencyManager::~CoherencyManager()
    {
        stop();
        transport_.setMessageCallback(nullptr);
        store_.setWriteCallback(nullptr);
    }

    void CoherencyManager::onStoreWrite(SlotIndex index, WriteSource source)
    {
        // Replica writes are applied by onMessageReceived and never re-gossiped
        if (source != WriteSource::Local)
        {
            return;
        }
        requeue(index);
    }

    void CoherencyManager::requeue(SlotIndex index)
    {
        if (!dirty_.mark(index))
        {
            spdlog::error("Could not queue slot {} for gossip on {}", index, node_id_);
        }
    }

    // Outbound path

    RoundResult CoherencyManager::runRound()
    {
        bool expected = false;
        if (!round_in_flight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            bump(counters_.rounds_skipped);
            spdlog::debug("Gossip round skipped on {}: previous round still in flight", node_id_);
            return RoundResult::Skipped;
        }
        InFlightGuard guard{round_in_flight_};

        const auto started = std::chrono::steady_clock::now();

        std::vector<SlotIndex> indices;
        dirty_.drain([&indices](SlotIndex index)
                     { indices.push_back(index); });

        std::uint64_t round;
        VectorClock snapshot;
        {
            std::lock_guard<std::mutex> lock(clock_mutex_);
            round = clock_.increment(node_id_);
            snapshot = clock_;
        }

        refreshPeers();

        // Reach back to the oldest round some peer may be missing
        std::uint64_t baseline = std::min(round - 1, last_complete_round_);
        if (auto slowest = slowestAcknowledgedRound())
        {
            baseline = std::min(baseline, *slowest);
        }
        if (config_.full_sync_interval_rounds > 0 && round % config_.full_sync_interval_rounds == 0)
        {
            baseline = 0;
        }
        if (baseline < round - 1)
        {
            for (SlotIndex index = 0; index < published_round_.size(); ++index)
            {
                if (published_round_[index] > baseline)
                {
                    indices.push_back(index);
                }
            }
            bump(counters_.resync_rounds);
            spdlog::info("Gossip round {} on {} resends values published after round {}", round, node_id_, baseline);
        }

        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

        std::vector<GossipEntry> entries;
        std::vector<SlotIndex> entry_slots;
        entries.reserve(indices.size());
        entry_slots.reserve(indices.size());
        try
        {
            for (SlotIndex index : indices)
            {
                OriginId origin = kLocalOrigin;
                auto entry = store_.getAt(index, &origin);
                // A peer's value may have replaced ours since the write was marked
                if (!entry || origin != kLocalOrigin)
                {
                    continue;
                }
                entries.push_back(GossipEntry{entry->key, entry->price, entry->timestamp, entry->version});
                entry_slots.push_back(index);
            }
        }
        catch (const InvariantViolation &)
        {
            bump(counters_.invariant_violations);
            for (SlotIndex index : indices)
            {
                requeue(index);
            }
            throw;
        }

        for (SlotIndex index : entry_slots)
        {
            published_round_[index] = round;
        }

        bool all_published = true;
        std::size_t messages = 0;
        std::size_t offset = 0;
        do
        {
            const std::size_t end = std::min(entries.size(), offset + config_.max_entries_per_message);

            GossipMessage message;
            message.sender_node_id = node_id_;
            message.vector_clock = snapshot;
            message.baseline = baseline;
            message.entries.assign(entries.begin() + offset, entries.begin() + end);

            if (!publishFrame(message))
            {
                all_published = false;
                // Keep the slots dirty so the next round carries them once the transport recovers
                for (std::size_t i = offset; i < end; ++i)
                {
                    requeue(entry_slots[i]);
                }
            }
            ++messages;
            offset = end;
        } while (offset < entries.size());

        monitor_.record("gossip_round", utils::millisSince(started));

        if (!all_published)
        {
            return RoundResult::PublishFailed;
        }

        last_complete_round_ = round;
        bump(counters_.rounds_published);
        bump(counters_.entries_published, entries.size());
        spdlog::debug("Gossip round {} on {}: {} entries in {} message(s)",
                      round, node_id_, entries.size(), messages);
        return RoundResult::Published;
    }

    bool CoherencyManager::publishFrame(const GossipMessage &message)
    {
        Bytes payload = GossipCodec::encodePayload(message);
        const Signature signature = signer_.sign(payload);
        const Bytes frame = GossipCodec::seal(std::move(payload), signature);

        try
        {
            if (transport_.publish(frame))
            {
                return true;
            }
            spdlog::error("Gossip publish failed on {}: transport refused {} byte frame", node_id_, frame.size());
        }
        catch (const std::exception &e)
        {
            spdlog::error("Gossip publish failed on {}: {}", node_id_, e.what());
        }
        bump(counters_.publish_failures);
        return false;
    }

    // Inbound path

    void CoherencyManager::onMessageReceived(const Bytes &message)
    {
        const auto started = std::chrono::steady_clock::now();

        SignedView view;
        try
        {
            view = GossipCodec::splitSignature(message);
        }
        catch (const DecodeError &e)
        {
            bump(counters_.decode_rejected);
            spdlog::warn("Dropped malformed gossip frame on {}: {}", node_id_, e.what());
            return;
        }

        // Authenticate the raw bytes before trusting any decoded field
        try
        {
            signer_.require(view.payload, view.payload_size, view.signature);
        }
        catch (const AuthError &e)
        {
            bump(counters_.auth_rejected);
            spdlog::warn("Dropped gossip frame on {} ({} bytes): {}", node_id_, message.size(), e.what());
            return;
        }

        GossipMessage decoded;
        try
        {
            decoded = GossipCodec::decode(message);
        }
        catch (const DecodeError &e)
        {
            bump(counters_.decode_rejected);
            spdlog::warn("Dropped malformed gossip frame on {}: {}", node_id_, e.what());
            return;
        }

        const std::string &sender = decoded.sender_node_id;
        if (sender == node_id_)
        {
            spdlog::debug("Ignoring gossip frame carrying our own node id {}", node_id_);
            return;
        }

        OriginId origin;
        try
        {
            origin = store_.internOrigin(sender);
        }
        catch (const CapacityExceeded &e)
        {
            bump(counters_.peers_rejected);
            spdlog::warn("Dropped gossip from unknown node {} on {}: {}", sender, node_id_, e.what());
            return;
        }

        touchPeer(sender, decoded.vector_clock.get(node_id_));

        ClockOrdering ordering;
        std::uint64_t known;
        bool gap;
        {
            std::lock_guard<std::mutex> lock(clock_mutex_);
            known = clock_.get(sender);
            ordering = decoded.vector_clock.compare(clock_);
            // The sender's component only moves once we hold every round it covers
            gap = decoded.baseline > known;
            clock_ = clock_.merge(gap ? decoded.vector_clock.without(sender) : decoded.vector_clock);
        }
        if (gap)
        {
            bump(counters_.gaps_detected);
            spdlog::warn("Missed gossip from {} on {}: holding its clock at {} until it resends rounds after that",
                         sender, node_id_, known);
        }

        for (const auto &entry : decoded.entries)
        {
            try
            {
                applyEntry(entry, sender, origin);
            }
            catch (const InvariantViolation &e)
            {
                bump(counters_.invariant_violations);
                spdlog::error("Invariant violation applying {} from {} on {}: {}",
                              entry.key, sender, node_id_, e.what());
                reportFault(e.what());
            }
        }

        bump(counters_.messages_accepted);
        monitor_.record("inbound_message", utils::millisSince(started));
        spdlog::debug("Applied gossip from {} on {}: {} entries, remote clock {} local",
                      sender, node_id_, decoded.entries.size(), toString(ordering));
    }

    void CoherencyManager::applyEntry(const GossipEntry &entry, const std::string &sender, OriginId origin)
    {
        const WriteStatus status = store_.set(entry.key, entry.price, entry.timestamp, WriteSource::Replica, origin);
        switch (status)
        {
        case WriteStatus::Accepted:
            bump(counters_.entries_applied);
            break;
        case WriteStatus::StaleTimestamp:
            bump(counters_.entries_stale);
            break;
        case WriteStatus::ConflictLost:
            bump(counters_.conflicts_resolved);
            spdlog::debug("Concurrent update for {} at ts {}: value from {} lost the tiebreak",
                          entry.key, entry.timestamp, sender);
            break;
        default:
            bump(counters_.entries_rejected);
            spdlog::warn("Rejected gossip entry {} from {} on {}: {}", entry.key, sender, node_id_, toString(status));
            break;
        }
    }

    void CoherencyManager::setFaultHandler(FaultHandler handler)
    {
        fault_handler_ = std::move(handler);
    }

    void CoherencyManager::reportFault(const std::string &what)
    {
        if (!fault_handler_)
        {
            return;
        }
        try
        {
            fault_handler_(what);
        }
        catch (const std::exception &e)
        {
            spdlog::error("Fault handler on {} threw: {}", node_id_, e.what());
        }
    }

    // Node and peer bookkeeping

    PeerStatus CoherencyManager::statusFor(std::chrono::steady_clock::duration age) const
    {
        if (age > config_.failure_timeout)
            return PeerStatus::Dead;
        if (age > config_.suspicion_timeout)
            return PeerStatus::Suspected;
        return PeerStatus::Alive;
    }

    void CoherencyManager::touchPeer(const std::string &node_id, std::uint64_t acknowledged_round)
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto [it, inserted] = peers_.try_emplace(node_id);
        PeerInfo &peer = it->second;
        if (inserted)
        {
            peer.node_id = node_id;
            spdlog::info("New peer discovered by {}: {}", node_id_, node_id);
        }
        else if (peer.status != PeerStatus::Alive)
        {
            spdlog::info("Peer {} is alive again", node_id);
        }
        peer.last_seen = std::chrono::steady_clock::now();
        peer.status = PeerStatus::Alive;
        peer.acknowledged_round = acknowledged_round;
        ++peer.messages;
    }

    void CoherencyManager::refreshPeers()
    {
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(peers_mutex_);
        for (auto it = peers_.begin(); it != peers_.end();)
        {
            PeerInfo &peer = it->second;
            const auto age = now - peer.last_seen;
            if (age > config_.failure_timeout + config_.dead_peer_retention)
            {
                spdlog::info("Removed dead peer {} from tracking", peer.node_id);
                it = peers_.erase(it);
                continue;
            }

            const PeerStatus status = statusFor(age);
            if (status != peer.status)
            {
                if (status == PeerStatus::Dead)
                    spdlog::warn("Peer {} marked as dead", peer.node_id);
                else if (status == PeerStatus::Suspected)
                    spdlog::info("Peer {} suspected", peer.node_id);
                peer.status = status;
            }
            ++it;
        }
    }

    std::optional<std::uint64_t> CoherencyManager::slowestAcknowledgedRound() const
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        std::optional<std::uint64_t> slowest;
        for (const auto &[node_id, peer] : peers_)
        {
            if (peer.status == PeerStatus::Dead)
            {
                continue;
            }
            if (!slowest || peer.acknowledged_round < *slowest)
            {
                slowest = peer.acknowledged_round;
            }
        }
        return slowest;
    }

    std::vector<PeerInfo> CoherencyManager::peers() const
    {
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(peers_mutex_);
        std::vector<PeerInfo> result;
        result.reserve(peers_.size());
        for (const auto &[node_id, peer] : peers_)
        {
            PeerInfo copy = peer;
            copy.status = statusFor(now - peer.last_seen);
            result.push_back(copy);
        }
        return result;
    }

    // Timer

    void CoherencyManager::start()
    {
        if (running_.exchange(true))
        {
            return;
        }

        io_.restart();
        scheduleNextRound();
        timer_thread_ = std::thread([this]
                                    {
            try
            {
                io_.run();
            }
            catch (const std::exception &e)
            {
                spdlog::error("Gossip timer thread on {} stopped: {}", node_id_, e.what());
            } });

        spdlog::info("Coherency manager {} started", node_id_);
    }

    void CoherencyManager::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }

        boost::asio::post(io_, [this]
                          { timer_.cancel(); });
        if (timer_thread_.joinable())
        {
            timer_thread_.join();
        }
        spdlog::info("Coherency manager {} stopped", node_id_);
    }

    void CoherencyManager::scheduleNextRound()
    {
        if (!running_.load())
        {
            return;
        }

        timer_.expires_after(config_.gossip_interval);
        timer_.async_wait([this](const boost::system::error_code &ec)
                          {
            if (ec == boost::asio::error::operation_aborted || !running_.load())
            {
                return;
            }
            try
            {
                runRound();
            }
            catch (const InvariantViolation &e)
            {
                spdlog::error("Gossip round on {} hit an invariant violation: {}", node_id_, e.what());
                reportFault(e.what());
            }
            catch (const std::exception &e)
            {
                spdlog::error("Gossip round on {} failed: {}", node_id_, e.what());
            }
            scheduleNextRound(); });
    }

    // Reporting

    VectorClock CoherencyManager::clock() const
    {
        std::lock_guard<std::mutex> lock(clock_mutex_);
        return clock_;
    }

    CoherencyStats CoherencyManager::stats() const
    {
        CoherencyStats s;
        s.rounds_published = load(counters_.rounds_published);
        s.rounds_skipped = load(counters_.rounds_skipped);
        s.entries_published = load(counters_.entries_published);
        s.publish_failures = load(counters_.publish_failures);
        s.messages_accepted = load(counters_.messages_accepted);
        s.auth_rejected = load(counters_.auth_rejected);
        s.decode_rejected = load(counters_.decode_rejected);
        s.entries_applied = load(counters_.entries_applied);
        s.entries_stale = load(counters_.entries_stale);
        s.entries_rejected = load(counters_.entries_rejected);
        s.conflicts_resolved = load(counters_.conflicts_resolved);
        s.invariant_violations = load(counters_.invariant_violations);
        s.resync_rounds = load(counters_.resync_rounds);
        s.gaps_detected = load(counters_.gaps_detected);
        s.peers_rejected = load(counters_.peers_rejected);
        return s;
    }

    nlohmann::json CoherencyManager::statusJson() const
    {
        const VectorClock snapshot = clock();
        const CoherencyStats s = stats();
        const MemoryUsage memory = store_.memoryUsage();
        const auto now = std::chrono::steady_clock::now();

        nlohmann::json status;
        status["node_id"] = node_id_;
        status["generated_at"] = utils::getCurrentTimestamp();
        status["running"] = isRunning();

        nlohmann::json clock_json = nlohmann::json::object();
        for (const auto &[node_id, counter] : snapshot.entries())
        {
            clock_json[node_id] = counter;
        }
        status["vector_clock"] = clock_json;

        nlohmann::json peers_json = nlohmann::json::array();
        for (const auto &peer : peers())
        {
            peers_json.push_back({{"node_id", peer.node_id},
                                  {"status", toString(peer.status)},
                                  {"last_seen_ms_ago", std::chrono::duration_cast<std::chrono::milliseconds>(now - peer.last_seen).count()},
                                  {"messages", peer.messages},
                                  {"acknowledged_round", peer.acknowledged_round}});
        }
        status["peers"] = peers_json;

        status["stats"] = {{"rounds_published", s.rounds_published},
                           {"rounds_skipped", s.rounds_skipped},
                           {"entries_published", s.entries_published},
                           {"publish_failures", s.publish_failures},
                           {"messages_accepted", s.messages_accepted},
                           {"auth_rejected", s.auth_rejected},
                           {"decode_rejected", s.decode_rejected},
                           {"entries_applied", s.entries_applied},
                           {"entries_stale", s.entries_stale},
                           {"entries_rejected", s.entries_rejected},
                           {"conflicts_resolved", s.conflicts_resolved},
                           {"invariant_violations", s.invariant_violations},
                           {"resync_rounds", s.resync_rounds},
                           {"gaps_detected", s.gaps_detected},
                           {"peers_rejected", s.peers_rejected}};

        nlohmann::json latency_json = nlohmann::json::object();
        for (const auto &operation : monitor_.operations())
        {
            const auto summary = monitor_.getStats(operation);
            latency_json[operation] = {{"min_ms", summary.min},
                                       {"max_ms", summary.max},
                                       {"avg_ms", summary.avg},
                                       {"p95_ms", summary.p95},
                                       {"samples", summary.sample_count}};
        }
        status["latency"] = latency_json;

        status["store"] = {{"used_slots", memory.used_slots},
                           {"total_slots", memory.total_slots},
                           {"utilization_percent", memory.utilization_percent}};
        return status;
    }

    std::string CoherencyManager::prometheusMetrics() const
    {
        const CoherencyStats s = stats();
        std::stringstream ss;
        auto counter = [&ss, this](const char *name, const char *help, std::uint64_t value)
        {
            ss << "# HELP " << name << ' ' << help << '\n'
               << "# TYPE " << name << " counter\n"
               << name << "{node=\"" << node_id_ << "\"} " << value << '\n';
        };

        counter("gossip_rounds_published", "Outbound rounds fully published", s.rounds_published);
        counter("gossip_rounds_skipped", "Rounds skipped because one was in flight", s.rounds_skipped);
        counter("gossip_entries_published", "Entries sent to peers", s.entries_published);
        counter("gossip_publish_failures", "Frames the transport refused", s.publish_failures);
        counter("gossip_messages_accepted", "Inbound messages verified and applied", s.messages_accepted);
        counter("gossip_auth_rejected", "Inbound messages failing signature verification", s.auth_rejected);
        counter("gossip_decode_rejected", "Inbound messages failing to decode", s.decode_rejected);
        counter("gossip_entries_applied", "Remote entries written to the store", s.entries_applied);
        counter("gossip_entries_stale", "Remote entries older than or equal to local data", s.entries_stale);
        counter("gossip_conflicts_resolved", "Concurrent same-timestamp updates resolved by node id", s.conflicts_resolved);
        counter("gossip_invariant_violations", "Internal faults while handling gossip", s.invariant_violations);
        counter("gossip_resync_rounds", "Rounds that resent values a peer may have missed", s.resync_rounds);
        counter("gossip_gaps_detected", "Inbound frames showing a missed round from their sender", s.gaps_detected);
        counter("gossip_peers_rejected", "Inbound frames dropped because the origin registry is full", s.peers_rejected);
        return ss.str();
    }

} // namespace pricemesh
