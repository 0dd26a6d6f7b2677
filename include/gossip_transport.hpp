#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "wire_buffer.hpp"

namespace pricemesh
{
    // Pub/sub delivery of opaque signed frames between nodes. Delivery, retry
    // and fan-out belong to the adapter; the coherency manager only publishes
    // and reacts to the message callback.
    class GossipTransport
    {
    public:
        using MessageCallback = std::function<void(const Bytes &)>;

        virtual ~GossipTransport() = default;

        // Returns false if the frame could not be handed off.
        virtual bool publish(const Bytes &message) = 0;
        virtual void setMessageCallback(MessageCallback callback) = 0;
    };

    class LoopbackTransport;

    // In-process fan-out: a frame published by one endpoint is delivered
    // synchronously, on the publisher's thread, to every other endpoint.
    class LoopbackBus
    {
    public:
        std::size_t broadcast(const LoopbackTransport *from, const Bytes &message);
        std::size_t endpointCount() const;

    private:
        friend class LoopbackTransport;
        void attach(LoopbackTransport *endpoint);
        void detach(LoopbackTransport *endpoint);

        mutable std::mutex mutex_;
        std::vector<LoopbackTransport *> endpoints_;
    };

    class LoopbackTransport : public GossipTransport
    {
    public:
        LoopbackTransport(LoopbackBus &bus, std::string name);
        ~LoopbackTransport() override;

        bool publish(const Bytes &message) override;
        void setMessageCallback(MessageCallback callback) override;

        // A disconnected endpoint neither sends nor receives.
        void setConnected(bool connected);
        bool isConnected() const { return connected_.load(); }
        const std::string &name() const { return name_; }

    private:
        friend class LoopbackBus;
        void deliver(const Bytes &message);

        LoopbackBus &bus_;
        std::string name_;
        std::atomic<bool> connected_{true};
        std::mutex callback_mutex_;
        MessageCallback message_callback_;
    };

} // namespace pricemesh
