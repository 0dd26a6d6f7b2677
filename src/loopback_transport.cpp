#include "gossip_transport.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

namespace pricemesh
{

    void LoopbackBus::attach(LoopbackTransport *endpoint)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        endpoints_.push_back(endpoint);
    }

    void LoopbackBus::detach(LoopbackTransport *endpoint)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        endpoints_.erase(std::remove(endpoints_.begin(), endpoints_.end(), endpoint), endpoints_.end());
    }

    std::size_t LoopbackBus::endpointCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return endpoints_.size();
    }

    std::size_t LoopbackBus::broadcast(const LoopbackTransport *from, const Bytes &message)
    {
        std::vector<LoopbackTransport *> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            targets = endpoints_;
        }

        // Deliver outside the lock so a receiver may publish in turn
        std::size_t delivered = 0;
        for (auto *endpoint : targets)
        {
            if (endpoint == from || !endpoint->isConnected())
            {
                continue;
            }
            endpoint->deliver(message);
            ++delivered;
        }
        return delivered;
    }

    LoopbackTransport::LoopbackTransport(LoopbackBus &bus, std::string name)
        : bus_(bus), name_(std::move(name))
    {
        bus_.attach(this);
    }

    LoopbackTransport::~LoopbackTransport()
    {
        bus_.detach(this);
    }

    bool LoopbackTransport::publish(const Bytes &message)
    {
        if (!connected_.load())
        {
            spdlog::debug("Loopback endpoint {} is disconnected; dropping {} byte frame", name_, message.size());
            return false;
        }
        bus_.broadcast(this, message);
        return true;
    }

    void LoopbackTransport::setMessageCallback(MessageCallback callback)
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        message_callback_ = std::move(callback);
    }

    void LoopbackTransport::setConnected(bool connected)
    {
        connected_.store(connected);
        spdlog::info("Loopback endpoint {} {}", name_, connected ? "connected" : "disconnected");
    }

    void LoopbackTransport::deliver(const Bytes &message)
    {
        MessageCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = message_callback_;
        }
        if (callback)
        {
            callback(message);
        }
    }

} // namespace pricemesh
