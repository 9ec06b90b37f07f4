#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <span>

namespace ymodem {

// Bidirectional byte channel borrowed by a transfer.
//
// Contract:
//  - write() blocks until every byte has been handed to the channel and
//    throws (std::runtime_error or std::system_error) if it cannot.
//  - Incoming bytes are pushed to subscribers in chunks of arbitrary size,
//    typically from a reader thread owned by the transport. A chunk never
//    aligns with packet or control-byte boundaries by contract.
//  - unsubscribe() returns only once the handler is no longer running, so
//    the subscriber may be destroyed right after.
class ITransport {
public:
    using ChunkHandler = std::function<void(std::span<const uint8_t>)>;
    using SubscriptionId = std::size_t;

    virtual ~ITransport() = default;

    virtual void write(std::span<const uint8_t> data) = 0;
    virtual SubscriptionId subscribe(ChunkHandler handler) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
    // Short identifier for logs.
    virtual const char* name() const = 0;
};

// Subscriber bookkeeping shared by concrete transports. Handlers run under
// the dispatcher lock, which gives unsubscribe() its "not running" guarantee;
// a handler must not call back into subscribe()/unsubscribe().
class ChunkDispatcher {
public:
    ITransport::SubscriptionId add(ITransport::ChunkHandler handler);
    void remove(ITransport::SubscriptionId id);
    void dispatch(std::span<const uint8_t> chunk);
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    ITransport::SubscriptionId next_id_ = 1;
    std::map<ITransport::SubscriptionId, ITransport::ChunkHandler> handlers_;
};

// Holds a subscription for the lifetime of the guard.
class ScopedSubscription {
public:
    ScopedSubscription(ITransport& transport, ITransport::ChunkHandler handler);
    ~ScopedSubscription();

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

private:
    ITransport& transport_;
    ITransport::SubscriptionId id_;
};

} // namespace ymodem
