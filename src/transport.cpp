#include "ymodem/transport.hpp"

#include <utility>

namespace ymodem {

ITransport::SubscriptionId ChunkDispatcher::add(ITransport::ChunkHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void ChunkDispatcher::remove(ITransport::SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

void ChunkDispatcher::dispatch(std::span<const uint8_t> chunk) {
    if (chunk.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : handlers_) {
        entry.second(chunk);
    }
}

std::size_t ChunkDispatcher::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

ScopedSubscription::ScopedSubscription(ITransport& transport, ITransport::ChunkHandler handler)
    : transport_(transport), id_(transport.subscribe(std::move(handler))) {}

ScopedSubscription::~ScopedSubscription() {
    transport_.unsubscribe(id_);
}

} // namespace ymodem
