#include "toolhost/sequencer.hpp"

namespace toolhost {

ResponseSequencer::ResponseSequencer(Sink sink) : sink_(std::move(sink)) {}

uint64_t ResponseSequencer::reserve() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_ticket_++;
}

void ResponseSequencer::complete(uint64_t ticket, std::optional<JsonRpcMessage> message) {
    // Sink runs under the lock so that two completions cannot interleave.
    std::lock_guard<std::mutex> lock(mutex_);
    ready_.emplace(ticket, std::move(message));
    auto it = ready_.begin();
    while (it != ready_.end() && it->first == next_emit_) {
        if (it->second && sink_) sink_(*it->second);
        it = ready_.erase(it);
        ++next_emit_;
    }
}

size_t ResponseSequencer::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size();
}

} // namespace toolhost
