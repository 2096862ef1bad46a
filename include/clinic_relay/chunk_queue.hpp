#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace clinic_relay {

/// Bounded hand-off of audio chunks from the connection thread to an engine thread.
/// push() never blocks: when full, the oldest chunk is dropped.
class ChunkQueue {
public:
    explicit ChunkQueue(std::size_t capacity = 512);

    /// false once the queue is closed or cancelled.
    bool push(std::string chunk);

    /// Blocks until a chunk is available. nullopt after close() has drained
    /// the queue, or immediately after cancel().
    std::optional<std::string> pop();

    /// Stop accepting chunks; pending ones are still delivered.
    void close();

    /// Stop accepting chunks and discard pending ones.
    void cancel();

    std::size_t dropped() const;
    std::size_t size() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    bool closed_ = false;
    std::size_t dropped_ = 0;
};

} // namespace clinic_relay
