#include "clinic_relay/chunk_queue.hpp"

namespace clinic_relay {

ChunkQueue::ChunkQueue(std::size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

bool ChunkQueue::push(std::string chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        if (chunks_.size() >= capacity_) {
            chunks_.pop_front();
            ++dropped_;
        }
        chunks_.push_back(std::move(chunk));
    }
    cv_.notify_one();
    return true;
}

std::optional<std::string> ChunkQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !chunks_.empty(); });
    if (chunks_.empty()) return std::nullopt;
    std::string chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return chunk;
}

void ChunkQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void ChunkQueue::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        chunks_.clear();
    }
    cv_.notify_all();
}

std::size_t ChunkQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::size_t ChunkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

} // namespace clinic_relay
