#include "clinic_relay/session_bridge.hpp"

#include <crow/logging.h>

namespace clinic_relay {

std::string system_message(const std::string& message) {
    return nlohmann::json{{"type", "system"}, {"message", message}}.dump();
}

SessionBridge::SessionBridge(SessionSeed seed, EngineFactory factory,
                             std::shared_ptr<Outbound> outbound)
    : seed_(std::move(seed)), factory_(std::move(factory)), outbound_(std::move(outbound)) {}

SessionBridge::~SessionBridge() {
    stop();
}

void SessionBridge::start(const std::string& greeting) {
    if (started_.exchange(true)) return;

    engine_ = factory_(seed_, [this](nlohmann::json event) { deliver(std::move(event)); });
    if (!engine_) {
        throw EngineError("Engine factory returned no engine for " + seed_.patient_id);
    }
    if (!greeting.empty()) deliver_frame(greeting);
    worker_ = std::thread(&SessionBridge::run_engine, this);
    CROW_LOG_INFO << "[bridge] engine thread started for " << seed_.patient_id;
}

void SessionBridge::run_engine() {
    try {
        engine_->run();
    } catch (const std::exception& e) {
        failed_ = true;
        CROW_LOG_ERROR << "[bridge] engine for " << seed_.patient_id << " failed: " << e.what();
        deliver(nlohmann::json{{"type", "system"},
                               {"message", std::string("Recognition engine stopped: ") + e.what()}});
    }
    exited_ = true;
    CROW_LOG_INFO << "[bridge] engine thread exited for " << seed_.patient_id;
}

bool SessionBridge::feed(std::string chunk) {
    if (stopped_.load() || !engine_ || !engine_->live()) return false;
    return engine_->feed(std::move(chunk));
}

void SessionBridge::finish() {
    if (stopped_.load() || !engine_) return;
    CROW_LOG_INFO << "[bridge] finishing session for " << seed_.patient_id;
    engine_->finish();
}

void SessionBridge::stop() {
    if (stopped_.exchange(true)) return;
    if (!engine_) return;

    engine_->stop();
    if (worker_.joinable()) worker_.join();
    engine_.reset();
    CROW_LOG_INFO << "[bridge] engine released for " << seed_.patient_id;
}

bool SessionBridge::live() const {
    return !stopped_.load() && engine_ && !exited_.load() && engine_->live();
}

void SessionBridge::deliver(nlohmann::json event) {
    deliver_frame(event.dump());
}

void SessionBridge::deliver_frame(std::string frame) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_.push_back(std::move(frame));
    }

    // One drainer at a time keeps frames in the order they were queued.
    std::lock_guard<std::mutex> order(delivery_mutex_);
    for (;;) {
        std::string next;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (pending_.empty()) break;
            next = std::move(pending_.front());
            pending_.pop_front();
        }
        try {
            outbound_->send_text(next);
        } catch (const std::exception& e) {
            CROW_LOG_WARNING << "[bridge] dropped event for " << seed_.patient_id << ": " << e.what();
        }
    }
}

} // namespace clinic_relay
