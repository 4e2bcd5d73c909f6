#include "avrdeck/core/ControlSequencer.h"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace avrdeck::core {

ControlSequencer::ControlSequencer(boost::asio::io_context& ioContext)
    : ioContext_(ioContext) {}

void ControlSequencer::enqueue(const std::string& key, Task task) {
    auto& queue = queues_[key];
    queue.push_back(std::move(task));
    if (queue.size() == 1) {
        runFront(key);
    }
}

std::size_t ControlSequencer::pending(const std::string& key) const {
    auto it = queues_.find(key);
    return it == queues_.end() ? 0 : it->second.size();
}

void ControlSequencer::runFront(const std::string& key) {
    auto it = queues_.find(key);
    if (it == queues_.end() || it->second.empty()) {
        return;
    }

    auto fired = std::make_shared<bool>(false);
    Done done = [this, key, fired] {
        if (*fired) {
            spdlog::warn("Sequenced task for {} completed twice", key);
            return;
        }
        *fired = true;
        // Deferred so a task finishing synchronously does not recurse into the next one.
        boost::asio::post(ioContext_, [this, key] { finish(key); });
    };

    // Copy: the task may enqueue further work under the same key.
    Task task = it->second.front();
    try {
        task(std::move(done));
    } catch (const std::exception& ex) {
        spdlog::error("Sequenced task for {} failed: {}", key, ex.what());
        if (!*fired) {
            *fired = true;
            boost::asio::post(ioContext_, [this, key] { finish(key); });
        }
    }
}

void ControlSequencer::finish(const std::string& key) {
    auto it = queues_.find(key);
    if (it == queues_.end()) {
        return;
    }
    it->second.pop_front();
    if (it->second.empty()) {
        queues_.erase(it);
        return;
    }
    runFront(key);
}

}  // namespace avrdeck::core
