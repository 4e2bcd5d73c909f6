#pragma once

#include <boost/asio/io_context.hpp>

#include <deque>
#include <functional>
#include <string>
#include <unordered_map>

namespace avrdeck::core {

/**
 * @brief Serializes asynchronous tasks per key.
 *
 * A task receives a Done callback and the next task for the same key only starts
 * after Done has been invoked. Tasks queued under different keys never wait on
 * each other. Single-threaded: call from the thread running the io_context.
 */
class ControlSequencer {
public:
    using Done = std::function<void()>;
    using Task = std::function<void(Done)>;

    explicit ControlSequencer(boost::asio::io_context& ioContext);

    ControlSequencer(const ControlSequencer&) = delete;
    ControlSequencer& operator=(const ControlSequencer&) = delete;

    void enqueue(const std::string& key, Task task);

    /// Tasks queued for @p key, including the one running.
    std::size_t pending(const std::string& key) const;
    bool idle() const noexcept { return queues_.empty(); }

private:
    void runFront(const std::string& key);
    void finish(const std::string& key);

    boost::asio::io_context& ioContext_;
    std::unordered_map<std::string, std::deque<Task>> queues_;
};

}  // namespace avrdeck::core
