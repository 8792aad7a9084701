#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace util
{

// Single-consumer task loop. Every app-layer reaction to a transport callback is posted
// here, so writer/session state is only ever touched from the loop's thread.
//
// Either start() a dedicated thread, or call poll() from the owning thread (tests).
class EventLoop
{
  public:
    using Task = std::function<void()>;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop &)            = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    void post(Task t);

    // Runs queued tasks (including ones posted while running) until the queue is empty.
    // Returns the number of tasks run.
    std::size_t poll();
    // Runs at most one queued task, false when there was none
    bool run_one();

    bool start();
    void stop();
    bool running() const noexcept { return running_.load(std::memory_order_relaxed); }
    std::size_t pending() const;

  private:
    void run();

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Task>        tasks_;
    std::thread             thr_;
    std::atomic_bool        running_{false};
};

}  // namespace util
