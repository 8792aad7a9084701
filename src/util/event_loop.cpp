#include <utility>

#include "util/event_loop.hpp"
#include "util/log.hpp"

namespace util
{

EventLoop::~EventLoop()
{
    stop();
}

void EventLoop::post(Task t)
{
    if (!t)
        return;
    {
        std::lock_guard<std::mutex> lk(mu_);
        tasks_.push_back(std::move(t));
    }
    cv_.notify_one();
}

std::size_t EventLoop::poll()
{
    std::size_t ran = 0;
    while (run_one())
        ran++;
    return ran;
}

bool EventLoop::run_one()
{
    Task t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (tasks_.empty())
            return false;
        t = std::move(tasks_.front());
        tasks_.pop_front();
    }
    // never run a task while holding mu_, tasks post follow-ups
    t();
    return true;
}

std::size_t EventLoop::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return tasks_.size();
}

bool EventLoop::start()
{
    if (running_.exchange(true, std::memory_order_relaxed))
        return true;
    thr_ = std::thread([this] { run(); });
    LOG_DEBUG("event loop started");
    return true;
}

void EventLoop::stop()
{
    if (!running_.exchange(false, std::memory_order_relaxed))
        return;
    cv_.notify_all();
    // join outside of mu_
    if (thr_.joinable())
        thr_.join();
    LOG_DEBUG("event loop stopped (%zu task(s) dropped)", pending());
}

void EventLoop::run()
{
    while (running_.load(std::memory_order_relaxed))
    {
        Task t;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] {
                return !tasks_.empty() || !running_.load(std::memory_order_relaxed);
            });
            if (!running_.load(std::memory_order_relaxed))
                break;
            t = std::move(tasks_.front());
            tasks_.pop_front();
        }
        t();
    }
}

}  // namespace util
