#include <utility>

#include "app/packet_queue.hpp"
#include "util/log.hpp"

namespace app
{

void PacketQueue::enqueue(proto::Packet p)
{
    std::lock_guard<std::mutex> lk(mu_);
    packets_.push_back(std::move(p));
}

std::optional<proto::Packet> PacketQueue::dequeue()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (packets_.empty())
        return std::nullopt;
    proto::Packet p = std::move(packets_.front());
    packets_.pop_front();
    return p;
}

bool PacketQueue::is_empty() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return packets_.empty();
}

std::size_t PacketQueue::count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return packets_.size();
}

void PacketQueue::increment_pending_sets()
{
    std::lock_guard<std::mutex> lk(mu_);
    pending_sets_++;
}

void PacketQueue::decrement_pending_sets()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (pending_sets_ == 0)
    {
        LOG_WARN("[WRITER] pending set counter already zero");
        return;
    }
    pending_sets_--;
}

std::size_t PacketQueue::pending_sets() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_sets_;
}

std::size_t PacketQueue::clear()
{
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t dropped = packets_.size();
    packets_.clear();
    pending_sets_ = 0;
    return dropped;
}

}  // namespace app
