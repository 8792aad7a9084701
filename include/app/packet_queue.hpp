#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "proto/framing.hpp"

namespace app
{

// FIFO of framed packets plus the number of logical write sets waiting for completion.
// One mutex guards both, every call is safe from any thread.
class PacketQueue
{
  public:
    void                         enqueue(proto::Packet p);
    std::optional<proto::Packet> dequeue();

    bool        is_empty() const;
    std::size_t count() const;

    void        increment_pending_sets();
    void        decrement_pending_sets();  // never goes below zero
    std::size_t pending_sets() const;

    // Drops every packet and zeroes the counter. Returns the number of packets dropped.
    std::size_t clear();

  private:
    mutable std::mutex        mu_;
    std::deque<proto::Packet> packets_;
    std::size_t               pending_sets_ = 0;
};

}  // namespace app
