#include <algorithm>
#include <cstdint>

#include "proto/framing.hpp"
#include "util/log.hpp"

namespace proto
{

std::vector<Packet> make_packets(const std::vector<std::uint8_t> &payload)
{
    std::vector<Packet> out;
    if (payload.empty())
    {
        out.push_back(Packet{RESET_SIGNAL});
        return out;
    }

    const std::size_t num_packets = packet_count(payload.size());
    if (num_packets > MAX_PACKETS)
    {
        LOG_ERROR("make_packets: payload too large (%zu bytes, needs %zu packets, max %zu)",
                  payload.size(), num_packets, MAX_PACKETS);
        return {};
    }

    // [count][payload...]
    std::vector<std::uint8_t> framed;
    framed.reserve(payload.size() + 1);
    framed.push_back(static_cast<std::uint8_t>(num_packets));
    framed.insert(framed.end(), payload.begin(), payload.end());

    out.reserve(num_packets);
    for (std::size_t i = 0; i < num_packets; i++)
    {
        std::size_t start = i * PACKET_SIZE;
        std::size_t take  = std::min(PACKET_SIZE, framed.size() - start);
        out.emplace_back(framed.begin() + start, framed.begin() + start + take);
    }
    return out;
}

void Deframer::clear()
{
    expected_ = 0;
    received_ = 0;
    buf_.clear();
}

Deframer::Event Deframer::feed(const Packet &p)
{
    if (p.empty() || p.size() > PACKET_SIZE)
    {
        LOG_WARN("Deframer::feed: bad packet size (%zu)", p.size());
        clear();
        return Event::Malformed;
    }

    if (expected_ == 0)
    {
        // first packet of a message
        if (p[0] == RESET_SIGNAL)
        {
            if (p.size() != 1)
            {
                LOG_WARN("Deframer::feed: reset signal with trailing bytes (%zu)", p.size());
                return Event::Malformed;
            }
            out_.clear();
            return Event::Reset;
        }
        expected_ = p[0];
        buf_.assign(p.begin() + 1, p.end());
    }
    else
    {
        buf_.insert(buf_.end(), p.begin(), p.end());
    }
    received_++;

    if (received_ < expected_)
    {
        if (p.size() != PACKET_SIZE)
        {
            // only the last packet may be short
            LOG_WARN("Deframer::feed: short packet %zu/%zu (len=%zu)", received_, expected_,
                     p.size());
            clear();
            return Event::Malformed;
        }
        return Event::None;
    }

    out_.swap(buf_);
    clear();
    return Event::Payload;
}

}  // namespace proto
