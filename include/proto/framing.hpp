#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/*
TX (host):
session.write_bytecode(payload)
  -> make_packets(payload)            // [count][payload...] sliced into <=20B packets
     -> PacketQueue.enqueue(packet)   // one per packet, same order
        -> ChunkedWriter drain        // one transport write in flight at a time

RX (device side, emulated by the loopback peripheral):
UART RX write(packet)
  -> Deframer.feed(packet)
      -> first packet: count byte (0 == reset signal)
      -> after `count` packets: complete payload
*/

namespace proto
{

using Packet = std::vector<std::uint8_t>;

// --- Protocol constants ---
inline constexpr std::size_t  PACKET_SIZE  = 20;   // per-write payload ceiling of the link
inline constexpr std::size_t  MAX_PACKETS  = 255;  // count header is a single byte
inline constexpr std::uint8_t RESET_SIGNAL = 0x00;

// Number of packets needed for a payload of `len` bytes (the count byte included)
inline std::size_t packet_count(std::size_t len)
{
    if (len == 0)
        return 1;
    return (len + 1 + PACKET_SIZE - 1) / PACKET_SIZE;
}

// Largest payload that still fits the single-byte count header
inline constexpr std::size_t MAX_PAYLOAD = MAX_PACKETS * PACKET_SIZE - 1;

// TX: empty payload -> {[0x00]}, oversized payload -> {} (logged)
std::vector<Packet> make_packets(const std::vector<std::uint8_t> &payload);

// RX: rebuilds payloads from a packet stream
class Deframer
{
  public:
    enum class Event
    {
        None,      // need more packets
        Payload,   // payload() holds a complete message
        Reset,     // [0x00] received
        Malformed  // state dropped
    };

    Event                            feed(const Packet &p);
    const std::vector<std::uint8_t> &payload() const { return out_; }
    void                             clear();

  private:
    std::size_t               expected_ = 0;  // 0 == waiting for a first packet
    std::size_t               received_ = 0;
    std::vector<std::uint8_t> buf_;
    std::vector<std::uint8_t> out_;
};

}  // namespace proto
