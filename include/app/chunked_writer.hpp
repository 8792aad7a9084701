#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "app/errors.hpp"
#include "app/packet_queue.hpp"
#include "transport/itransport.hpp"
#include "util/event_loop.hpp"

namespace app
{

// Frames payloads into the packet queue and drains it through one characteristic, one
// transport operation in flight at a time. Each write() is a "set" that completes exactly
// once, in submission order, on the event loop.
//
// Single writes and reads on other characteristics (write_direct(), read()) share the
// same in-flight slot. They are started, in order, at the next gap between chunks.
//
// write(), write_direct() and read() may be called from any thread. abort() and every
// completion run on the loop.
class ChunkedWriter : public std::enable_shared_from_this<ChunkedWriter>
{
  public:
    ChunkedWriter(std::shared_ptr<transport::IPeripheral> peripheral,
                  transport::GattRef                      target,
                  util::EventLoop                        &loop);

    ChunkedWriter(const ChunkedWriter &)            = delete;
    ChunkedWriter &operator=(const ChunkedWriter &) = delete;

    // transport failures arrive as TransportWrite / TransportRead
    using OpCallback =
        std::function<void(const std::optional<Error> &, const transport::Bytes &)>;

    void write(const std::vector<std::uint8_t> &payload, WriteCallback done);
    void write_direct(const transport::GattRef &ref, transport::Bytes value, OpCallback done);
    void read(const transport::GattRef &ref, OpCallback done);

    // Fails every pending set and operation with `err`, clears the queue and ignores the
    // completion of whatever is still in flight.
    void abort(const Error &err);

    bool               busy() const;
    const PacketQueue &queue() const { return queue_; }

  private:
    struct Set
    {
        std::uint64_t id;
        std::size_t   total;  // packets
        std::size_t   sent;
        WriteCallback done;
    };

    struct Op
    {
        transport::GattRef ref;
        transport::Bytes   value;
        bool               is_read;
        OpCallback         done;
    };

    void enqueue_op(Op op);
    void post_kick();
    void kick();
    void step();
    void start_op(const Op &op);
    void on_chunk_done(std::uint64_t gen, const transport::Status &st);
    void on_op_done(std::uint64_t gen, const transport::Status &st, const transport::Bytes &value);

    std::shared_ptr<transport::IPeripheral> peripheral_;
    transport::GattRef                      target_;
    util::EventLoop                        &loop_;
    PacketQueue                             queue_;

    // Guards sets_ together with the enqueue of a set's packets, and the operations
    mutable std::mutex mu_;
    std::deque<Set>    sets_;
    std::deque<Op>     ops_;
    std::optional<Op>  current_op_;
    std::uint64_t      next_id_ = 1;

    // Loop thread only
    bool          draining_ = false;
    std::uint64_t gen_      = 0;  // bumped on abort/failure, stale completions are dropped
    std::uint64_t inflight_ = 0;  // set id owning the chunk in flight
};

}  // namespace app
