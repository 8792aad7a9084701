#include <utility>

#include "app/chunked_writer.hpp"
#include "crypto/codec.hpp"
#include "proto/framing.hpp"
#include "util/log.hpp"

namespace app
{

ChunkedWriter::ChunkedWriter(std::shared_ptr<transport::IPeripheral> peripheral,
                             transport::GattRef                      target,
                             util::EventLoop                        &loop)
    : peripheral_(std::move(peripheral)), target_(std::move(target)), loop_(loop)
{
}

// ======================================================================
// Function: ChunkedWriter::write
// - In: payload (any length, empty == reset signal), completion
// - Out: completion is posted to the loop exactly once
// - Note: framing, enqueue and set registration happen under one lock,
//         so a drain never observes half of a set.
// ======================================================================
void ChunkedWriter::write(const std::vector<std::uint8_t> &payload, WriteCallback done)
{
    std::vector<proto::Packet> packets = proto::make_packets(payload);
    if (packets.empty())
    {
        LOG_ERROR("[WRITER] payload of %zu bytes exceeds %zu bytes", payload.size(),
                  proto::MAX_PAYLOAD);
        Error err{Errc::InvalidArgument, "payload too large (" + std::to_string(payload.size()) +
                                             " bytes, max " +
                                             std::to_string(proto::MAX_PAYLOAD) + ")"};
        loop_.post([done = std::move(done), err] {
            if (done)
                done(err);
        });
        return;
    }

    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        id = next_id_++;
        const std::size_t n = packets.size();
        for (auto &p : packets)
            queue_.enqueue(std::move(p));
        queue_.increment_pending_sets();
        sets_.push_back(Set{id, n, 0, std::move(done)});
        LOG_DEBUG("[WRITER] set #%llu queued: %zu byte(s) in %zu packet(s), %zu set(s) pending",
                  (unsigned long long)id, payload.size(), n, queue_.pending_sets());
    }

    post_kick();
}

void ChunkedWriter::write_direct(const transport::GattRef &ref, transport::Bytes value,
                                 OpCallback done)
{
    enqueue_op(Op{ref, std::move(value), false, std::move(done)});
}

void ChunkedWriter::read(const transport::GattRef &ref, OpCallback done)
{
    enqueue_op(Op{ref, {}, true, std::move(done)});
}

void ChunkedWriter::enqueue_op(Op op)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        LOG_DEBUG("[WRITER] %s of %s queued, %zu operation(s) ahead",
                  op.is_read ? "read" : "write", op.ref.characteristic.c_str(), ops_.size());
        ops_.push_back(std::move(op));
    }
    post_kick();
}

void ChunkedWriter::post_kick()
{
    std::weak_ptr<ChunkedWriter> weak = weak_from_this();
    loop_.post([weak] {
        if (auto self = weak.lock())
            self->kick();
    });
}

void ChunkedWriter::kick()
{
    if (draining_)
        return;
    draining_ = true;
    step();
}

// One drain iteration: start the next queued operation, otherwise put the head packet in
// flight, otherwise flush completions. Continues from on_chunk_done() / on_op_done(),
// never recursively.
void ChunkedWriter::step()
{
    std::optional<proto::Packet> pkt;
    std::deque<Set>              finished;
    std::optional<Op>            op;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!ops_.empty())
        {
            current_op_ = std::move(ops_.front());
            ops_.pop_front();
            op = current_op_;
        }
        else if ((pkt = queue_.dequeue()))
        {
            for (auto &s : sets_)
            {
                if (s.sent < s.total)
                {
                    s.sent++;
                    inflight_ = s.id;
                    break;
                }
            }
        }
        else
        {
            finished.swap(sets_);
            draining_ = false;
        }
    }

    if (op)
    {
        start_op(*op);
        return;
    }

    if (!pkt)
    {
        if (!finished.empty())
            LOG_DEBUG("[WRITER] queue drained, completing %zu set(s)", finished.size());
        for (auto &s : finished)
        {
            queue_.decrement_pending_sets();
            if (s.done)
                s.done(std::nullopt);
        }
        return;
    }

    LOG_DEBUG("[WRITER] chunk of set #%llu (%zu bytes): %s", (unsigned long long)inflight_,
              pkt->size(), codec::to_hex(pkt->data(), pkt->size()).c_str());

    std::weak_ptr<ChunkedWriter> weak = weak_from_this();
    util::EventLoop             *loop = &loop_;
    const std::uint64_t          gen  = gen_;
    peripheral_->write_value(target_, *pkt, [weak, loop, gen](const transport::Status &st) {
        // transport thread (or inline): hop to the loop before touching state
        if (weak.expired())
            return;
        loop->post([weak, gen, st] {
            if (auto self = weak.lock())
                self->on_chunk_done(gen, st);
        });
    });
}

void ChunkedWriter::start_op(const Op &op)
{
    LOG_DEBUG("[WRITER] %s %s (%zu bytes)", op.is_read ? "reading" : "writing",
              op.ref.characteristic.c_str(), op.value.size());

    std::weak_ptr<ChunkedWriter> weak = weak_from_this();
    util::EventLoop             *loop = &loop_;
    const std::uint64_t          gen  = gen_;
    auto on_done = [weak, loop, gen](const transport::Status &st, const transport::Bytes &value) {
        if (weak.expired())
            return;
        loop->post([weak, gen, st, value] {
            if (auto self = weak.lock())
                self->on_op_done(gen, st, value);
        });
    };
    if (op.is_read)
        peripheral_->read_value(op.ref, on_done);
    else
        peripheral_->write_value(op.ref, op.value,
                                 [on_done](const transport::Status &st) { on_done(st, {}); });
}

void ChunkedWriter::on_op_done(std::uint64_t gen, const transport::Status &st,
                               const transport::Bytes &value)
{
    if (gen != gen_)
    {
        LOG_DEBUG("[WRITER] ignoring completion of an abandoned operation");
        return;
    }
    std::optional<Op> op;
    {
        std::lock_guard<std::mutex> lk(mu_);
        op.swap(current_op_);
    }
    if (op && op->done)
    {
        if (!st)
            op->done(std::nullopt, value);
        else if (op->is_read)
            op->done(Error{Errc::TransportRead, *st}, {});
        else
            op->done(Error{Errc::TransportWrite, *st}, {});
    }
    step();
}

void ChunkedWriter::on_chunk_done(std::uint64_t gen, const transport::Status &st)
{
    if (gen != gen_)
    {
        LOG_DEBUG("[WRITER] ignoring completion of an abandoned chunk");
        return;
    }
    if (!st)
    {
        step();
        return;
    }

    // Halt: acknowledged sets succeed, the owner of the failed chunk gets the transport
    // error, later sets are failed as well instead of being left pending.
    gen_++;
    std::deque<Set> sets;
    std::size_t     dropped = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        sets.swap(sets_);
        dropped   = queue_.clear();
        draining_ = false;
    }
    LOG_WARN("[WRITER] chunk write failed (set #%llu): %s, dropped %zu queued packet(s)",
             (unsigned long long)inflight_, st->c_str(), dropped);

    for (auto &s : sets)
    {
        if (!s.done)
            continue;
        if (s.id < inflight_)
            s.done(std::nullopt);
        else if (s.id == inflight_)
            s.done(Error{Errc::TransportWrite, *st});
        else
            s.done(Error{Errc::TransportWrite, "aborted after earlier chunk failure"});
    }

    // queued operations target other characteristics and still go out
    kick();
}

void ChunkedWriter::abort(const Error &err)
{
    gen_++;
    std::deque<Set>   sets;
    std::deque<Op>    ops;
    std::optional<Op> current;
    std::size_t       dropped = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        sets.swap(sets_);
        ops.swap(ops_);
        current.swap(current_op_);
        dropped   = queue_.clear();
        draining_ = false;
    }
    if (current)
        ops.push_front(std::move(*current));
    if (sets.empty() && ops.empty())
        return;

    LOG_WARN("[WRITER] aborting %zu set(s) and %zu operation(s), %zu packet(s) dropped: %s",
             sets.size(), ops.size(), dropped, err.message.c_str());
    for (auto &s : sets)
    {
        if (s.done)
            s.done(err);
    }
    for (auto &op : ops)
    {
        if (op.done)
            op.done(err, {});
    }
}

bool ChunkedWriter::busy() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return !sets_.empty() || !ops_.empty() || current_op_.has_value();
}

}  // namespace app
