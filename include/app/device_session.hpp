#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "app/chunked_writer.hpp"
#include "app/compiler.hpp"
#include "app/errors.hpp"
#include "proto/commands.hpp"
#include "transport/itransport.hpp"
#include "util/event_loop.hpp"

namespace zorb
{
class Timeline;
}

namespace app
{

// One Moment device. Owns the chunked writer (and so the packet queue) for its link.
// Every public method is called on the event loop thread, every callback fires there.
class DeviceSession : public std::enable_shared_from_this<DeviceSession>
{
  public:
    enum class State
    {
        Disconnected,
        Connecting,
        Connected,
        Failed
    };

    DeviceSession(std::shared_ptr<transport::IPeripheral> peripheral, util::EventLoop &loop);
    ~DeviceSession();

    DeviceSession(const DeviceSession &)            = delete;
    DeviceSession &operator=(const DeviceSession &) = delete;

    std::string identifier() const;
    std::string name() const;
    State       state() const { return state_; }

    // Connected -> Disconnected when the link drops on its own
    void set_on_link_lost(std::function<void()> cb) { on_link_lost_ = std::move(cb); }

    void connect(std::chrono::milliseconds timeout, WriteCallback done);
    void disconnect();

    // --- direct writes (single transport write, no packet queue) ---
    void write_settings(proto::Orientation wrist,
                        proto::Orientation button,
                        proto::Intensity   intensity,
                        WriteCallback      done);
    void write_actuators(std::uint16_t duration_ms,
                         std::uint8_t  top_left,
                         std::uint8_t  top_right,
                         std::uint8_t  bottom_left,
                         std::uint8_t  bottom_right,
                         WriteCallback done);
    void trigger_pattern(proto::Trigger trigger, WriteCallback done);

    // --- framed writes to the UART RX characteristic ---
    void write_bytecode(const std::vector<std::uint8_t> &bytecode, WriteCallback done);
    void write_bytecode_string(const std::string &base64, WriteCallback done);
    void reset(WriteCallback done);
    // serialized zorb.Timeline, framed like bytecode
    void write_timeline(const zorb::Timeline &timeline, WriteCallback done);
    void write_javascript(const std::string &source, ICompiler &compiler, WriteCallback done);
    void write_javascript_url(const std::string &url, ICompiler &compiler, WriteCallback done);

    // --- Device Information reads, UTF-8 text ---
    void read_version(ReadCallback done);
    void read_serial(ReadCallback done);

    const ChunkedWriter &writer() const { return *writer_; }

  private:
    void on_connected(const transport::Status &st, WriteCallback done);
    void on_link_lost();
    void teardown(const std::string &why);
    bool check_connected(const WriteCallback &done);
    void direct_write(const transport::GattRef &ref, const transport::Bytes &value,
                      WriteCallback done);
    void read_text(const transport::GattRef &ref, ReadCallback done);
    void compile_and_write(const CompileRequest &req, ICompiler &compiler, WriteCallback done);

    std::shared_ptr<transport::IPeripheral> peripheral_;
    util::EventLoop                        &loop_;
    std::shared_ptr<ChunkedWriter>          writer_;
    State                                   state_ = State::Disconnected;
    std::function<void()>                   on_link_lost_;
};

const char *state_name(DeviceSession::State s);

// Strict UTF-8 check (no overlongs, no surrogates, max U+10FFFF)
bool valid_utf8(const std::vector<std::uint8_t> &bytes);

}  // namespace app
