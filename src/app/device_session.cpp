#include <ctime>
#include <utility>

#include "app/device_session.hpp"
#include "crypto/codec.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
#include "zorb.pb.h"

namespace app
{

static transport::GattRef make_ref(std::string_view svc, std::string_view chr)
{
    return transport::GattRef{std::string(svc), std::string(chr)};
}

const char *state_name(DeviceSession::State s)
{
    switch (s)
    {
        case DeviceSession::State::Disconnected:
            return "disconnected";
        case DeviceSession::State::Connecting:
            return "connecting";
        case DeviceSession::State::Connected:
            return "connected";
        case DeviceSession::State::Failed:
            return "failed";
    }
    return "?";
}

bool valid_utf8(const std::vector<std::uint8_t> &b)
{
    std::size_t i = 0;
    while (i < b.size())
    {
        const std::uint8_t c  = b[i];
        std::size_t        n  = 0;
        std::uint32_t      cp = 0;
        if (c < 0x80)
        {
            i++;
            continue;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            n  = 1;
            cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            n  = 2;
            cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            n  = 3;
            cp = c & 0x07;
        }
        else
        {
            return false;
        }
        if (i + n >= b.size())
            return false;  // truncated sequence
        for (std::size_t k = 1; k <= n; k++)
        {
            if ((b[i + k] & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (b[i + k] & 0x3F);
        }
        // overlong, surrogate, out of range
        if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000))
            return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;
        i += n + 1;
    }
    return true;
}

DeviceSession::DeviceSession(std::shared_ptr<transport::IPeripheral> peripheral,
                             util::EventLoop                        &loop)
    : peripheral_(std::move(peripheral)), loop_(loop)
{
    writer_ = std::make_shared<ChunkedWriter>(
        peripheral_, make_ref(constants::UART_SVC_UUID, constants::UART_RX_UUID), loop_);
}

DeviceSession::~DeviceSession()
{
    // no set is left without its completion
    writer_->abort(Error{Errc::NotConnected, "session closed"});
}

std::string DeviceSession::identifier() const
{
    return peripheral_->identifier();
}

std::string DeviceSession::name() const
{
    return peripheral_->name();
}

// ======================================================================
// Function: DeviceSession::connect
// - In: timeout (enforced by the transport), completion
// - Out: Disconnected/Failed -> Connecting -> Connected | Failed
// ======================================================================
void DeviceSession::connect(std::chrono::milliseconds timeout, WriteCallback done)
{
    if (state_ == State::Connected)
    {
        loop_.post([done] {
            if (done)
                done(std::nullopt);
        });
        return;
    }
    if (state_ == State::Connecting)
    {
        loop_.post([done] {
            if (done)
                done(Error{Errc::InvalidArgument, "connect already in progress"});
        });
        return;
    }

    state_ = State::Connecting;
    LOG_INFO("[SESSION] connecting to %s", peripheral_->identifier().c_str());

    std::weak_ptr<DeviceSession> weak = weak_from_this();
    util::EventLoop             *loop = &loop_;
    peripheral_->set_on_disconnect([weak, loop] {
        loop->post([weak] {
            if (auto self = weak.lock())
                self->on_link_lost();
        });
    });
    peripheral_->connect(timeout, [weak, loop, done](const transport::Status &st) {
        loop->post([weak, st, done] {
            if (auto self = weak.lock())
                self->on_connected(st, done);
            else if (done)
                done(Error{Errc::NotConnected, "session closed"});
        });
    });
}

void DeviceSession::on_connected(const transport::Status &st, WriteCallback done)
{
    if (state_ != State::Connecting)
    {
        // disconnect() raced the connect
        if (done)
            done(Error{Errc::NotConnected, "connect cancelled"});
        return;
    }
    if (st)
    {
        state_ = State::Failed;
        LOG_WARN("[SESSION] connect to %s failed: %s", peripheral_->identifier().c_str(),
                 st->c_str());
        if (done)
            done(Error{Errc::NotConnected, "connect failed: " + *st});
        return;
    }
    state_ = State::Connected;
    LOG_INFO("[SESSION] connected to %s (%s)", peripheral_->identifier().c_str(),
             peripheral_->name().c_str());
    if (done)
        done(std::nullopt);
}

void DeviceSession::teardown(const std::string &why)
{
    state_ = State::Disconnected;
    // stale packets must never reach a later link
    writer_->abort(Error{Errc::NotConnected, why});
}

void DeviceSession::disconnect()
{
    if (state_ == State::Disconnected)
        return;
    LOG_INFO("[SESSION] disconnecting %s", peripheral_->identifier().c_str());
    teardown("disconnected");
    peripheral_->disconnect();
}

void DeviceSession::on_link_lost()
{
    if (state_ != State::Connected)
        return;
    LOG_WARN("[SESSION] link to %s lost", peripheral_->identifier().c_str());
    teardown("link lost");
    if (on_link_lost_)
        on_link_lost_();
}

bool DeviceSession::check_connected(const WriteCallback &done)
{
    if (state_ == State::Connected)
        return true;
    LOG_WARN("[SESSION] command rejected, session is %s", state_name(state_));
    loop_.post([done] {
        if (done)
            done(Error{Errc::NotConnected, "not connected"});
    });
    return false;
}

void DeviceSession::direct_write(const transport::GattRef &ref,
                                 const transport::Bytes   &value,
                                 WriteCallback             done)
{
    if (!check_connected(done))
        return;
    // shares the writer's in-flight slot with UART chunks
    writer_->write_direct(ref, value,
                          [done](const std::optional<Error> &err, const transport::Bytes &) {
                              if (done)
                                  done(err);
                          });
}

void DeviceSession::write_settings(proto::Orientation wrist,
                                   proto::Orientation button,
                                   proto::Intensity   intensity,
                                   WriteCallback      done)
{
    proto::Settings s;
    s.wrist     = wrist;
    s.button    = button;
    s.intensity = intensity;
    direct_write(make_ref(constants::HAPTIC_SVC_UUID, constants::SETTINGS_UUID),
                 proto::encode_settings(s), std::move(done));
}

void DeviceSession::write_actuators(std::uint16_t duration_ms,
                                    std::uint8_t  top_left,
                                    std::uint8_t  top_right,
                                    std::uint8_t  bottom_left,
                                    std::uint8_t  bottom_right,
                                    WriteCallback done)
{
    if (top_left > proto::MAX_INTENSITY || top_right > proto::MAX_INTENSITY ||
        bottom_left > proto::MAX_INTENSITY || bottom_right > proto::MAX_INTENSITY)
    {
        loop_.post([done] {
            if (done)
                done(Error{Errc::InvalidArgument, "actuator intensity must be 0-100"});
        });
        return;
    }
    proto::ActuatorFrame a;
    a.duration_ms  = duration_ms;
    a.top_left     = top_left;
    a.top_right    = top_right;
    a.bottom_left  = bottom_left;
    a.bottom_right = bottom_right;
    direct_write(make_ref(constants::HAPTIC_SVC_UUID, constants::ACTUATOR_UUID),
                 proto::encode_actuators(a), std::move(done));
}

void DeviceSession::trigger_pattern(proto::Trigger trigger, WriteCallback done)
{
    direct_write(make_ref(constants::HAPTIC_SVC_UUID, constants::TRIGGER_UUID),
                 proto::encode_trigger(trigger), std::move(done));
}

void DeviceSession::write_bytecode(const std::vector<std::uint8_t> &bytecode, WriteCallback done)
{
    if (!check_connected(done))
        return;
    writer_->write(bytecode, std::move(done));
}

void DeviceSession::write_bytecode_string(const std::string &base64, WriteCallback done)
{
    std::vector<std::uint8_t> bytes;
    if (!codec::base64_decode(base64, bytes))
    {
        loop_.post([done] {
            if (done)
                done(Error{Errc::Decode, "invalid base64 encoded bytecode string"});
        });
        return;
    }
    write_bytecode(bytes, std::move(done));
}

void DeviceSession::write_timeline(const zorb::Timeline &timeline, WriteCallback done)
{
    std::string wire;
    if (!timeline.SerializeToString(&wire))
    {
        LOG_ERROR("[SESSION] timeline with %d vibration(s) did not serialize",
                  timeline.vibrations_size());
        loop_.post([done] {
            if (done)
                done(Error{Errc::InvalidArgument, "timeline could not be serialized"});
        });
        return;
    }
    LOG_DEBUG("[SESSION] timeline: %d vibration(s), %zu byte(s)", timeline.vibrations_size(),
              wire.size());
    write_bytecode(std::vector<std::uint8_t>(wire.begin(), wire.end()), std::move(done));
}

// ======================================================================
// Function: DeviceSession::reset
// - Out: single [0x00] packet through the writer
// - Note: the firmware acknowledges the write before the VM reset has
//         taken effect, so the completion waits one more loop turn.
// ======================================================================
void DeviceSession::reset(WriteCallback done)
{
    if (!check_connected(done))
        return;
    util::EventLoop *loop = &loop_;
    writer_->write({}, [loop, done](const std::optional<Error> &err) {
        loop->post([done, err] {
            if (done)
                done(err);
        });
    });
}

void DeviceSession::compile_and_write(const CompileRequest &req,
                                      ICompiler            &compiler,
                                      WriteCallback         done)
{
    if (!check_connected(done))
        return;

    std::weak_ptr<DeviceSession> weak = weak_from_this();
    util::EventLoop             *loop = &loop_;
    compiler.compile(req, [weak, loop, done](const transport::Status &st,
                                             const CompileReply      &reply) {
        loop->post([weak, st, reply, done] {
            if (st)
            {
                LOG_WARN("[SESSION] compile request failed: %s", st->c_str());
                if (done)
                    done(Error{Errc::RemoteCompile, *st});
                return;
            }
            std::vector<std::uint8_t> bytecode;
            if (auto err = decode_compile_response(reply, bytecode))
            {
                if (done)
                    done(err);
                return;
            }
            auto self = weak.lock();
            if (!self)
            {
                if (done)
                    done(Error{Errc::NotConnected, "session closed"});
                return;
            }
            LOG_DEBUG("[SESSION] compiled to %zu byte(s)", bytecode.size());
            self->write_bytecode(bytecode, done);
        });
    });
}

void DeviceSession::write_javascript(const std::string &source, ICompiler &compiler,
                                     WriteCallback done)
{
    CompileRequest req;
    req.source = source;
    compile_and_write(req, compiler, std::move(done));
}

void DeviceSession::write_javascript_url(const std::string &url, ICompiler &compiler,
                                         WriteCallback done)
{
    CompileRequest req;
    req.source_url = cache_busted(url, std::time(nullptr));
    compile_and_write(req, compiler, std::move(done));
}

void DeviceSession::read_text(const transport::GattRef &ref, ReadCallback done)
{
    if (state_ != State::Connected)
    {
        loop_.post([done] {
            if (done)
                done(Error{Errc::NotConnected, "not connected"}, std::string());
        });
        return;
    }
    writer_->read(ref, [done](const std::optional<Error> &err, const transport::Bytes &value) {
        if (!done)
            return;
        if (err)
        {
            done(err, std::string());
            return;
        }
        if (!valid_utf8(value))
        {
            done(Error{Errc::Decode, "characteristic value is not UTF-8 text"}, std::string());
            return;
        }
        std::string text(value.begin(), value.end());
        // C strings from the firmware
        while (!text.empty() && text.back() == '\0')
            text.pop_back();
        done(std::nullopt, text);
    });
}

void DeviceSession::read_version(ReadCallback done)
{
    read_text(make_ref(constants::DEVINFO_SVC_UUID, constants::FW_REVISION_UUID), std::move(done));
}

void DeviceSession::read_serial(ReadCallback done)
{
    read_text(make_ref(constants::DEVINFO_SVC_UUID, constants::SERIAL_NUMBER_UUID),
              std::move(done));
}

}  // namespace app
