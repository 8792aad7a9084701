#include <chrono>
#include <cstdlib>
#include <cstring>
#include <future>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "app/connection_manager.hpp"
#include "app/identity_store.hpp"
#include "ctl/ipc.hpp"
#include "proto/commands.hpp"
#include "transport/bluez_central.hpp"
#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"
#include "util/event_loop.hpp"
#include "util/log.hpp"

static util::EventLoop        *g_loop = nullptr;
static app::ConnectionManager *g_mgr  = nullptr;

// a full 5 KB bytecode image at ~30 ms per chunk, plus scan and connect
static constexpr std::chrono::seconds COMMAND_TIMEOUT{60};

// ---------------- helpers ----------------
static std::vector<std::string> split_words(const std::string &line)
{
    std::istringstream       is(line);
    std::vector<std::string> out;
    std::string              w;
    while (is >> w)
        out.push_back(w);
    return out;
}

static bool parse_u8(const std::string &s, unsigned max, std::uint8_t &out)
{
    char         *end = nullptr;
    unsigned long v   = std::strtoul(s.c_str(), &end, 10);
    if (s.empty() || !end || *end != '\0' || v > max)
        return false;
    out = static_cast<std::uint8_t>(v);
    return true;
}

static bool parse_u16(const std::string &s, std::uint16_t &out)
{
    char         *end = nullptr;
    unsigned long v   = std::strtoul(s.c_str(), &end, 10);
    if (s.empty() || !end || *end != '\0' || v > 0xFFFF)
        return false;
    out = static_cast<std::uint16_t>(v);
    return true;
}

static std::string result_line(const std::string &cmd, const std::optional<app::Error> &err,
                               const std::string &detail = std::string())
{
    std::string r;
    if (err)
        r = "ERR " + app::describe(err);
    else
        r = detail.empty() ? "OK" : "OK " + detail;
    LOG_SYSTEM("[%s] %s", cmd.c_str(), r.c_str());
    return r;
}

std::unique_ptr<transport::ICentral> make_central_from_env()
{
    const char *t = std::getenv("MOMENT_TRANSPORT");
    if (t && std::strcmp(t, "bluez") == 0)
    {
        transport::BluezConfig cfg;
        if (const char *a = std::getenv("MOMENT_ADAPTER"); a && *a)
            cfg.adapter = a;
        return std::make_unique<transport::BluezCentral>(std::move(cfg));
    }

    // default - loopback with one emulated device
    auto central = std::make_unique<transport::LoopbackCentral>();
    auto device =
        std::make_shared<transport::LoopbackPeripheral>("00:00:00:00:00:01", "Moment");
    const std::string fw = "loopback-1.0.0", serial = "LOOPBACK0001";
    device->set_read(std::string(constants::FW_REVISION_UUID), {fw.begin(), fw.end()});
    device->set_read(std::string(constants::SERIAL_NUMBER_UUID), {serial.begin(), serial.end()});
    central->add(device);
    return central;
}

// Runs `fn` on the event loop and waits for the reply it produces
using Reply = std::function<void(const std::string &)>;
static std::string run_on_loop(const std::function<void(Reply)> &fn)
{
    auto promise = std::make_shared<std::promise<std::string>>();
    auto fut     = promise->get_future();
    g_loop->post([fn, promise] {
        auto answered = std::make_shared<bool>(false);
        fn([promise, answered](const std::string &r) {
            if (*answered)
                return;
            *answered = true;
            promise->set_value(r);
        });
    });
    if (fut.wait_for(COMMAND_TIMEOUT) != std::future_status::ready)
    {
        LOG_WARN("command still pending after %lld s", (long long)COMMAND_TIMEOUT.count());
        return "ERR timed out";
    }
    return fut.get();
}

// Runs a session command; NotConnected when nothing is bound
using SessionCommand = std::function<void(app::DeviceSession &, app::WriteCallback)>;
static std::string with_session(const std::string &cmd, const SessionCommand &fn)
{
    return run_on_loop([cmd, fn](Reply reply) {
        auto s = g_mgr->session();
        if (!s)
        {
            reply(result_line(cmd, app::Error{app::Errc::NotConnected, "no device bound"}));
            return;
        }
        fn(*s, [cmd, reply](const std::optional<app::Error> &err) {
            reply(result_line(cmd, err));
        });
    });
}

static std::string read_text(const std::string &cmd, bool version)
{
    return run_on_loop([cmd, version](Reply reply) {
        auto s = g_mgr->session();
        if (!s)
        {
            reply(result_line(cmd, app::Error{app::Errc::NotConnected, "no device bound"}));
            return;
        }
        auto done = [cmd, reply](const std::optional<app::Error> &err, const std::string &text) {
            reply(result_line(cmd, err, text));
        };
        if (version)
            s->read_version(done);
        else
            s->read_serial(done);
    });
}

static std::string on_line(const std::string &line)
{
    auto words = split_words(line);
    if (words.empty())
        return "ERR empty command";
    const std::string &cmd = words[0];
    LOG_DEBUG("IPC line: %s", line.c_str());

    if (cmd == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK";
    }
    if (cmd == "CONNECT")
    {
        return run_on_loop([](Reply reply) {
            g_mgr->connect([reply](const std::optional<app::Error>          &err,
                                   const std::shared_ptr<app::DeviceSession> &s) {
                reply(result_line("CONNECT", err, s ? s->identifier() : std::string()));
            });
        });
    }
    if (cmd == "DISCONNECT")
    {
        return run_on_loop([](Reply reply) {
            g_mgr->disconnect();
            reply(result_line("DISCONNECT", std::nullopt));
        });
    }
    if (cmd == "FORGET")
    {
        return run_on_loop([](Reply reply) {
            if (g_mgr->forget())
                reply(result_line("FORGET", std::nullopt));
            else
                reply(result_line("FORGET",
                                  app::Error{app::Errc::InvalidArgument, "cannot clear identity"}));
        });
    }
    if (cmd == "DEVICES")
    {
        return run_on_loop([](Reply reply) {
            g_mgr->retrieve_available_devices(
                [reply](const std::optional<app::Error>                        &err,
                        const std::vector<std::shared_ptr<app::DeviceSession>> &list) {
                    std::string ids;
                    for (const auto &s : list)
                    {
                        LOG_SYSTEM("[DEVICE] %s name=%s state=%s", s->identifier().c_str(),
                                   s->name().c_str(), app::state_name(s->state()));
                        if (!ids.empty())
                            ids.push_back(' ');
                        ids += s->identifier();
                    }
                    reply(result_line("DEVICES", err, ids));
                });
        });
    }
    if (cmd == "RESET")
    {
        return with_session(cmd, [](app::DeviceSession &s, app::WriteCallback done) {
            s.reset(std::move(done));
        });
    }
    if (cmd == "BYTECODE")
    {
        if (words.size() != 2)
            return result_line(cmd, app::Error{app::Errc::InvalidArgument, "BYTECODE <base64>"});
        std::string b64 = words[1];
        return with_session(cmd, [b64](app::DeviceSession &s, app::WriteCallback done) {
            s.write_bytecode_string(b64, std::move(done));
        });
    }
    if (cmd == "SETTINGS")
    {
        std::optional<proto::Orientation> wrist, button;
        std::optional<proto::Intensity>   intensity;
        if (words.size() == 4)
        {
            wrist     = proto::parse_orientation(words[1]);
            button    = proto::parse_orientation(words[2]);
            intensity = proto::parse_intensity(words[3]);
        }
        if (!wrist || !button || !intensity)
            return result_line(cmd, app::Error{app::Errc::InvalidArgument,
                                               "SETTINGS <left|right> <left|right> "
                                               "<low|medium|high>"});
        return with_session(cmd, [=](app::DeviceSession &s, app::WriteCallback done) {
            s.write_settings(*wrist, *button, *intensity, std::move(done));
        });
    }
    if (cmd == "ACTUATORS")
    {
        std::uint16_t ms = 0;
        std::uint8_t  v[4]{};
        bool          ok = words.size() == 6 && parse_u16(words[1], ms);
        for (int i = 0; ok && i < 4; i++)
            ok = parse_u8(words[2 + i], proto::MAX_INTENSITY, v[i]);
        if (!ok)
            return result_line(cmd, app::Error{app::Errc::InvalidArgument,
                                               "ACTUATORS <ms> <tl> <tr> <bl> <br> (0-100)"});
        return with_session(cmd, [ms, v](app::DeviceSession &s, app::WriteCallback done) {
            s.write_actuators(ms, v[0], v[1], v[2], v[3], std::move(done));
        });
    }
    if (cmd == "TRIGGER")
    {
        std::optional<proto::Trigger> t;
        if (words.size() == 2)
            t = proto::parse_trigger(words[1]);
        if (!t)
            return result_line(cmd, app::Error{app::Errc::InvalidArgument, "unknown trigger"});
        return with_session(cmd, [t](app::DeviceSession &s, app::WriteCallback done) {
            s.trigger_pattern(*t, std::move(done));
        });
    }
    if (cmd == "VERSION")
        return read_text(cmd, /*version=*/true);
    if (cmd == "SERIAL")
        return read_text(cmd, /*version=*/false);

    LOG_WARN("unknown command: %s", cmd.c_str());
    return "ERR unknown command " + cmd;
}

int main()
{
    // log level from env var
    if (const char *log_level = std::getenv("MOMENT_LOG_LEVEL"))
        moment::set_log_level_by_name(log_level);

    const char *env_transport = std::getenv("MOMENT_TRANSPORT");
    const char *env_adapter   = std::getenv("MOMENT_ADAPTER");
    const std::string state   = constants::state_file_path();
    LOG_SYSTEM("Config: transport=%s adapter=%s state=%s",
               env_transport ? env_transport : "loopback", env_adapter ? env_adapter : "hci0",
               state.c_str());

    auto central = make_central_from_env();
    if (!central->start())
    {
        LOG_ERROR("central %s failed to start", central->name().c_str());
        return 1;
    }

    util::EventLoop loop;
    g_loop = &loop;
    loop.start();

    app::IdentityStore     store(ipc::expand_user(state), std::string(constants::IDENTITY_KEY));
    app::ConnectionManager mgr(*central, store, loop);
    g_mgr = &mgr;

    // IPC server
    std::string sock = ipc::expand_user(constants::ctl_sock_path());
    bool        ok   = ipc::start_server(sock, &on_line);
    if (!ok)
        LOG_ERROR("start_server failed");

    // tear down in reverse: session first, then the loop, then the radio
    run_on_loop([](Reply reply) {
        g_mgr->disconnect();
        reply("OK");
    });
    loop.stop();
    central->stop();
    g_mgr  = nullptr;
    g_loop = nullptr;
    return ok ? 0 : 1;
}
