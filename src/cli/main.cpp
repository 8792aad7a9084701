#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "proto/commands.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool is_uint(const std::string &s, unsigned long max)
{
    if (s.empty() || s.size() > 5)
        return false;
    for (char c : s)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return std::strtoul(s.c_str(), nullptr, 10) <= max;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  momentctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  connect\n"
                         "  disconnect\n"
                         "  forget\n"
                         "  devices\n"
                         "  reset\n"
                         "  bytecode <base64>\n"
                         "  settings <left|right> <left|right> <low|medium|high>\n"
                         "  actuators <ms> <top-left> <top-right> <bottom-left> <bottom-right>\n"
                         "  trigger <name>\n"
                         "  version\n"
                         "  serial\n"
                         "  quit\n");
}

static void print_triggers()
{
    std::fprintf(stderr, "Triggers:");
    for (const auto &t : proto::TRIGGER_NAMES)
        std::fprintf(stderr, " %.*s", (int)t.name.size(), t.name.data());
    std::fprintf(stderr, "\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");
        return exitc::bad_args;
    }
    std::string reply;
    if (!ipc::send_line(sock, line, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (!reply.empty())
        std::printf("%s\n", reply.c_str());
    if (reply.rfind("ERR", 0) == 0)
        return exitc::failed;
    return exitc::ok;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    auto simple = [&](const char *line) {
        return [&, line]() -> int {
            if (args.size() != 1)
            {
                print_usage();
                return exitc::bad_args;
            }
            return send_line(line);
        };
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"connect", simple("CONNECT")},
        {"disconnect", simple("DISCONNECT")},
        {"forget", simple("FORGET")},
        {"devices", simple("DEVICES")},
        {"reset", simple("RESET")},
        {"version", simple("VERSION")},
        {"serial", simple("SERIAL")},
        {"quit", simple("QUIT")},
        {"bytecode",
         [&]() -> int {
             if (args.size() != 2 || args[1].empty())
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line("BYTECODE " + args[1]);
         }},
        {"settings",
         [&]() -> int {
             if (args.size() != 4)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string wrist = to_lower(args[1]), button = to_lower(args[2]),
                         level = to_lower(args[3]);
             if (!proto::parse_orientation(wrist) || !proto::parse_orientation(button))
             {
                 std::fprintf(stderr, "error: orientation must be 'left' or 'right'\n");
                 return exitc::bad_args;
             }
             if (!proto::parse_intensity(level))
             {
                 std::fprintf(stderr, "error: intensity must be 'low', 'medium' or 'high'\n");
                 return exitc::bad_args;
             }
             return send_line("SETTINGS " + wrist + " " + button + " " + level);
         }},
        {"actuators",
         [&]() -> int {
             if (args.size() != 6)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             if (!is_uint(args[1], 0xFFFF))
             {
                 std::fprintf(stderr, "error: duration must be 0-65535 ms\n");
                 return exitc::bad_args;
             }
             std::string line = "ACTUATORS " + args[1];
             for (std::size_t i = 2; i < 6; ++i)
             {
                 if (!is_uint(args[i], proto::MAX_INTENSITY))
                 {
                     std::fprintf(stderr, "error: intensity must be 0-100: %s\n", args[i].c_str());
                     return exitc::bad_args;
                 }
                 line += " " + args[i];
             }
             return send_line(line);
         }},
        {"trigger",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 print_triggers();
                 return exitc::bad_args;
             }
             std::string name = to_lower(args[1]);
             if (!proto::parse_trigger(name))
             {
                 std::fprintf(stderr, "error: unknown trigger: %s\n", args[1].c_str());
                 print_triggers();
                 return exitc::bad_args;
             }
             return send_line("TRIGGER " + name);
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }
    if (const char *log_level = std::getenv("MOMENT_LOG_LEVEL"))
        moment::set_log_level_by_name(log_level);
    else
        moment::set_log_level(moment::Level::Warning);

    // MOMENT_CTL_SOCK is honoured by ctl_sock_path(), --sock wins over both
    std::string sock;
    bool        have_sock = false;

    std::vector<std::string> args;
    args.reserve(argc - 1);
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock")
        {
            if (i + 1 >= argc)
            {
                print_usage();
                return exitc::bad_args;
            }
            sock      = ipc::expand_user(argv[++i]);
            have_sock = true;
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (!have_sock)
        sock = ipc::expand_user(constants::ctl_sock_path());

    const std::string &cmd    = args[0];
    auto               sender = [&](const std::string &line) -> int {
        return send_one_line(sock, line);
    };
    return run_cmd(to_lower(cmd), args, sender);
}
