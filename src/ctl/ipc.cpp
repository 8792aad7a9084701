#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec) && !fs::create_directories(dir, ec))
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                  ec.message().c_str());
        return false;
    }
    // 0700, the socket accepts device commands
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    return true;
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Fills `addr` for `sock_path`, returns the address length or 0 on error
static socklen_t make_addr(const std::string &sock_path, sockaddr_un &addr)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return 0;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return 0;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    return static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                  std::strlen(addr.sun_path) + 1);
}

static bool send_all(int fd, const std::string &data)
{
    std::size_t sent = 0;
    while (sent < data.size())
    {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

// Reads until the first '\n' (stop_at_newline) or EOF
static bool recv_text(int fd, std::string &out, bool stop_at_newline)
{
    char buf[256];
    while (true)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            out.append(buf, static_cast<std::size_t>(n));
            if (stop_at_newline && out.find('\n') != std::string::npos)
                return true;
            continue;
        }
        if (n == 0)
            return true;  // EOF
        if (errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
}

static std::string first_line(const std::string &text)
{
    auto        pos   = text.find('\n');
    std::string first = (pos == std::string::npos) ? text : text.substr(0, pos);
    if (!first.empty() && first.back() == '\r')
        first.pop_back();
    return first;
}

// ======================================================================
// Function: start_server
// - In: socket path, handler (may be empty)
// - Out: true after a clean QUIT, false on socket errors
// - Note: one line per connection; the handler's reply is written back
//         before the connection is closed.
// ======================================================================
bool start_server(const std::string &sock_path, const LineHandler &on_line)
{
    sockaddr_un addr{};
    socklen_t   addr_len = make_addr(sock_path, addr);
    if (addr_len == 0)
        return false;

    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 4) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Listening on %s", sock_path.c_str());

    while (true)
    {
        int cfd = accept(fd, nullptr, nullptr);
        if (cfd == -1)
        {
            if (errno == EINTR)
                continue;
            int saved = errno;
            close(fd);
            unlink(sock_path.c_str());
            errno = saved;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            return false;
        }
        set_cloexec(cfd);

        std::string text;
        if (!recv_text(cfd, text, /*stop_at_newline=*/true))
        {
            close(cfd);
            continue;  // keep serving
        }

        const std::string line  = first_line(text);
        std::string       reply = on_line ? on_line(line) : std::string();
        if (!reply.empty())
        {
            if (reply.back() != '\n')
                reply.push_back('\n');
            (void)send_all(cfd, reply);  // client may not wait for it
        }
        close(cfd);

        if (line == "QUIT")
            break;
    }

    close(fd);
    unlink(sock_path.c_str());
    return true;
}

bool send_line(const std::string &sock_path,
               const std::string &line,
               std::string       *reply,
               int                reply_timeout_ms)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line");
        return false;
    }
    sockaddr_un addr{};
    socklen_t   addr_len = make_addr(sock_path, addr);
    if (addr_len == 0)
        return false;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("connect() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Sending line: %s", first_line(line).c_str());
    std::string out = line;
    if (out.back() != '\n')
        out.push_back('\n');
    if (!send_all(fd, out))
    {
        close(fd);
        return false;
    }

    bool ok = true;
    if (reply)
    {
        reply->clear();
        timeval tv{};
        tv.tv_sec  = reply_timeout_ms / 1000;
        tv.tv_usec = (reply_timeout_ms % 1000) * 1000;
        if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1)
            LOG_WARN("setsockopt(SO_RCVTIMEO) failed: %s", std::strerror(errno));
        std::string text;
        ok     = recv_text(fd, text, /*stop_at_newline=*/false);
        *reply = first_line(text);
    }

    close(fd);
    return ok;
}

std::string expand_user(const std::string &p)
{
    // leading '~' or '~/' -> $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && *home)
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
    }
    return p;
}

}  // namespace ipc
