#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>

#include "app/identity_store.hpp"
#include "util/log.hpp"

namespace app
{

IdentityStore::IdentityStore(std::string path, std::string key)
    : path_(std::move(path)), key_(std::move(key))
{
}

std::optional<std::string> IdentityStore::load() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::ifstream               in(path_);
    if (!in)
        return std::nullopt;

    std::string line;
    while (std::getline(in, line))
    {
        if (line.empty() || line[0] == '#')
            continue;
        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        if (line.compare(0, eq, key_) != 0 || eq != key_.size())
            continue;
        std::string value = line.substr(eq + 1);
        if (value.empty())
            return std::nullopt;
        return value;
    }
    return std::nullopt;
}

bool IdentityStore::write_atomic(const std::string &content)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path        p(path_);
    if (p.has_parent_path())
    {
        fs::create_directories(p.parent_path(), ec);
        if (ec)
        {
            LOG_ERROR("[CONN] cannot create %s: %s", p.parent_path().c_str(),
                      ec.message().c_str());
            return false;
        }
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out)
        {
            LOG_ERROR("[CONN] cannot open %s: %s", tmp.c_str(), std::strerror(errno));
            return false;
        }
        out << content;
        out.flush();
        if (!out)
        {
            LOG_ERROR("[CONN] write to %s failed", tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0)
    {
        LOG_ERROR("[CONN] rename %s -> %s failed: %s", tmp.c_str(), path_.c_str(),
                  std::strerror(errno));
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

bool IdentityStore::save(const std::string &identity)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!write_atomic(key_ + "=" + identity + "\n"))
        return false;
    LOG_DEBUG("[CONN] stored identity %s in %s", identity.c_str(), path_.c_str());
    return true;
}

bool IdentityStore::clear()
{
    std::lock_guard<std::mutex> lk(mu_);
    std::error_code             ec;
    std::filesystem::remove(path_, ec);
    if (ec)
    {
        LOG_ERROR("[CONN] cannot remove %s: %s", path_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace app
