#pragma once
#include <mutex>
#include <optional>
#include <string>

namespace app
{

// Persisted identity of the last bound device: one `key=value` line in a small text file.
// Saves go through a temp file + rename so a reader never sees a torn write.
class IdentityStore
{
  public:
    IdentityStore(std::string path, std::string key);

    std::optional<std::string> load() const;
    bool                       save(const std::string &identity);
    bool                       clear();

    const std::string &path() const { return path_; }

  private:
    bool write_atomic(const std::string &content);

    mutable std::mutex mu_;
    std::string        path_;
    std::string        key_;
};

}  // namespace app
