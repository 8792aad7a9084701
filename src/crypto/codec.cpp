#include <sodium.h>

#include "crypto/codec.hpp"
#include "util/log.hpp"

namespace codec
{

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

bool base64_decode(std::string_view in, std::vector<std::uint8_t> &out)
{
    ensure_sodium_init();
    out.clear();
    if (in.empty())
        return true;

    std::vector<std::uint8_t> bin(in.size() / 4 * 3 + 3);
    std::size_t               bin_len = 0;
    // b64_end == nullptr: the whole input must parse
    if (sodium_base642bin(bin.data(), bin.size(), in.data(), in.size(), /*ignore=*/nullptr,
                          &bin_len, /*b64_end=*/nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        LOG_WARN("base64_decode: invalid input (%zu chars)", in.size());
        return false;
    }
    bin.resize(bin_len);
    out.swap(bin);
    return true;
}

std::string base64_encode(const std::vector<std::uint8_t> &in)
{
    ensure_sodium_init();
    const std::size_t enc_len = sodium_base64_ENCODED_LEN(in.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string       out(enc_len, '\0');
    sodium_bin2base64(out.data(), enc_len, in.data(), in.size(), sodium_base64_VARIANT_ORIGINAL);
    // enc_len counts the trailing NUL
    out.resize(enc_len - 1);
    return out;
}

std::string to_hex(const std::uint8_t *buf, std::size_t len)
{
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), buf, len);
    out.resize(len * 2);
    return out;
}

}  // namespace codec
