#pragma once
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "app/errors.hpp"
#include "transport/itransport.hpp"

namespace app
{

// Exactly one of source / source_url is set
struct CompileRequest
{
    std::string source;      // inline script text, sent as `js`
    std::string source_url;  // hosted script, sent as `src`
};

struct CompileReply
{
    std::string               content_type;
    std::vector<std::uint8_t> body;
};

// Transport-level failure (DNS, TLS, HTTP status) in the status, body otherwise
using CompileDone = std::function<void(const transport::Status &, const CompileReply &)>;

// Remote script compiler. No HTTP client ships with the library; the owner injects one.
struct ICompiler
{
    virtual void compile(const CompileRequest &req, CompileDone done) = 0;
    virtual ~ICompiler()                                              = default;
};

// application/x-www-form-urlencoded body for the request
std::string form_body(const CompileRequest &req);

// `url?<unix-seconds>` so hosted scripts are not served from a cache
std::string cache_busted(const std::string &url, std::time_t now);

// Binary body: the bytecode itself.
// JSON body: `compiledCode` text as bytes; `serverErrors[0].error` or `error` is a failure.
std::optional<Error> decode_compile_response(const CompileReply       &reply,
                                             std::vector<std::uint8_t> &bytecode);

}  // namespace app
