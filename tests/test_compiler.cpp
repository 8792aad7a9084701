// tests/test_compiler.cpp
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "app/compiler.hpp"

using namespace app;

namespace
{
CompileReply json_reply(const std::string &body)
{
    CompileReply r;
    r.content_type = "application/json; charset=utf-8";
    r.body.assign(body.begin(), body.end());
    return r;
}
}  // namespace

TEST(Compiler, FormBodyInlineSource)
{
    CompileRequest req;
    req.source = "a = 1 + 2;";
    EXPECT_EQ(form_body(req), "js=a+%3D+1+%2B+2%3B");
}

TEST(Compiler, FormBodyHostedSource)
{
    CompileRequest req;
    req.source_url = "https://example.com/p.js?1700000000";
    EXPECT_EQ(form_body(req), "src=https%3A%2F%2Fexample.com%2Fp.js%3F1700000000");
}

TEST(Compiler, CacheBusted)
{
    EXPECT_EQ(cache_busted("https://example.com/p.js", 1700000000),
              "https://example.com/p.js?1700000000");
}

TEST(Compiler, BinaryBodyIsBytecode)
{
    CompileReply r;
    r.content_type = "application/octet-stream";
    r.body         = {0x00, 0x01, 0xFF};

    std::vector<std::uint8_t> code;
    EXPECT_FALSE(decode_compile_response(r, code).has_value());
    EXPECT_EQ(code, r.body);
}

TEST(Compiler, EmptyBinaryBodyIsError)
{
    CompileReply              r;
    std::vector<std::uint8_t> code;
    auto                      err = decode_compile_response(r, code);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, Errc::RemoteCompile);
    EXPECT_EQ(err->message, "empty response from compiler");
}

TEST(Compiler, JsonCompiledCode)
{
    std::vector<std::uint8_t> code;
    auto err = decode_compile_response(json_reply(R"({"compiledCode":"AQID"})"), code);
    EXPECT_FALSE(err.has_value());
    EXPECT_EQ(std::string(code.begin(), code.end()), "AQID");
}

TEST(Compiler, JsonServerErrorWins)
{
    std::vector<std::uint8_t> code;
    auto err = decode_compile_response(
        json_reply(R"({"serverErrors":[{"error":"line 1: bad"}],"compiledCode":"AQID"})"), code);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, Errc::RemoteCompile);
    EXPECT_EQ(err->message, "line 1: bad");
    EXPECT_TRUE(code.empty());
}

TEST(Compiler, JsonErrorField)
{
    std::vector<std::uint8_t> code;
    auto err = decode_compile_response(json_reply(R"({"error":"rate limited"})"), code);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "rate limited");
}

TEST(Compiler, JsonWithoutCode)
{
    std::vector<std::uint8_t> code;
    auto err = decode_compile_response(json_reply(R"({"status":"ok"})"), code);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "compiler response has no compiledCode");
}

TEST(Compiler, UnparseableJson)
{
    std::vector<std::uint8_t> code;
    auto err = decode_compile_response(json_reply("{\"compiledCode\":"), code);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "unparseable compiler response");
}
