#include <cJSON.h>
#include <cctype>
#include <cstdio>

#include "app/compiler.hpp"
#include "util/log.hpp"

namespace app
{

static std::string url_encode(const std::string &s)
{
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else if (c == ' ')
        {
            out.push_back('+');
        }
        else
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

std::string form_body(const CompileRequest &req)
{
    if (!req.source_url.empty())
        return "src=" + url_encode(req.source_url);
    return "js=" + url_encode(req.source);
}

std::string cache_busted(const std::string &url, std::time_t now)
{
    return url + "?" + std::to_string(static_cast<long long>(now));
}

static bool is_json(const std::string &content_type)
{
    // "application/json; charset=utf-8"
    return content_type.rfind("application/json", 0) == 0;
}

std::optional<Error> decode_compile_response(const CompileReply       &reply,
                                             std::vector<std::uint8_t> &bytecode)
{
    bytecode.clear();
    if (!is_json(reply.content_type))
    {
        if (reply.body.empty())
            return Error{Errc::RemoteCompile, "empty response from compiler"};
        bytecode = reply.body;
        return std::nullopt;
    }

    std::string text(reply.body.begin(), reply.body.end());
    cJSON      *json = cJSON_Parse(text.c_str());
    if (!json)
    {
        LOG_WARN("[SESSION] compiler returned unparseable JSON (%zu bytes)", text.size());
        return Error{Errc::RemoteCompile, "unparseable compiler response"};
    }

    std::optional<Error> err;
    cJSON *server_errors = cJSON_GetObjectItem(json, "serverErrors");
    cJSON *error         = cJSON_GetObjectItem(json, "error");
    cJSON *code          = cJSON_GetObjectItem(json, "compiledCode");

    if (cJSON_IsArray(server_errors) && cJSON_GetArraySize(server_errors) > 0)
    {
        cJSON *first = cJSON_GetArrayItem(server_errors, 0);
        cJSON *msg   = cJSON_GetObjectItem(first, "error");
        err = Error{Errc::RemoteCompile,
                    cJSON_IsString(msg) ? msg->valuestring : "compiler reported an error"};
    }
    else if (cJSON_IsString(error))
    {
        err = Error{Errc::RemoteCompile, error->valuestring};
    }
    else if (cJSON_IsString(code))
    {
        std::string s = code->valuestring;
        bytecode.assign(s.begin(), s.end());
    }
    else
    {
        err = Error{Errc::RemoteCompile, "compiler response has no compiledCode"};
    }

    cJSON_Delete(json);
    return err;
}

}  // namespace app
