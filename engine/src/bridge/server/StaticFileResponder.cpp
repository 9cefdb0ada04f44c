#include "StaticFileResponder.h"

#include <filesystem>
#include <utility>

namespace wsgate::bridge
{
    namespace fs = std::filesystem;

    StaticFileResponder::StaticFileResponder(std::string docRoot, BridgeLog log)
        : docRoot_(std::move(docRoot)),
          log_(std::move(log))
    {
        while (docRoot_.size() > 1 && docRoot_.back() == '/')
            docRoot_.pop_back();
    }

    bbeast::string_view StaticFileResponder::MimeType(bbeast::string_view path)
    {
        using bbeast::iequals;

        const auto ext = [&path]
        {
            const auto pos = path.rfind(".");
            if (pos == bbeast::string_view::npos)
                return bbeast::string_view{};
            return path.substr(pos);
        }();

        if (iequals(ext, ".htm"))   return "text/html; charset=utf-8";
        if (iequals(ext, ".html"))  return "text/html; charset=utf-8";
        if (iequals(ext, ".css"))   return "text/css; charset=utf-8";
        if (iequals(ext, ".txt"))   return "text/plain; charset=utf-8";
        if (iequals(ext, ".js"))    return "text/javascript; charset=utf-8";
        if (iequals(ext, ".mjs"))   return "text/javascript; charset=utf-8";
        if (iequals(ext, ".json"))  return "application/json";
        if (iequals(ext, ".map"))   return "application/json";
        if (iequals(ext, ".xml"))   return "text/xml; charset=utf-8";
        if (iequals(ext, ".wasm"))  return "application/wasm";
        if (iequals(ext, ".png"))   return "image/png";
        if (iequals(ext, ".jpe"))   return "image/jpeg";
        if (iequals(ext, ".jpeg"))  return "image/jpeg";
        if (iequals(ext, ".jpg"))   return "image/jpeg";
        if (iequals(ext, ".gif"))   return "image/gif";
        if (iequals(ext, ".ico"))   return "image/vnd.microsoft.icon";
        if (iequals(ext, ".svg"))   return "image/svg+xml";
        if (iequals(ext, ".svgz"))  return "image/svg+xml";
        if (iequals(ext, ".woff"))  return "font/woff";
        if (iequals(ext, ".woff2")) return "font/woff2";
        return "application/octet-stream";
    }

    static int HexValue(char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bool StaticFileResponder::TryDecodeTarget(bbeast::string_view target, std::string& outPath)
    {
        const auto q = target.find_first_of("?#");
        if (q != bbeast::string_view::npos)
            target = target.substr(0, q);

        std::string out;
        out.reserve(target.size());

        for (size_t i = 0; i < target.size(); i++)
        {
            const char c = target[i];
            if (c != '%')
            {
                out += c;
                continue;
            }

            if (i + 2 >= target.size())
                return false;

            const int hi = HexValue(target[i + 1]);
            const int lo = HexValue(target[i + 2]);
            if (hi < 0 || lo < 0)
                return false;

            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        }

        outPath = std::move(out);
        return true;
    }

    bool StaticFileResponder::IsSafePath(const std::string& path)
    {
        if (path.empty() || path.front() != '/')
            return false;

        if (path.find('\0') != std::string::npos || path.find('\\') != std::string::npos)
            return false;

        size_t i = 0;
        while (i < path.size())
        {
            size_t next = path.find('/', i + 1);
            if (next == std::string::npos)
                next = path.size();

            if (path.compare(i + 1, next - i - 1, "..") == 0)
                return false;

            i = next;
        }
        return true;
    }

    bhttp::response<bhttp::string_body> StaticFileResponder::MakeText(
        const HttpRequest& req, bhttp::status status, const std::string& text)
    {
        bhttp::response<bhttp::string_body> res{status, req.version()};
        res.set(bhttp::field::server, "wsgate");
        res.set(bhttp::field::content_type, "text/plain; charset=utf-8");
        res.keep_alive(req.keep_alive());
        if (req.method() != bhttp::verb::head)
            res.body() = text;
        res.content_length(text.size());
        return res;
    }

    StaticResponse StaticFileResponder::Respond(const HttpRequest& req) const
    {
        if (req.method() != bhttp::verb::get && req.method() != bhttp::verb::head)
        {
            auto res = MakeText(req, bhttp::status::method_not_allowed, "405 method not allowed\n");
            res.set(bhttp::field::allow, "GET, HEAD");
            return StaticResponse{std::move(res)};
        }

        std::string path;
        if (!TryDecodeTarget(req.target(), path) || !IsSafePath(path))
            return MakeText(req, bhttp::status::bad_request, "400 bad request\n");

        std::string full = docRoot_ + path;

        std::error_code fec;
        if (path.back() != '/' && fs::is_directory(full, fec))
        {
            bhttp::response<bhttp::string_body> res{bhttp::status::moved_permanently, req.version()};
            res.set(bhttp::field::server, "wsgate");
            res.set(bhttp::field::location, path + "/");
            res.keep_alive(req.keep_alive());
            res.content_length(0);
            return StaticResponse{std::move(res)};
        }

        if (path.back() == '/')
            full.append("index.html");

        bbeast::error_code ec;
        bhttp::file_body::value_type body;
        body.open(full.c_str(), bbeast::file_mode::scan, ec);

        if (ec == bbeast::errc::no_such_file_or_directory || ec == bbeast::errc::is_a_directory)
        {
            EmitLogMasked(log_, LogMask::Debug,
                std::string("[static] not found tid=") + Tid() + " path=" + path);
            return MakeText(req, bhttp::status::not_found, "404 page not found\n");
        }

        if (ec)
        {
            LogEcAs(log_, LogMask::Warn, "static open", ec);
            return MakeText(req, bhttp::status::internal_server_error, "500 internal server error\n");
        }

        const auto size = body.size();

        if (req.method() == bhttp::verb::head)
        {
            bhttp::response<bhttp::empty_body> res{bhttp::status::ok, req.version()};
            res.set(bhttp::field::server, "wsgate");
            res.set(bhttp::field::content_type, MimeType(full));
            res.content_length(size);
            res.keep_alive(req.keep_alive());
            return StaticResponse{std::move(res)};
        }

        bhttp::response<bhttp::file_body> res{
            std::piecewise_construct,
            std::make_tuple(std::move(body)),
            std::make_tuple(bhttp::status::ok, req.version())};
        res.set(bhttp::field::server, "wsgate");
        res.set(bhttp::field::content_type, MimeType(full));
        res.content_length(size);
        res.keep_alive(req.keep_alive());
        return StaticResponse{std::move(res)};
    }
}
