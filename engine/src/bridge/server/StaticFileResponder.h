#pragma once

#include "WsBridgeCommon.h"

#include <string>
#include <variant>

namespace wsgate::bridge
{
    using StaticResponse = std::variant<
        bhttp::response<bhttp::string_body>,
        bhttp::response<bhttp::empty_body>,
        bhttp::response<bhttp::file_body>>;

    // Directory-backed file server for non-upgrade requests.
    class StaticFileResponder
    {
    public:
        StaticFileResponder(std::string docRoot, BridgeLog log);

        StaticResponse Respond(const HttpRequest& req) const;

        static bbeast::string_view MimeType(bbeast::string_view path);

        // Percent-decodes the path part of a request target. False on a malformed escape.
        static bool TryDecodeTarget(bbeast::string_view target, std::string& outPath);

        static bool IsSafePath(const std::string& path);

    private:
        static bhttp::response<bhttp::string_body> MakeText(
            const HttpRequest& req, bhttp::status status, const std::string& text);

        std::string docRoot_;
        BridgeLog log_;
    };
}
