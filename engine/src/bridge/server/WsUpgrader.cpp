#include "WsUpgrader.h"

#include <utility>

namespace wsgate::bridge
{
    WsUpgrader::WsUpgrader(OriginPolicy origins)
        : origins_(std::move(origins))
    {
    }

    bool WsUpgrader::OffersSubprotocol(bbeast::string_view header, bbeast::string_view proto)
    {
        size_t i = 0;
        while (i <= header.size())
        {
            size_t comma = header.find(',', i);
            if (comma == bbeast::string_view::npos)
                comma = header.size();

            size_t b = i;
            size_t e = comma;
            while (b < e && (header[b] == ' ' || header[b] == '\t')) b++;
            while (e > b && (header[e - 1] == ' ' || header[e - 1] == '\t')) e--;

            if (header.substr(b, e - b) == proto)
                return true;

            i = comma + 1;
        }
        return false;
    }

    UpgradeDecision WsUpgrader::Evaluate(const HttpRequest& req) const
    {
        UpgradeDecision d;

        if (!bws::is_upgrade(req))
        {
            d.status = bhttp::status::bad_request;
            d.reason = "not a websocket handshake";
            return d;
        }

        if (!origins_.Allows(req[bhttp::field::origin], req[bhttp::field::host]))
        {
            d.status = bhttp::status::forbidden;
            d.reason = "origin not allowed: " + std::string(req[bhttp::field::origin]);
            return d;
        }

        if (OffersSubprotocol(req[bhttp::field::sec_websocket_protocol], kSubprotocol))
            d.subprotocol = kSubprotocol;

        d.accepted = true;
        d.status = bhttp::status::switching_protocols;
        return d;
    }
}
