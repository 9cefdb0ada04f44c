#include "RequestRouter.h"

#include <algorithm>
#include <cctype>

namespace wsgate::bridge
{
    const char* ToString(RouteAction a)
    {
        switch (a)
        {
            case RouteAction::Ignore:      return "ignore";
            case RouteAction::ServeStatic: return "static";
            case RouteAction::Upgrade:     return "upgrade";
            default:                       return "unknown";
        }
    }

    RequestRouter::RequestRouter(bool staticEnabled)
        : staticEnabled_(staticEnabled)
    {
    }

    bool RequestRouter::ConnectionRequestsUpgrade(bbeast::string_view connectionHeader)
    {
        std::string lower(connectionHeader.data(), connectionHeader.size());
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return lower.find("upgrade") != std::string::npos;
    }

    RouteAction RequestRouter::Route(const HttpRequest& req, bool shuttingDown) const
    {
        if (shuttingDown)
            return RouteAction::Ignore;

        if (staticEnabled_)
        {
            const auto it = req.find(bhttp::field::connection);
            if (it == req.end() || it->value().empty() || !ConnectionRequestsUpgrade(it->value()))
                return RouteAction::ServeStatic;
        }

        return RouteAction::Upgrade;
    }
}
