#pragma once

#include "WsBridgeCommon.h"

#include <string>

namespace wsgate::bridge
{
    enum class RouteAction
    {
        Ignore = 0,
        ServeStatic,
        Upgrade
    };

    const char* ToString(RouteAction a);

    class RequestRouter
    {
    public:
        explicit RequestRouter(bool staticEnabled);

        RouteAction Route(const HttpRequest& req, bool shuttingDown) const;

        bool StaticEnabled() const { return staticEnabled_; }

        // Case-insensitive substring match for the "upgrade" token.
        static bool ConnectionRequestsUpgrade(bbeast::string_view connectionHeader);

    private:
        bool staticEnabled_;
    };
}
