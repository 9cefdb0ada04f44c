#pragma once

#include "RequestRouter.h"
#include "StaticFileResponder.h"
#include "TcpDialer.h"
#include "WsBridgeCommon.h"
#include "WsUpgrader.h"
#include "session/SessionLifecycle.h"

#include <memory>
#include <optional>

namespace wsgate::bridge
{
    // Read-only after the server starts; shared by every connection it accepts.
    struct GatewayContext
    {
        RequestRouter router;
        WsUpgrader upgrader;
        TcpDialer dialer;
        std::optional<StaticFileResponder> files;

        std::shared_ptr<session::SessionLifecycle> lifecycle;
        BridgeLog log;
    };
}
