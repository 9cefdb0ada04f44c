#pragma once

#include "GatewayContext.h"
#include "WsBridgeCommon.h"

#include <memory>

namespace wsgate::bridge
{
    // Starts handling one accepted connection. The socket must be bound to its own strand.
    void LaunchPlainHttpSession(std::shared_ptr<const GatewayContext> ctx, btcp::socket socket);

    void LaunchTlsHttpSession(std::shared_ptr<const GatewayContext> ctx, btcp::socket socket, bssl::context& tls);
}
