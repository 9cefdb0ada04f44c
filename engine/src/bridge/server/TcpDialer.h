#pragma once

#include "WsBridgeCommon.h"

#include <functional>
#include <string>

namespace wsgate::bridge
{
    // Opens one outbound TCP connection per bridged session.
    class TcpDialer
    {
    public:
        using DialHandler = std::function<void(const boost::system::error_code&)>;

        TcpDialer(HostPort target, BridgeLog log);

        // Resolves the target and connects `socket`. The handler runs on the socket's executor.
        void AsyncDial(btcp::socket& socket, DialHandler handler) const;

        std::string TargetString() const;
        const HostPort& Target() const { return target_; }

    private:
        HostPort target_;
        BridgeLog log_;
    };
}
