#include "TcpDialer.h"

#include <memory>
#include <utility>

namespace wsgate::bridge
{
    TcpDialer::TcpDialer(HostPort target, BridgeLog log)
        : target_(std::move(target)),
          log_(std::move(log))
    {
    }

    std::string TcpDialer::TargetString() const
    {
        if (target_.host.find(':') != std::string::npos)
            return "[" + target_.host + "]:" + target_.port;
        return target_.host + ":" + target_.port;
    }

    void TcpDialer::AsyncDial(btcp::socket& socket, DialHandler handler) const
    {
        auto resolver = std::make_shared<btcp::resolver>(socket.get_executor());
        const std::string host = target_.host.empty() ? std::string("localhost") : target_.host;
        const BridgeLog log = log_;

        EmitLogMasked(log, LogMask::Trace,
            std::string("[dial] resolve tid=") + Tid() + " target=" + TargetString());

        resolver->async_resolve(host, target_.port,
            [resolver, &socket, log, handler = std::move(handler)](
                const boost::system::error_code& ec, btcp::resolver::results_type results) mutable
            {
                if (ec)
                {
                    handler(ec);
                    return;
                }

                basio::async_connect(socket, results,
                    [&socket, log, handler = std::move(handler)](
                        const boost::system::error_code& cec, const btcp::endpoint& ep)
                    {
                        if (cec)
                        {
                            handler(cec);
                            return;
                        }

                        boost::system::error_code tec;
                        socket.set_option(btcp::no_delay(true), tec);
                        LogEcAs(log, LogMask::Warn, "tcp.no_delay", tec);

                        socket.set_option(basio::socket_base::keep_alive(true), tec);
                        LogEcAs(log, LogMask::Warn, "tcp.keep_alive", tec);

                        EmitLogMasked(log, LogMask::Debug,
                            std::string("[dial] connected tid=") + Tid() + " remote=" + EpToString(ep));

                        handler({});
                    });
            });
    }
}
