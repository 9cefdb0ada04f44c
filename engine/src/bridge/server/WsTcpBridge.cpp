#include "WsTcpBridge.h"

#include <sstream>
#include <utility>

namespace wsgate::bridge
{
    using session::BridgePhase;

    template<class NextLayer>
    WsTcpBridge<NextLayer>::WsTcpBridge(
        NextLayer&& stream,
        std::shared_ptr<const GatewayContext> ctx,
        ClosedCallback onClosed)
        : ws_(std::move(stream)),
          tcp_(ws_.get_executor()),
          ctx_(std::move(ctx)),
          log_(ctx_->log),
          onClosed_(std::move(onClosed))
    {
        boost::system::error_code ec;
        const auto ep = bbeast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
        remote_ = ec ? std::string("<unknown>") : EpToString(ep);
    }

    template<class NextLayer>
    std::string WsTcpBridge<NextLayer>::Tag() const
    {
        return std::string("[bridge] remote=") + remote_ + " tid=" + Tid();
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::Run(HttpRequest req, const UpgradeDecision& decision)
    {
        req_ = std::move(req);
        startMs_ = NowMs();

        ctx_->upgrader.Prepare(ws_, decision);

        EmitLogMasked(log_, LogMask::Trace,
            Tag() + " handshake BEGIN target=" + std::string(req_.target()) +
            " subprotocol=" + (decision.subprotocol.empty() ? std::string("<none>") : decision.subprotocol));

        ws_.async_accept(req_,
            bbeast::bind_front_handler(&WsTcpBridge::OnAccept, this->shared_from_this()));
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::OnAccept(const boost::system::error_code& ec)
    {
        if (ec)
        {
            LogEc(log_, "error upgrading to websocket (ws.accept)", ec);
            CloseBoth();
            Finish();
            return;
        }

        EmitLogMasked(log_, LogMask::Debug, Tag() + " received connection");

        ctx_->dialer.AsyncDial(tcp_,
            [self = this->shared_from_this()](const boost::system::error_code& dec)
            {
                self->OnDial(dec);
            });
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::OnDial(const boost::system::error_code& ec)
    {
        if (!ec)
        {
            StartRelay();
            return;
        }

        {
            std::ostringstream oss;
            oss << "[bridge] error connecting to target " << ctx_->dialer.TargetString()
                << " remote=" << remote_
                << " tid=" << Tid()
                << " ec=" << ec.value()
                << " message=" << ec.message();
            EmitLogMasked(log_, LogMask::Error, oss.str());
        }

        ws_.async_close(bws::close_reason(bws::close_code::try_again_later),
            bbeast::bind_front_handler(&WsTcpBridge::OnDialFailedClose, this->shared_from_this()));
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::OnDialFailedClose(const boost::system::error_code& ec)
    {
        LogEcAs(log_, LogMask::Debug, "ws.close after dial failure", ec);
        CloseBoth();
        Finish();
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::StartRelay()
    {
        phase_ = BridgePhase::Relaying;
        pendingDirections_ = 2;

        EmitLogMasked(log_, LogMask::Debug,
            Tag() + " relay BEGIN target=" + ctx_->dialer.TargetString());

        DoTcpRead();
        DoWsRead();
    }

    // ------------------------------------------------------------
    // TCP -> WebSocket
    // ------------------------------------------------------------

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::DoTcpRead()
    {
        tcp_.async_read_some(basio::buffer(tcpBuf_),
            bbeast::bind_front_handler(&WsTcpBridge::OnTcpRead, this->shared_from_this()));
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::OnTcpRead(const boost::system::error_code& ec, size_t n)
    {
        if (ec)
        {
            EndDirection(Direction::TcpToWs, "tcp read", ec);
            return;
        }

        if (n == 0)
        {
            DoTcpRead();
            return;
        }

        if (ShouldLog(log_, LogMask::Trace))
            EmitLogMasked(log_, LogMask::Trace, Tag() + " tcp->ws " + HexPrefix(tcpBuf_.data(), n));

        tcpToWsBytes_ += static_cast<uint64_t>(n);
        tcpToWsMsgs_++;

        ws_.binary(true);
        ws_.async_write(basio::buffer(tcpBuf_.data(), n),
            bbeast::bind_front_handler(&WsTcpBridge::OnWsWrite, this->shared_from_this()));
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::OnWsWrite(const boost::system::error_code& ec, size_t)
    {
        if (ec)
        {
            EndDirection(Direction::TcpToWs, "ws write", ec);
            return;
        }

        DoTcpRead();
    }

    // ------------------------------------------------------------
    // WebSocket -> TCP
    // ------------------------------------------------------------

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::DoWsRead()
    {
        wsBuf_.consume(wsBuf_.size());

        ws_.async_read(wsBuf_,
            bbeast::bind_front_handler(&WsTcpBridge::OnWsRead, this->shared_from_this()));
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::OnWsRead(const boost::system::error_code& ec, size_t)
    {
        if (ec)
        {
            EndDirection(Direction::WsToTcp, "ws read", ec);
            return;
        }

        if (!ws_.got_binary())
        {
            wsDiscarded_++;
            EmitLogMasked(log_, LogMask::Warn,
                Tag() + " non-binary message received, discarded len=" + std::to_string(wsBuf_.size()));
            DoWsRead();
            return;
        }

        if (wsBuf_.size() == 0)
        {
            DoWsRead();
            return;
        }

        wsToTcpBytes_ += static_cast<uint64_t>(wsBuf_.size());
        wsToTcpMsgs_++;

        basio::async_write(tcp_, wsBuf_.data(),
            bbeast::bind_front_handler(&WsTcpBridge::OnTcpWrite, this->shared_from_this()));
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::OnTcpWrite(const boost::system::error_code& ec, size_t)
    {
        if (ec)
        {
            EndDirection(Direction::WsToTcp, "tcp write", ec);
            return;
        }

        DoWsRead();
    }

    // ------------------------------------------------------------
    // Teardown
    // ------------------------------------------------------------

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::EndDirection(Direction d, const char* where, const boost::system::error_code& ec)
    {
        // Once teardown started, the surviving direction only sees our own close.
        if (closed_ || IsBenignClose(ec))
            LogEcAs(log_, LogMask::Debug, where, ec);
        else
            LogEc(log_, where, ec);

        EmitLogMasked(log_, LogMask::Debug,
            Tag() + (d == Direction::TcpToWs ? " tcp->ws" : " ws->tcp") + " loop exit phase=" +
            session::ToString(phase_));

        CloseBoth();

        if (--pendingDirections_ == 0)
            Finish();
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::CloseBoth()
    {
        if (closed_)
            return;

        closed_ = true;
        phase_ = BridgePhase::TearingDown;

        boost::system::error_code ec;

        if (tcp_.is_open())
        {
            tcp_.shutdown(btcp::socket::shutdown_both, ec);
            LogEcAs(log_, LogMask::Trace, "tcp.shutdown", ec);

            tcp_.close(ec);
            LogEcAs(log_, LogMask::Trace, "tcp.close", ec);
        }

        bbeast::get_lowest_layer(ws_).close();
    }

    template<class NextLayer>
    void WsTcpBridge<NextLayer>::Finish()
    {
        if (finished_)
            return;

        finished_ = true;
        phase_ = BridgePhase::Closed;

        {
            std::ostringstream oss;
            oss << "[bridge] session END remote=" << remote_
                << " tid=" << Tid()
                << " duration_ms=" << (NowMs() - startMs_)
                << " tcp_to_ws_msgs=" << tcpToWsMsgs_
                << " tcp_to_ws_bytes=" << tcpToWsBytes_
                << " ws_to_tcp_msgs=" << wsToTcpMsgs_
                << " ws_to_tcp_bytes=" << wsToTcpBytes_
                << " ws_discarded=" << wsDiscarded_;
            EmitLogMasked(log_, LogMask::Debug, oss.str());
        }

        auto cb = std::move(onClosed_);
        onClosed_ = nullptr;

        if (cb)
            cb();
    }

    template class WsTcpBridge<bbeast::tcp_stream>;
    template class WsTcpBridge<bbeast::ssl_stream<bbeast::tcp_stream>>;
}
