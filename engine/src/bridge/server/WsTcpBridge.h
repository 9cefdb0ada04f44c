#pragma once

#include "GatewayContext.h"
#include "WsBridgeCommon.h"
#include "session/BridgePhase.h"

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace wsgate::bridge
{
    // One upgraded WebSocket bridged to one dialed TCP connection.
    //
    // Every completion handler runs on the strand of the accepted connection, so the
    // session state below needs no locking. Both relay directions end by closing both
    // handles; the session reaches Closed once both have reported in.
    template<class NextLayer>
    class WsTcpBridge : public std::enable_shared_from_this<WsTcpBridge<NextLayer>>
    {
    public:
        using WsStream = bws::stream<NextLayer>;
        using ClosedCallback = std::function<void()>;

        static constexpr size_t kTcpReadChunk = 16 * 1024;

        WsTcpBridge(
            NextLayer&& stream,
            std::shared_ptr<const GatewayContext> ctx,
            ClosedCallback onClosed);

        WsTcpBridge(const WsTcpBridge&) = delete;
        WsTcpBridge& operator=(const WsTcpBridge&) = delete;

        // Completes the handshake for `req`, dials the target and relays until either side ends.
        void Run(HttpRequest req, const UpgradeDecision& decision);

    private:
        enum class Direction { TcpToWs, WsToTcp };

        void OnAccept(const boost::system::error_code& ec);
        void OnDial(const boost::system::error_code& ec);
        void OnDialFailedClose(const boost::system::error_code& ec);
        void StartRelay();

        void DoTcpRead();
        void OnTcpRead(const boost::system::error_code& ec, size_t n);
        void OnWsWrite(const boost::system::error_code& ec, size_t n);

        void DoWsRead();
        void OnWsRead(const boost::system::error_code& ec, size_t n);
        void OnTcpWrite(const boost::system::error_code& ec, size_t n);

        void EndDirection(Direction d, const char* where, const boost::system::error_code& ec);
        void CloseBoth();
        void Finish();

        std::string Tag() const;

        WsStream ws_;
        btcp::socket tcp_;

        std::shared_ptr<const GatewayContext> ctx_;
        const BridgeLog& log_;
        ClosedCallback onClosed_;

        HttpRequest req_;
        std::string remote_;

        session::BridgePhase phase_ = session::BridgePhase::Established;
        bool closed_ = false;
        bool finished_ = false;
        int pendingDirections_ = 0;

        std::array<uint8_t, kTcpReadChunk> tcpBuf_{};
        bbeast::flat_buffer wsBuf_;

        uint64_t startMs_ = 0;
        uint64_t tcpToWsBytes_ = 0;
        uint64_t tcpToWsMsgs_ = 0;
        uint64_t wsToTcpBytes_ = 0;
        uint64_t wsToTcpMsgs_ = 0;
        uint64_t wsDiscarded_ = 0;
    };

    extern template class WsTcpBridge<bbeast::tcp_stream>;
    extern template class WsTcpBridge<bbeast::ssl_stream<bbeast::tcp_stream>>;
}
