#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace wsgate
{
    namespace basio  = boost::asio;
    namespace bssl   = basio::ssl;
    namespace bbeast = boost::beast;
    namespace bhttp  = bbeast::http;
    namespace bws    = bbeast::websocket;

    using btcp = basio::ip::tcp;

    using HttpRequest = bhttp::request<bhttp::string_body>;
}

namespace wsgate::bridge
{
    enum class LogMask : uint32_t
    {
        Error = 1u << 0,
        Warn  = 1u << 1,
        Info  = 1u << 2,
        Debug = 1u << 3,
        Trace = 1u << 4,

        Default = Error | Warn | Info,
        Verbose = Error | Warn | Info | Debug | Trace
    };

    uint32_t ToU32(LogMask m);

    std::string Tid();

    // Injected log destination. Components copy it; nothing logs through a global.
    struct BridgeLog
    {
        std::function<void(const std::string&)> sink;
        uint32_t mask = ToU32(LogMask::Default);
    };

    bool ShouldLog(const BridgeLog& log, LogMask m);

    void EmitLogMasked(const BridgeLog& log, LogMask m, const std::string& s);

    void DrainOpenSslErrors(const BridgeLog& log, const char* where);

    void LogEc(const BridgeLog& log, const char* where, const boost::system::error_code& ec);

    void LogEcAs(const BridgeLog& log, LogMask m, const char* where, const boost::system::error_code& ec);

    void LogTlsInfo(const BridgeLog& log, SSL* ssl, const char* where);

    // Terminations that end a relay direction without being an error:
    // close handshake already done, end of stream, our own cancellation.
    bool IsBenignClose(const boost::system::error_code& ec);

    struct HostPort
    {
        std::string host;
        std::string port;
    };

    // Accepts "host:port", "[v6]:port" and ":port".
    bool TrySplitHostPort(const std::string& addr, HostPort& out, std::string& outError);

    std::string EpToString(const btcp::endpoint& ep);
    std::string HexPrefix(const uint8_t* p, size_t n, size_t maxBytes = 32);
    uint64_t NowMs();
}
