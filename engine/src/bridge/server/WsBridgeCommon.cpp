#include "WsBridgeCommon.h"

#include <openssl/x509.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace wsgate::bridge
{
    static std::mutex g_logMu;

    uint32_t ToU32(LogMask m) { return static_cast<uint32_t>(m); }

    std::string Tid()
    {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        return oss.str();
    }

    bool ShouldLog(const BridgeLog& log, LogMask m)
    {
        return (log.mask & ToU32(m)) != 0;
    }

    void EmitLogMasked(const BridgeLog& log, LogMask m, const std::string& s)
    {
        if (!ShouldLog(log, m))
            return;

        if (log.sink)
        {
            log.sink(s);
            return;
        }

        std::lock_guard<std::mutex> lock(g_logMu);
        std::cerr << s << std::endl;
    }

    static std::string X509NameToString(X509_NAME* name)
    {
        if (!name) return "<null>";

        char buf[1024]{};
        ::X509_NAME_oneline(name, buf, static_cast<int>(sizeof(buf)));
        return std::string(buf);
    }

    void LogTlsInfo(const BridgeLog& log, SSL* ssl, const char* where)
    {
        if (!ShouldLog(log, LogMask::Debug))
            return;

        if (!ssl)
        {
            EmitLogMasked(log, LogMask::Debug,
                std::string("[tls] ") + where + " tid=" + Tid() + " ssl=<null>");
            return;
        }

        const char* ver = ::SSL_get_version(ssl);
        const char* cip = ::SSL_get_cipher_name(ssl);

        {
            std::ostringstream oss;
            oss << "[tls] " << where
                << " tid=" << Tid()
                << " tls_version=" << (ver ? ver : "<null>")
                << " cipher=" << (cip ? cip : "<null>");

            EmitLogMasked(log, LogMask::Debug, oss.str());
        }

        // Client certificates are not requested; log one only if a client sent it anyway.
        X509* cert = ::SSL_get_peer_certificate(ssl);
        if (!cert)
            return;

        EmitLogMasked(log, LogMask::Debug,
            std::string("[tls] ") + where + " tid=" + Tid() +
            " peer_subject=" + X509NameToString(::X509_get_subject_name(cert)));

        ::X509_free(cert);
    }

    void DrainOpenSslErrors(const BridgeLog& log, const char* where)
    {
        unsigned long e = 0;
        bool any = false;

        while ((e = ::ERR_get_error()) != 0)
        {
            any = true;

            char buf[256]{};
            ::ERR_error_string_n(e, buf, sizeof(buf));

            std::ostringstream oss;
            oss << "[tls] " << where
                << " tid=" << Tid()
                << " openssl_error=0x" << std::hex << std::uppercase << e
                << " text=" << buf;

            EmitLogMasked(log, LogMask::Error, oss.str());
        }

        if (!any)
        {
            EmitLogMasked(log, LogMask::Trace,
                std::string("[tls] ") + where + " tid=" + Tid() + " openssl_error_queue=<empty>");
        }
    }

    void LogEcAs(const BridgeLog& log, LogMask m, const char* where, const boost::system::error_code& ec)
    {
        if (!ec) return;

        std::ostringstream oss;
        oss << "[wsgate] " << where
            << " tid=" << Tid()
            << " ec=" << ec.value()
            << " category=" << ec.category().name()
            << " message=" << ec.message();

        EmitLogMasked(log, m, oss.str());

        if (m == LogMask::Error && ec.category() == basio::error::get_ssl_category())
            DrainOpenSslErrors(log, where);
    }

    void LogEc(const BridgeLog& log, const char* where, const boost::system::error_code& ec)
    {
        LogEcAs(log, LogMask::Error, where, ec);
    }

    bool IsBenignClose(const boost::system::error_code& ec)
    {
        return ec == basio::error::eof
            || ec == bws::error::closed
            || ec == basio::error::operation_aborted
            || ec == bssl::error::stream_truncated;
    }

    bool TrySplitHostPort(const std::string& addr, HostPort& out, std::string& outError)
    {
        std::string host;
        std::string port;

        if (!addr.empty() && addr.front() == '[')
        {
            const auto close = addr.find(']');
            if (close == std::string::npos)
            {
                outError = "missing ']' in address " + addr;
                return false;
            }
            if (close + 1 >= addr.size() || addr[close + 1] != ':')
            {
                outError = "missing port in address " + addr;
                return false;
            }

            host = addr.substr(1, close - 1);
            port = addr.substr(close + 2);
        }
        else
        {
            const auto colon = addr.rfind(':');
            if (colon == std::string::npos)
            {
                outError = "missing port in address " + addr;
                return false;
            }
            if (addr.find(':') != colon)
            {
                outError = "too many colons in address " + addr;
                return false;
            }

            host = addr.substr(0, colon);
            port = addr.substr(colon + 1);
        }

        if (port.empty())
        {
            outError = "missing port in address " + addr;
            return false;
        }

        const bool numeric = std::all_of(port.begin(), port.end(),
            [](unsigned char c) { return std::isdigit(c) != 0; });

        if (numeric && (port.size() > 5 || std::stoul(port) > 65535))
        {
            outError = "invalid port in address " + addr;
            return false;
        }

        out.host = std::move(host);
        out.port = std::move(port);
        return true;
    }

    std::string EpToString(const btcp::endpoint& ep)
    {
        std::ostringstream oss;
        if (ep.address().is_v6())
            oss << "[" << ep.address().to_string() << "]:" << ep.port();
        else
            oss << ep.address().to_string() << ":" << ep.port();
        return oss.str();
    }

    std::string HexPrefix(const uint8_t* p, size_t n, size_t maxBytes)
    {
        const size_t m = std::min(n, maxBytes);

        std::ostringstream oss;
        oss << "len=" << n << " hex=";

        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < m; i++)
        {
            oss << std::setw(2) << static_cast<unsigned>(p[i]);
            if (i + 1 < m) oss << " ";
        }

        if (m < n) oss << " (+more)";
        return oss.str();
    }

    uint64_t NowMs()
    {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now().time_since_epoch()
            ).count()
        );
    }
}
