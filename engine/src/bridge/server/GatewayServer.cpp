#include "GatewayServer.h"

#include "HttpSession.h"

#include <algorithm>
#include <csignal>
#include <optional>
#include <sstream>
#include <thread>
#include <utility>

namespace wsgate::bridge
{
    struct GatewayServer::Impl
    {
        std::shared_ptr<session::SessionLifecycle> lifecycle;
        std::shared_ptr<const GatewayContext> ctx;

        bssl::context tls{bssl::context::tls_server};
        bool tlsEnabled = false;

        basio::io_context ioc;

        using WorkGuard = basio::executor_work_guard<basio::io_context::executor_type>;
        std::optional<WorkGuard> work{ basio::make_work_guard(ioc) };

        btcp::acceptor acceptor{ioc};
        btcp::endpoint bound;

        std::optional<basio::signal_set> signals;

        std::vector<std::thread> workers;

        std::atomic<bool> started{false};
        std::atomic<bool> stopped{false};
    };

    GatewayServer::GatewayServer(Options opt, std::shared_ptr<session::SessionLifecycle> lifecycle)
        : opt_(std::move(opt)),
          impl_(std::make_unique<Impl>())
    {
        impl_->lifecycle = std::move(lifecycle);
    }

    GatewayServer::~GatewayServer()
    {
        Stop();
    }

    bool GatewayServer::IsStarted() const
    {
        return impl_->started.load();
    }

    bool GatewayServer::IsTls() const
    {
        return impl_->tlsEnabled;
    }

    std::string GatewayServer::ListenIp() const
    {
        return impl_->bound.address().to_string();
    }

    uint16_t GatewayServer::ListenPort() const
    {
        return impl_->bound.port();
    }

    bool GatewayServer::SetupTls(std::string& outError)
    {
        if (opt_.certFile.empty() || opt_.keyFile.empty())
            return true;

        boost::system::error_code ec;

        impl_->tls.set_options(
            bssl::context::default_workarounds |
            bssl::context::no_sslv2 |
            bssl::context::no_sslv3 |
            bssl::context::single_dh_use, ec);
        LogEc(opt_.log, "tls.set_options", ec);

        impl_->tls.use_certificate_chain_file(opt_.certFile, ec);
        LogEc(opt_.log, "tls.use_certificate_chain_file", ec);
        if (ec)
        {
            outError = "cannot load certificate " + opt_.certFile + ": " + ec.message();
            return false;
        }

        impl_->tls.use_private_key_file(opt_.keyFile, bssl::context::pem, ec);
        LogEc(opt_.log, "tls.use_private_key_file", ec);
        if (ec)
        {
            outError = "cannot load private key " + opt_.keyFile + ": " + ec.message();
            return false;
        }

        impl_->tlsEnabled = true;
        return true;
    }

    bool GatewayServer::Start(std::string& outError)
    {
        bool expected = false;
        if (!impl_->started.compare_exchange_strong(expected, true))
        {
            outError = "already started";
            return false;
        }

        const auto fail = [this, &outError](const std::string& what)
        {
            outError = what;
            impl_->started.store(false);
            return false;
        };

        HostPort listen;
        HostPort target;
        std::string err;

        if (!TrySplitHostPort(opt_.listenAddr, listen, err))
            return fail("listen address: " + err);

        if (!TrySplitHostPort(opt_.targetAddr, target, err))
            return fail("target address: " + err);

        if (!SetupTls(err))
            return fail(err);

        {
            auto ctx = std::make_shared<GatewayContext>(GatewayContext{
                RequestRouter(!opt_.webDir.empty()),
                WsUpgrader(opt_.allowedOrigins.empty()
                    ? OriginPolicy::DevelopmentMode()
                    : OriginPolicy::AllowList(opt_.allowedOrigins)),
                TcpDialer(target, opt_.log),
                std::nullopt,
                impl_->lifecycle,
                opt_.log});

            if (!opt_.webDir.empty())
                ctx->files.emplace(opt_.webDir, opt_.log);

            if (ctx->upgrader.Origins().IsDevelopmentMode())
            {
                EmitLogMasked(opt_.log, LogMask::Warn,
                    "[gateway] origin check disabled: development mode, every origin is accepted (use -origin to restrict)");
            }

            impl_->ctx = std::move(ctx);
        }

        boost::system::error_code ec;

        btcp::resolver resolver(impl_->ioc);
        const std::string host = listen.host.empty() ? std::string("0.0.0.0") : listen.host;
        const auto results = resolver.resolve(host, listen.port, btcp::resolver::passive, ec);
        LogEc(opt_.log, "listen.resolve", ec);
        if (ec) return fail("resolve " + opt_.listenAddr + ": " + ec.message());
        if (results.empty()) return fail("resolve " + opt_.listenAddr + ": no addresses");

        const btcp::endpoint ep = results.begin()->endpoint();

        impl_->acceptor.open(ep.protocol(), ec);
        LogEc(opt_.log, "acceptor.open", ec);
        if (ec) return fail("listen " + opt_.listenAddr + ": " + ec.message());

        impl_->acceptor.set_option(basio::socket_base::reuse_address(true), ec);
        LogEcAs(opt_.log, LogMask::Warn, "acceptor.reuse_address", ec);

        impl_->acceptor.bind(ep, ec);
        LogEc(opt_.log, "acceptor.bind", ec);
        if (ec) return fail("listen " + opt_.listenAddr + ": " + ec.message());

        impl_->acceptor.listen(basio::socket_base::max_listen_connections, ec);
        LogEc(opt_.log, "acceptor.listen", ec);
        if (ec) return fail("listen " + opt_.listenAddr + ": " + ec.message());

        impl_->bound = impl_->acceptor.local_endpoint(ec);
        LogEcAs(opt_.log, LogMask::Warn, "acceptor.local_endpoint", ec);

        DoAccept();

        if (opt_.handleSignals)
        {
            impl_->signals.emplace(impl_->ioc, SIGINT, SIGTERM);
            impl_->signals->async_wait(
                [this](const boost::system::error_code& sec, int signo)
                {
                    if (sec)
                        return;

                    EmitLogMasked(opt_.log, LogMask::Info,
                        "[gateway] signal " + std::to_string(signo) + " received, stopping");
                    RequestStop();
                });
        }

        const size_t threads = std::max<size_t>(1, opt_.threads);
        for (size_t i = 0; i < threads; i++)
        {
            impl_->workers.emplace_back([this]
            {
                EmitLogMasked(opt_.log, LogMask::Trace, std::string("[gateway] io_context.run BEGIN tid=") + Tid());

                try
                {
                    impl_->ioc.run();
                }
                catch (const std::exception& e)
                {
                    EmitLogMasked(opt_.log, LogMask::Error,
                        std::string("[gateway] ioc.run exception tid=") + Tid() + " what=" + e.what());
                    DrainOpenSslErrors(opt_.log, "ioc.run exception");
                    RequestStop();
                }

                EmitLogMasked(opt_.log, LogMask::Trace, std::string("[gateway] io_context.run END tid=") + Tid());
            });
        }

        {
            std::ostringstream oss;
            oss << "[gateway] starting " << (impl_->tlsEnabled ? "secure websocket server (wss://)" : "websocket server (ws://)")
                << " on " << EpToString(impl_->bound)
                << " threads=" << threads;
            EmitLogMasked(opt_.log, LogMask::Info, oss.str());
        }

        return true;
    }

    void GatewayServer::DoAccept()
    {
        impl_->acceptor.async_accept(
            basio::make_strand(impl_->ioc),
            [this](const boost::system::error_code& ec, btcp::socket socket)
            {
                if (impl_->stopped.load())
                    return;

                if (ec)
                {
                    if (ec != basio::error::operation_aborted)
                        LogEc(opt_.log, "accept", ec);
                }
                else
                {
                    if (ShouldLog(opt_.log, LogMask::Trace))
                    {
                        boost::system::error_code rec;
                        const auto remote = socket.remote_endpoint(rec);
                        EmitLogMasked(opt_.log, LogMask::Trace,
                            std::string("[gateway] accepted tid=") + Tid() +
                            " remote=" + (rec ? std::string("<unknown>") : EpToString(remote)));
                    }

                    if (impl_->tlsEnabled)
                        LaunchTlsHttpSession(impl_->ctx, std::move(socket), impl_->tls);
                    else
                        LaunchPlainHttpSession(impl_->ctx, std::move(socket));
                }

                if (!impl_->stopped.load() && impl_->acceptor.is_open())
                    DoAccept();
            });
    }

    void GatewayServer::RequestStop()
    {
        if (impl_->stopped.exchange(true))
            return;

        EmitLogMasked(opt_.log, LogMask::Debug,
            std::string("[gateway] stop requested tid=") + Tid() +
            " activeSessions=" + std::to_string(impl_->lifecycle ? impl_->lifecycle->ActiveSessions() : 0));

        impl_->work.reset();
        impl_->ioc.stop();
    }

    void GatewayServer::Wait()
    {
        for (auto& t : impl_->workers)
        {
            if (t.joinable())
                t.join();
        }
        impl_->workers.clear();
    }

    void GatewayServer::Stop()
    {
        RequestStop();
        Wait();

        boost::system::error_code ec;
        if (impl_->acceptor.is_open())
        {
            impl_->acceptor.close(ec);
            LogEcAs(opt_.log, LogMask::Trace, "acceptor.close", ec);
        }

        impl_->started.store(false);
    }
}
