#include "HttpSession.h"

#include "WsTcpBridge.h"

#include <chrono>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace wsgate::bridge
{
    namespace
    {
        constexpr std::chrono::seconds kRequestTimeout{30};

        using TlsStream = bbeast::ssl_stream<bbeast::tcp_stream>;

        template<class Stream>
        constexpr bool kIsTls = std::is_same<Stream, TlsStream>::value;

        template<class Stream>
        class HttpSession : public std::enable_shared_from_this<HttpSession<Stream>>
        {
        public:
            template<class... StreamArgs>
            HttpSession(std::shared_ptr<const GatewayContext> ctx, StreamArgs&&... args)
                : ctx_(std::move(ctx)),
                  stream_(std::forward<StreamArgs>(args)...)
            {
                boost::system::error_code ec;
                const auto ep = bbeast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
                remote_ = ec ? std::string("<unknown>") : EpToString(ep);
            }

            void Run()
            {
                // Start on the connection's strand.
                basio::dispatch(stream_.get_executor(),
                    bbeast::bind_front_handler(&HttpSession::OnRun, this->shared_from_this()));
            }

        private:
            void OnRun()
            {
                bbeast::get_lowest_layer(stream_).expires_after(kRequestTimeout);

                if constexpr (kIsTls<Stream>)
                {
                    stream_.async_handshake(bssl::stream_base::server,
                        bbeast::bind_front_handler(&HttpSession::OnHandshake, this->shared_from_this()));
                }
                else
                {
                    DoRead();
                }
            }

            void OnHandshake(const boost::system::error_code& ec)
            {
                if (ec)
                {
                    LogEcAs(ctx_->log, LogMask::Warn, "tls.handshake", ec);
                    return;
                }

                if constexpr (kIsTls<Stream>)
                    LogTlsInfo(ctx_->log, stream_.native_handle(), "after_tls_handshake");

                DoRead();
            }

            void DoRead()
            {
                req_ = {};
                bbeast::get_lowest_layer(stream_).expires_after(kRequestTimeout);

                bhttp::async_read(stream_, buffer_, req_,
                    bbeast::bind_front_handler(&HttpSession::OnRead, this->shared_from_this()));
            }

            void OnRead(const boost::system::error_code& ec, size_t)
            {
                if (ec == bhttp::error::end_of_stream)
                {
                    DoClose();
                    return;
                }

                if (ec)
                {
                    LogEcAs(ctx_->log, IsBenignClose(ec) ? LogMask::Debug : LogMask::Warn, "http read", ec);
                    return;
                }

                const RouteAction action = ctx_->router.Route(req_, ctx_->lifecycle->IsShuttingDown());

                EmitLogMasked(ctx_->log, LogMask::Trace,
                    Tag() + " request method=" + std::string(req_.method_string()) +
                    " target=" + std::string(req_.target()) +
                    " route=" + ToString(action));

                switch (action)
                {
                case RouteAction::Ignore:
                    Ignore("shutting down");
                    return;

                case RouteAction::ServeStatic:
                    ServeStatic();
                    return;

                case RouteAction::Upgrade:
                    Upgrade();
                    return;
                }
            }

            void Ignore(const char* why)
            {
                EmitLogMasked(ctx_->log, LogMask::Debug,
                    Tag() + " request ignored (" + why + ") target=" + std::string(req_.target()));

                boost::system::error_code ec;
                bbeast::get_lowest_layer(stream_).socket().shutdown(btcp::socket::shutdown_both, ec);
                LogEcAs(ctx_->log, LogMask::Trace, "ignored.shutdown", ec);

                bbeast::get_lowest_layer(stream_).close();
            }

            void ServeStatic()
            {
                EmitLogMasked(ctx_->log, LogMask::Debug,
                    Tag() + " serving file " + std::string(req_.target()));

                res_ = std::make_shared<StaticResponse>(ctx_->files->Respond(req_));
                SendResponse(false);
            }

            void Upgrade()
            {
                if (!ctx_->lifecycle->TryAdmit())
                {
                    Ignore("run once already admitted");
                    return;
                }

                const UpgradeDecision decision = ctx_->upgrader.Evaluate(req_);
                if (!decision.accepted)
                {
                    EmitLogMasked(ctx_->log, LogMask::Error,
                        Tag() + " error upgrading to websocket: " + decision.reason);

                    bhttp::response<bhttp::string_body> res{decision.status, req_.version()};
                    res.set(bhttp::field::server, "wsgate");
                    res.set(bhttp::field::content_type, "text/plain; charset=utf-8");
                    res.keep_alive(false);
                    res.body() = decision.reason + "\n";
                    res.prepare_payload();

                    res_ = std::make_shared<StaticResponse>(std::move(res));
                    SendResponse(true);
                    return;
                }

                // The bridge starts reading from the socket, so anything the client sent
                // before seeing the 101 response is lost. Compliant clients send nothing.
                if (buffer_.size() != 0)
                {
                    EmitLogMasked(ctx_->log, LogMask::Warn,
                        Tag() + " bytes after handshake request discarded len=" + std::to_string(buffer_.size()));
                    buffer_.consume(buffer_.size());
                }

                auto lifecycle = ctx_->lifecycle;
                auto bridge = std::make_shared<WsTcpBridge<Stream>>(
                    std::move(stream_),
                    ctx_,
                    [lifecycle]() { lifecycle->OnSessionClosed(); });

                bridge->Run(std::move(req_), decision);
            }

            // releaseAdmission: the response ends an admitted upgrade attempt.
            void SendResponse(bool releaseAdmission)
            {
                auto self = this->shared_from_this();
                auto res = res_;

                std::visit(
                    [self, res, releaseAdmission](auto& msg)
                    {
                        const bool close = msg.need_eof();

                        bhttp::async_write(self->stream_, msg,
                            [self, res, close, releaseAdmission](const boost::system::error_code& ec, size_t)
                            {
                                self->OnWrite(close, releaseAdmission, ec);
                            });
                    },
                    *res);
            }

            void OnWrite(bool close, bool releaseAdmission, const boost::system::error_code& ec)
            {
                res_.reset();

                if (releaseAdmission)
                    ctx_->lifecycle->OnSessionClosed();

                if (ec)
                {
                    LogEcAs(ctx_->log, IsBenignClose(ec) ? LogMask::Debug : LogMask::Warn, "http write", ec);
                    return;
                }

                if (close || releaseAdmission)
                {
                    DoClose();
                    return;
                }

                DoRead();
            }

            void DoClose()
            {
                if constexpr (kIsTls<Stream>)
                {
                    bbeast::get_lowest_layer(stream_).expires_after(kRequestTimeout);
                    stream_.async_shutdown(
                        bbeast::bind_front_handler(&HttpSession::OnShutdown, this->shared_from_this()));
                }
                else
                {
                    boost::system::error_code ec;
                    stream_.socket().shutdown(btcp::socket::shutdown_send, ec);
                    LogEcAs(ctx_->log, LogMask::Trace, "http.shutdown", ec);
                }
            }

            void OnShutdown(const boost::system::error_code& ec)
            {
                LogEcAs(ctx_->log, LogMask::Trace, "tls.shutdown", ec);
            }

            std::string Tag() const
            {
                return std::string("[http] remote=") + remote_ + " tid=" + Tid();
            }

            std::shared_ptr<const GatewayContext> ctx_;
            Stream stream_;
            bbeast::flat_buffer buffer_;
            HttpRequest req_;
            std::shared_ptr<StaticResponse> res_;
            std::string remote_;
        };
    }

    void LaunchPlainHttpSession(std::shared_ptr<const GatewayContext> ctx, btcp::socket socket)
    {
        std::make_shared<HttpSession<bbeast::tcp_stream>>(std::move(ctx), std::move(socket))->Run();
    }

    void LaunchTlsHttpSession(std::shared_ptr<const GatewayContext> ctx, btcp::socket socket, bssl::context& tls)
    {
        std::make_shared<HttpSession<TlsStream>>(std::move(ctx), std::move(socket), tls)->Run();
    }
}
