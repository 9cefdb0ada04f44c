#pragma once

#include "GatewayContext.h"
#include "WsBridgeCommon.h"
#include "session/SessionLifecycle.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wsgate::bridge
{
    class GatewayServer
    {
    public:
        struct Options
        {
            std::string listenAddr;
            std::string targetAddr;

            // Empty: static file serving disabled.
            std::string webDir;

            // Both set: TLS.
            std::string certFile;
            std::string keyFile;

            // Empty: development origin mode.
            std::vector<std::string> allowedOrigins;

            size_t threads = 2;

            // SIGINT/SIGTERM request a stop.
            bool handleSignals = false;

            BridgeLog log;
        };

        GatewayServer(Options opt, std::shared_ptr<session::SessionLifecycle> lifecycle);
        ~GatewayServer();

        GatewayServer(const GatewayServer&) = delete;
        GatewayServer& operator=(const GatewayServer&) = delete;

        // Binds the listener and starts the I/O threads. False (with outError) on any setup failure.
        bool Start(std::string& outError);

        // Safe from any thread, including I/O handlers.
        void RequestStop();

        // Blocks until the I/O threads exit.
        void Wait();

        void Stop();

        bool IsStarted() const;
        bool IsTls() const;

        std::string ListenIp() const;
        uint16_t ListenPort() const;

    private:
        void DoAccept();
        bool SetupTls(std::string& outError);

        Options opt_;
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };
}
