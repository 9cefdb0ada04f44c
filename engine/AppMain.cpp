// AppMain.cpp
#include "AppMain.h"

#include "src/app/ConsoleLog.h"
#include "src/app/ServerConfig.h"
#include "src/bridge/server/GatewayServer.h"
#include "src/bridge/server/WsBridgeCommon.h"
#include "src/session/SessionLifecycle.h"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace
{
    wsgate::bridge::BridgeLog MakeConsoleLog(bool verbose)
    {
        wsgate::bridge::BridgeLog log;
        log.sink = [](const std::string& line) { wsgate::app::ConsoleLog::Write(line); };
        log.mask = verbose
            ? wsgate::bridge::ToU32(wsgate::bridge::LogMask::Verbose)
            : wsgate::bridge::ToU32(wsgate::bridge::LogMask::Default);
        return log;
    }

    std::string Join(const std::vector<std::string>& items)
    {
        std::string out;
        for (const auto& s : items)
        {
            if (!out.empty())
                out += ",";
            out += s;
        }
        return out;
    }
}

// -------------------- AppMain --------------------

int AppMain::Run(int argc, char** argv)
{
    using namespace wsgate;

    const app::ServerConfig cfg = app::ParseServerConfig(argc, argv);

    if (cfg.showHelp)
    {
        std::cout << app::UsageText((argc > 0 && argv[0]) ? argv[0] : "wsgate");
        return 0;
    }

    const bridge::BridgeLog log = MakeConsoleLog(cfg.verbose);

    if (!cfg.tlsWarning.empty())
        bridge::EmitLogMasked(log, bridge::LogMask::Warn, "[app] " + cfg.tlsWarning);

    {
        std::ostringstream oss;
        oss << "[app] settings"
            << " listen=" << cfg.listenAddr
            << " target=" << cfg.targetAddr
            << " tls=" << (cfg.TlsEnabled() ? "on" : "off")
            << " web=" << (cfg.StaticEnabled() ? cfg.webDir : std::string("<off>"))
            << " run_once=" << (cfg.runOnce ? "true" : "false")
            << " origins=" << (cfg.allowedOrigins.empty() ? std::string("<any>") : Join(cfg.allowedOrigins))
            << " threads=" << cfg.threads;
        bridge::EmitLogMasked(log, bridge::LogMask::Info, oss.str());
    }

    auto lifecycle = std::make_shared<session::SessionLifecycle>(cfg.runOnce, log);

    bridge::GatewayServer::Options opt;
    opt.listenAddr = cfg.listenAddr;
    opt.targetAddr = cfg.targetAddr;
    opt.webDir = cfg.webDir;
    opt.certFile = cfg.certFile;
    opt.keyFile = cfg.keyFile;
    opt.allowedOrigins = cfg.allowedOrigins;
    opt.threads = cfg.threads;
    opt.handleSignals = true;
    opt.log = log;

    bridge::GatewayServer server(opt, lifecycle);

    lifecycle->SetExitCallback([&server] { server.RequestStop(); });

    std::string err;
    if (!server.Start(err))
    {
        bridge::EmitLogMasked(log, bridge::LogMask::Error, "[app] " + err);
        return 1;
    }

    server.Wait();
    server.Stop();

    bridge::EmitLogMasked(log, bridge::LogMask::Info,
        "[app] stopped sessions=" + std::to_string(lifecycle->AdmittedSessions()));
    return 0;
}
