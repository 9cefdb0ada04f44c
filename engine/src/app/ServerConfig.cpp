#include "ServerConfig.h"

#include "ArgParser.h"
#include "bridge/server/WsBridgeCommon.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <thread>

namespace wsgate::app
{
    std::string UsageText(const std::string& program)
    {
        std::ostringstream oss;
        oss << "Usage: " << program << " [options] <listen_addr> <target_addr>\n"
            << "\n"
            << "Bridges WebSocket clients on <listen_addr> to the TCP service at <target_addr>.\n"
            << "Addresses are host:port, [v6]:port or :port.\n"
            << "\n"
            << "Options:\n"
            << "  -h              print this help and exit\n"
            << "  -v              enable verbose logging\n"
            << "  -cert FILE      SSL certificate file (PEM chain), requires -key\n"
            << "  -key FILE       SSL private key file (PEM), requires -cert\n"
            << "  -web DIR        serve files from DIR for non-WebSocket requests\n"
            << "  -run-once       handle a single WebSocket connection and exit\n"
            << "  -origin LIST    comma-separated allowed WebSocket origins\n"
            << "                  (default: development mode, every origin accepted)\n"
            << "  -threads N      I/O threads (default: number of CPUs, at least 2)\n";
        return oss.str();
    }

    std::vector<std::string> SplitList(const std::string& s)
    {
        std::vector<std::string> out;
        std::string cur;
        std::istringstream iss(s);

        while (std::getline(iss, cur, ','))
        {
            const auto b = cur.find_first_not_of(" \t");
            if (b == std::string::npos)
                continue;
            const auto e = cur.find_last_not_of(" \t");
            out.push_back(cur.substr(b, e - b + 1));
        }
        return out;
    }

    static size_t ParseThreads(const std::string& s)
    {
        if (s.empty() || s.size() > 3 || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
            throw StartupConfigError("invalid value \"" + s + "\" for flag -threads");

        const unsigned long n = std::stoul(s);
        if (n == 0 || n > 256)
            throw StartupConfigError("-threads must be between 1 and 256");
        return static_cast<size_t>(n);
    }

    ServerConfig ParseServerConfig(int argc, char** argv)
    {
        const std::string program = (argc > 0 && argv[0]) ? argv[0] : "wsgate";

        const ArgParser parser(
            {"h", "help", "v", "run-once"},
            {"cert", "key", "web", "origin", "threads"});

        ParsedArgs args;
        std::string err;
        if (!parser.Parse(argc, argv, args, err))
            throw StartupConfigError(err + "\n" + UsageText(program));

        ServerConfig cfg;
        cfg.showHelp = args.Has("h") || args.Has("help");
        cfg.verbose = args.Has("v");
        cfg.runOnce = args.Has("run-once");

        if (cfg.showHelp)
            return cfg;

        if (args.positionals.size() < 2 || args.positionals[0].empty() || args.positionals[1].empty())
            throw StartupConfigError("Usage: " + program + " <listen_addr> <target_addr> [options]");

        if (args.positionals.size() > 2)
            throw StartupConfigError("unexpected argument: " + args.positionals[2]);

        cfg.listenAddr = args.positionals[0];
        cfg.targetAddr = args.positionals[1];

        bridge::HostPort hp;
        if (!bridge::TrySplitHostPort(cfg.listenAddr, hp, err))
            throw StartupConfigError("listen address: " + err);
        if (!bridge::TrySplitHostPort(cfg.targetAddr, hp, err))
            throw StartupConfigError("target address: " + err);

        cfg.certFile = args.GetValue("cert");
        cfg.keyFile = args.GetValue("key");
        if (cfg.certFile.empty() != cfg.keyFile.empty())
        {
            cfg.tlsWarning = "both -cert and -key are required for TLS, serving plain HTTP";
            cfg.certFile.clear();
            cfg.keyFile.clear();
        }

        cfg.webDir = args.GetValue("web");
        if (!cfg.webDir.empty())
        {
            std::error_code ec;
            if (!std::filesystem::is_directory(cfg.webDir, ec))
                throw StartupConfigError("-web: not a directory: " + cfg.webDir);
        }

        if (args.Has("origin"))
        {
            cfg.allowedOrigins = SplitList(args.GetValue("origin"));
            if (cfg.allowedOrigins.empty())
                throw StartupConfigError("-origin: empty origin list");
        }

        if (args.Has("threads"))
            cfg.threads = ParseThreads(args.GetValue("threads"));
        else
            cfg.threads = std::max<size_t>(2, std::thread::hardware_concurrency());

        return cfg;
    }
}
