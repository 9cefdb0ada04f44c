#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace wsgate::app
{
    class StartupConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ServerConfig
    {
        std::string listenAddr;
        std::string targetAddr;

        bool runOnce = false;
        bool verbose = false;
        bool showHelp = false;

        std::string webDir;

        std::string certFile;
        std::string keyFile;

        std::vector<std::string> allowedOrigins;

        size_t threads = 0;

        // Set when only one of -cert/-key was given; TLS stays off.
        std::string tlsWarning;

        bool StaticEnabled() const { return !webDir.empty(); }
        bool TlsEnabled() const { return !certFile.empty() && !keyFile.empty(); }
    };

    std::string UsageText(const std::string& program);

    // Throws StartupConfigError. With -h the positionals are not required.
    ServerConfig ParseServerConfig(int argc, char** argv);

    std::vector<std::string> SplitList(const std::string& s);
}
