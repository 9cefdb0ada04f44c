#pragma once

#include <string>
#include <vector>

#include <boost/beast/core/string.hpp>

namespace wsgate::bridge
{
    class OriginPolicy
    {
    public:
        // Every origin accepted. Only for trusted networks and local development.
        static OriginPolicy DevelopmentMode();

        static OriginPolicy AllowList(std::vector<std::string> origins);

        bool IsDevelopmentMode() const { return developmentMode_; }
        const std::vector<std::string>& Origins() const { return origins_; }

        // In allow-list mode a missing Origin and a same-origin request are always accepted.
        bool Allows(boost::beast::string_view origin, boost::beast::string_view host) const;

        std::string Describe() const;

    private:
        OriginPolicy() = default;

        static std::string Normalize(boost::beast::string_view s);
        static std::string HostOfOrigin(const std::string& origin);

        bool developmentMode_ = false;
        std::vector<std::string> origins_;
    };
}
