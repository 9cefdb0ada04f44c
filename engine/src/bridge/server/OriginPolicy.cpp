#include "OriginPolicy.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace wsgate::bridge
{
    OriginPolicy OriginPolicy::DevelopmentMode()
    {
        OriginPolicy p;
        p.developmentMode_ = true;
        return p;
    }

    OriginPolicy OriginPolicy::AllowList(std::vector<std::string> origins)
    {
        OriginPolicy p;
        for (const auto& o : origins)
        {
            std::string n = Normalize(o);
            if (!n.empty())
                p.origins_.push_back(std::move(n));
        }
        return p;
    }

    std::string OriginPolicy::Normalize(boost::beast::string_view s)
    {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;

        std::string out(s.data() + b, e - b);
        while (!out.empty() && out.back() == '/')
            out.pop_back();

        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string OriginPolicy::HostOfOrigin(const std::string& origin)
    {
        const auto p = origin.find("://");
        if (p == std::string::npos)
            return {};

        std::string rest = origin.substr(p + 3);
        const auto slash = rest.find('/');
        if (slash != std::string::npos)
            rest.resize(slash);
        return rest;
    }

    bool OriginPolicy::Allows(boost::beast::string_view origin, boost::beast::string_view host) const
    {
        if (developmentMode_)
            return true;

        const std::string o = Normalize(origin);
        if (o.empty())
            return true;

        const std::string h = Normalize(host);
        if (!h.empty() && HostOfOrigin(o) == h)
            return true;

        return std::find(origins_.begin(), origins_.end(), o) != origins_.end();
    }

    std::string OriginPolicy::Describe() const
    {
        if (developmentMode_)
            return "development mode (all origins accepted)";

        std::ostringstream oss;
        oss << "allow-list [";
        for (size_t i = 0; i < origins_.size(); i++)
        {
            if (i) oss << ", ";
            oss << origins_[i];
        }
        oss << "] plus same-origin";
        return oss.str();
    }
}
