#pragma once

#include "OriginPolicy.h"
#include "WsBridgeCommon.h"

#include <cstddef>
#include <string>

namespace wsgate::bridge
{
    struct UpgradeDecision
    {
        bool accepted = false;
        bhttp::status status = bhttp::status::ok;
        std::string reason;

        // Empty when the client did not offer the supported subprotocol.
        std::string subprotocol;
    };

    class WsUpgrader
    {
    public:
        // websockify convention, understood by noVNC and most browser bridging clients.
        static constexpr const char* kSubprotocol = "binary";

        static constexpr size_t kReadMessageMax = 16 * 1024 * 1024;

        explicit WsUpgrader(OriginPolicy origins);

        UpgradeDecision Evaluate(const HttpRequest& req) const;

        const OriginPolicy& Origins() const { return origins_; }

        static bool OffersSubprotocol(bbeast::string_view header, bbeast::string_view proto);

        template<class NextLayer>
        void Prepare(bws::stream<NextLayer>& ws, const UpgradeDecision& d) const
        {
            // The HTTP read timer must not carry over into the relay.
            bbeast::get_lowest_layer(ws).expires_never();

            ws.set_option(bws::stream_base::timeout::suggested(bbeast::role_type::server));
            ws.read_message_max(kReadMessageMax);
            ws.binary(true);

            ws.set_option(bws::stream_base::decorator(
                [proto = d.subprotocol](bws::response_type& res)
                {
                    res.set(bhttp::field::server, "wsgate");
                    if (!proto.empty())
                        res.set(bhttp::field::sec_websocket_protocol, proto);
                }));
        }

    private:
        OriginPolicy origins_;
    };
}
