#pragma once

namespace wsgate::session
{
    enum class BridgePhase
    {
        Established = 0,
        Relaying,
        TearingDown,
        Closed
    };

    inline const char* ToString(BridgePhase p)
    {
        switch (p)
        {
            case BridgePhase::Established: return "established";
            case BridgePhase::Relaying:    return "relaying";
            case BridgePhase::TearingDown: return "tearing-down";
            case BridgePhase::Closed:      return "closed";
            default:                       return "unknown";
        }
    }
}
