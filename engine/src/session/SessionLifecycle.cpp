#include "SessionLifecycle.h"

#include <string>
#include <utility>

namespace wsgate::session
{
    using bridge::EmitLogMasked;
    using bridge::LogMask;
    using bridge::Tid;

    SessionLifecycle::SessionLifecycle(bool runOnce, bridge::BridgeLog log)
        : runOnce_(runOnce),
          log_(std::move(log))
    {
    }

    void SessionLifecycle::SetExitCallback(ExitCallback cb)
    {
        std::lock_guard<std::mutex> lock(cbMtx_);
        onExit_ = std::move(cb);
    }

    bool SessionLifecycle::IsShuttingDown() const
    {
        return shuttingDown_.load();
    }

    bool SessionLifecycle::TryAdmit()
    {
        if (runOnce_)
        {
            bool expected = false;
            if (!shuttingDown_.compare_exchange_strong(expected, true))
            {
                EmitLogMasked(log_, LogMask::Debug,
                    std::string("[lifecycle] admission refused (run once already admitted) tid=") + Tid());
                return false;
            }
        }

        admitted_.fetch_add(1);
        const uint64_t active = active_.fetch_add(1) + 1;

        EmitLogMasked(log_, LogMask::Debug,
            std::string("[lifecycle] session admitted tid=") + Tid() +
            " activeSessions=" + std::to_string(active));
        return true;
    }

    void SessionLifecycle::OnSessionClosed()
    {
        const uint64_t active = active_.fetch_sub(1) - 1;

        EmitLogMasked(log_, LogMask::Debug,
            std::string("[lifecycle] session closed tid=") + Tid() +
            " activeSessions=" + std::to_string(active));

        if (!runOnce_ || exitFired_.exchange(true))
            return;

        EmitLogMasked(log_, LogMask::Info, "[lifecycle] run once, exiting");

        ExitCallback cb;
        {
            std::lock_guard<std::mutex> lock(cbMtx_);
            cb = onExit_;
        }

        if (cb)
            cb();
    }

    uint64_t SessionLifecycle::ActiveSessions() const
    {
        return active_.load();
    }

    uint64_t SessionLifecycle::AdmittedSessions() const
    {
        return admitted_.load();
    }
}
