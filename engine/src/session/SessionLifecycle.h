#pragma once

#include "bridge/server/WsBridgeCommon.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

namespace wsgate::session
{
    // Single-admission guard for run-once mode. Shared by every request handler.
    class SessionLifecycle
    {
    public:
        using ExitCallback = std::function<void()>;

        SessionLifecycle(bool runOnce, bridge::BridgeLog log);

        SessionLifecycle(const SessionLifecycle&) = delete;
        SessionLifecycle& operator=(const SessionLifecycle&) = delete;

        void SetExitCallback(ExitCallback cb);

        bool RunOnce() const { return runOnce_; }

        // True once the single run-once session has been admitted.
        bool IsShuttingDown() const;

        // Run-once: atomic false->true transition of the shutdown flag, true for the
        // caller that performed it. Otherwise always true.
        bool TryAdmit();

        // Called exactly once for every successful TryAdmit, whatever way the attempt ended.
        void OnSessionClosed();

        uint64_t ActiveSessions() const;
        uint64_t AdmittedSessions() const;

    private:
        const bool runOnce_;
        bridge::BridgeLog log_;

        std::atomic<bool> shuttingDown_{false};
        std::atomic<bool> exitFired_{false};

        std::atomic<uint64_t> active_{0};
        std::atomic<uint64_t> admitted_{0};

        mutable std::mutex cbMtx_;
        ExitCallback onExit_;
    };
}
