/*
 * GPU Fan Control — Daemon (header)
 * - Orchestrates config load, backend init, device enumeration and the tick loop
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "Config.hpp"
#include "FanBackend.hpp"
#include "GameMode.hpp"
#include "TickDriver.hpp"

namespace gfc {

class Logger;

class Daemon {
public:
    Daemon(std::unique_ptr<FanBackend> backend, Logger& log);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /*
     * Load config, apply the -curve override, initialize the backend and
     * enumerate devices. Throws ConfigError or HardwareError (both fatal).
     */
    void init(const DaemonOptions& opts);

    /* False when no device has a controllable fan; the caller exits 0. */
    bool hasWork() const;

    /* Sleep time_to_update seconds, tick, repeat until requestStop(). */
    void runLoop();

    /* One tick without sleeping. */
    void tickOnce();

    void requestStop() { stop_.store(true, std::memory_order_relaxed); }
    bool stopRequested() const noexcept { return stop_.load(std::memory_order_relaxed); }

    /* Release the backend (idempotent). */
    void shutdown();

    const FanConfig&     config() const noexcept { return cfg_; }
    const DaemonOptions& options() const noexcept { return opts_; }
    const TickDriver*    driver() const noexcept { return driver_.get(); }

private:
    std::unique_ptr<FanBackend>   backend_;
    Logger&                       log_;

    DaemonOptions                 opts_{};
    FanConfig                     cfg_{};
    std::unique_ptr<GameModeFlag> gameMode_;
    std::unique_ptr<TickDriver>   driver_;

    std::atomic<bool> stop_{false};
    bool              backendUp_{false};
};

} // namespace gfc
