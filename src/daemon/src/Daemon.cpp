/*
 * GPU Fan Control — Daemon (implementation)
 * (c) 2025 GpuFanControl contributors
 */
#include "include/Daemon.hpp"
#include "include/Errors.hpp"
#include "include/Log.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace gfc {

Daemon::Daemon(std::unique_ptr<FanBackend> backend, Logger& log)
: backend_(std::move(backend)),
  log_(log)
{
    LOG_TRACE(log_, "daemon: ctor");
}

Daemon::~Daemon() {
    LOG_TRACE(log_, "daemon: dtor");
    shutdown();
}

void Daemon::init(const DaemonOptions& opts) {
    LOG_INFO(log_, "daemon: init start (config=%s)", opts.configPath.c_str());
    opts_ = opts;

    cfg_ = loadFanConfig(opts_.configPath, log_);
    if (opts_.curve) {
        LOG_INFO(log_, "daemon: curve mode forced from command line");
        cfg_.curve = true;
    }

    if (!backend_) {
        throw HardwareError("no hardware backend available");
    }
    HwStatus st = backend_->init();
    if (!st.ok()) {
        throw HardwareError(st.message);
    }
    backendUp_ = true;

    gameMode_ = std::make_unique<GameModeFlag>(opts_.gameModePath);
    LOG_DEBUG(log_, "daemon: game mode flag at %s (currently %s)",
              gameMode_->path().c_str(), gameMode_->active() ? "on" : "off");

    driver_ = std::make_unique<TickDriver>(*backend_, log_, gameMode_.get());
    driver_->initialize();
    driver_->configure(cfg_);

    LOG_INFO(log_, "daemon: init done (policy=%s interval=%ds)",
             toString(driver_->policy()), cfg_.timeToUpdate);
}

bool Daemon::hasWork() const {
    return driver_ && driver_->hasControllableFans();
}

void Daemon::tickOnce() {
    if (driver_) driver_->tick();
}

void Daemon::runLoop() {
    LOG_INFO(log_, "Starting monitoring loop...");
    using clock = std::chrono::steady_clock;

    constexpr int kSleepSliceMs = 200;   // keeps stop requests responsive
    const auto interval = std::chrono::seconds(cfg_.timeToUpdate > 0 ? cfg_.timeToUpdate
                                                                     : kDefaultTimeToUpdateSec);
    auto nextTick = clock::now() + interval;

    while (!stop_.load(std::memory_order_relaxed)) {
        auto now = clock::now();
        if (now >= nextTick) {
            tickOnce();
            nextTick += interval;
            // A stalled hardware call may leave us behind; start late, never burst.
            if (nextTick < now) nextTick = now + interval;
            continue;
        }

        auto sleepMs = std::chrono::duration_cast<std::chrono::milliseconds>(nextTick - now).count();
        if (sleepMs > kSleepSliceMs) sleepMs = kSleepSliceMs;
        if (sleepMs < 1) sleepMs = 1;
        std::this_thread::sleep_for(std::chrono::milliseconds(sleepMs));
    }

    LOG_INFO(log_, "Monitoring loop stopped.");
}

void Daemon::shutdown() {
    if (!backendUp_) return;
    LOG_INFO(log_, "daemon: shutdown");
    backendUp_ = false;
    driver_.reset();
    if (backend_) backend_->shutdown();
    LOG_INFO(log_, "daemon: shutdown complete");
}

} // namespace gfc
