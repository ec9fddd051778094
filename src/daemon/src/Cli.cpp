/*
 * GPU Fan Control — Command line front-end (implementation)
 * (c) 2025 GpuFanControl contributors
 *
 * Notes:
 * - Arguments are validated completely before the backend is created.
 * - One-shot commands are quiet unless -v; their logs then go to stderr so
 *   stdout stays machine-readable.
 * - The daemon logs to its file only.
 */

#include "include/Cli.hpp"
#include "include/Config.hpp"
#include "include/Daemon.hpp"
#include "include/Errors.hpp"
#include "include/GameMode.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"
#include "include/Version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <ostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace gfc {

static std::atomic<bool> gStop{false};
static void sig_handler(int) { gStop.store(true); }

static void install_signals() {
    std::signal(SIGINT,  sig_handler);
    std::signal(SIGTERM, sig_handler);
#ifdef SIGHUP
    std::signal(SIGHUP,  sig_handler);
#endif
}

void printUsage(std::ostream& os) {
    os <<
        "GPU fan control (gpufanctl) " << GFC_VERSION << "\n"
        "Usage:\n"
        "  gpufanctl daemon   [-config PATH] [-log PATH] [-curve] [-debug] [-gamemode-file PATH]\n"
        "  gpufanctl status   [-gpu N] [-v]\n"
        "  gpufanctl set      [-gpu N] [-fans \"0,1\"] -speed PERCENT [-v]\n"
        "  gpufanctl auto     [-gpu N] [-fans \"0,1\"] [-v]\n"
        "  gpufanctl gamemode {on|off|status} [-file PATH]\n"
        "  gpufanctl help\n"
        "\n"
        "daemon:\n"
        "  - reads config.json from the current directory (env GFC_CONFIG)\n"
        "  - logs to /var/log/gpufanctl.log (env GFC_LOGFILE)\n"
        "\n"
        "Curve mode (daemon only):\n"
        "  - the range with the lowest min_temperature is the floor:\n"
        "      temps < floor.max_temperature => firmware AUTO control\n"
        "  - the other ranges are setpoints at their min_temperature\n"
        "  - speeds are interpolated between setpoints, clamped at floor and ceiling\n"
        "  - while game mode is on, fans never fall back to AUTO\n";
}

/* ----------------------------------------------------------------------------
 * FlagSet
 * ----------------------------------------------------------------------------*/

FlagSet::FlagSet(std::string command)
    : command_(std::move(command)) {}

void FlagSet::addInt(const std::string& name, int* target) {
    flags_[name] = Flag{false, [this, name, target](const std::string& value) {
        auto v = util::parse_int(value);
        if (!v) {
            throw ValidationError(command_ + ": invalid value \"" + value + "\" for flag -" + name);
        }
        *target = *v;
    }};
}

void FlagSet::addString(const std::string& name, std::string* target) {
    flags_[name] = Flag{false, [target](const std::string& value) { *target = value; }};
}

void FlagSet::addBool(const std::string& name, bool* target) {
    flags_[name] = Flag{true, [this, name, target](const std::string& value) {
        if (value == "true" || value == "1") {
            *target = true;
        } else if (value == "false" || value == "0") {
            *target = false;
        } else {
            throw ValidationError(command_ + ": invalid boolean value \"" + value + "\" for flag -" + name);
        }
    }};
}

void FlagSet::parse(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a.size() < 2 || a[0] != '-') {
            positional_.push_back(a);
            continue;
        }

        std::string name = a.substr(a[1] == '-' ? 2 : 1);
        if (name.empty()) {
            throw ValidationError(command_ + ": bad flag syntax: " + a);
        }

        std::string value;
        bool hasValue = false;
        if (auto eq = name.find('='); eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            hasValue = true;
        }

        if (name == "h" || name == "help") {
            help_ = true;
            continue;
        }

        auto it = flags_.find(name);
        if (it == flags_.end()) {
            throw ValidationError(command_ + ": flag provided but not defined: -" + name);
        }

        if (it->second.isBool) {
            it->second.set(hasValue ? value : std::string("true"));
            seen_[name] = true;
            continue;
        }

        if (!hasValue) {
            if (i + 1 >= args.size()) {
                throw ValidationError(command_ + ": flag needs an argument: -" + name);
            }
            value = args[++i];
        }
        it->second.set(value);
        seen_[name] = true;
    }
}

/* ----------------------------------------------------------------------------
 * Argument helpers
 * ----------------------------------------------------------------------------*/

std::vector<int> parseFanList(const std::string& s) {
    const std::string trimmed = util::trim(s);
    if (trimmed.empty()) {
        throw ValidationError("fans list is empty");
    }

    std::vector<int> out;
    for (const auto& raw : util::split(trimmed, ',')) {
        const std::string item = util::trim(raw);
        if (item.empty()) continue;
        auto n = util::parse_int(item);
        if (!n) {
            throw ValidationError("invalid fan index \"" + item + "\"");
        }
        if (*n < 0) {
            throw ValidationError("invalid fan index " + std::to_string(*n) + ": must be >= 0");
        }
        out.push_back(*n);
    }
    if (out.empty()) {
        throw ValidationError("no valid fan indices parsed from \"" + trimmed + "\"");
    }
    return out;
}

static void requireNoPositionals(const FlagSet& fs, const std::string& command) {
    if (!fs.positional().empty()) {
        throw ValidationError(command + ": unexpected argument \"" + fs.positional().front() + "\"");
    }
}

static void requireGpuIndex(int gpu, const std::string& command) {
    if (gpu < 0) {
        throw ValidationError(command + ": -gpu must be >= 0 (got " + std::to_string(gpu) + ")");
    }
}

/* ----------------------------------------------------------------------------
 * Backend session (RAII)
 * ----------------------------------------------------------------------------*/

namespace {

/* Owns the backend for one command and shuts it down on every exit path. */
class BackendSession {
public:
    BackendSession(CliContext& ctx, Logger& log) {
        if (!ctx.makeBackend) {
            throw HardwareError("no hardware backend available");
        }
        backend_ = ctx.makeBackend(log);
        if (!backend_) {
            throw HardwareError("no hardware backend available");
        }
        HwStatus st = backend_->init();
        if (!st.ok()) {
            throw HardwareError(st.message);
        }
        up_ = true;
    }

    ~BackendSession() {
        if (up_) backend_->shutdown();
    }

    BackendSession(const BackendSession&) = delete;
    BackendSession& operator=(const BackendSession&) = delete;

    FanBackend* operator->() { return backend_.get(); }

private:
    std::unique_ptr<FanBackend> backend_;
    bool up_{false};
};

/* Device-index check against the live count; fails with HardwareError. */
void checkGpuExists(BackendSession& be, int gpu) {
    HwValue<int> count = be->deviceCount();
    if (!count.ok()) {
        throw HardwareError(count.status.message);
    }
    if (gpu >= count.value) {
        throw HardwareError("invalid -gpu " + std::to_string(gpu) + " (found " + std::to_string(count.value) +
                            " device(s), valid range: 0.." + std::to_string(count.value - 1) + ")");
    }
}

void checkFansExist(BackendSession& be, int gpu, const std::vector<int>& fans) {
    HwValue<int> n = be->fanCount(gpu);
    if (!n.ok()) {
        throw HardwareError(n.status.message);
    }
    for (int f : fans) {
        if (f >= n.value) {
            throw HardwareError("invalid fan index " + std::to_string(f) + " for GPU " + std::to_string(gpu) +
                                " (device reports " + std::to_string(n.value) + " fan(s))");
        }
    }
}

MirrorMode cliMirror(bool verbose) {
    return verbose ? MirrorMode::Stderr : MirrorMode::Off;
}

} // namespace

/* ----------------------------------------------------------------------------
 * Commands
 * ----------------------------------------------------------------------------*/

static int cmdStatus(const std::vector<std::string>& args, CliContext& ctx) {
    int gpu = 0;
    bool verbose = false;
    FlagSet fs("status");
    fs.addInt("gpu", &gpu);
    fs.addBool("v", &verbose);
    fs.parse(args);
    if (fs.helpRequested()) { printUsage(ctx.out); return kExitOk; }
    requireNoPositionals(fs, "status");
    requireGpuIndex(gpu, "status");

    Logger log(LogLevel::Info, cliMirror(verbose));
    BackendSession be(ctx, log);
    checkGpuExists(be, gpu);

    HwValue<int> temp = be->temperature(gpu);
    if (!temp.ok()) {
        throw HardwareError(temp.status.message);
    }

    HwValue<int> fans = be->fanCount(gpu);
    if (!fans.ok()) {
        ctx.out << "GPU " << gpu << ": Temp=" << temp.value << "°C, Fans=unknown ("
                << fans.status.message << ")\n";
        return kExitOk;
    }

    ctx.out << "GPU " << gpu << ": Temp=" << temp.value << "°C, Fans=" << fans.value << "\n";
    for (int f = 0; f < fans.value; ++f) {
        HwValue<int> speed = be->fanSpeed(gpu, f);
        if (!speed.ok()) {
            ctx.out << "  Fan " << f << ": speed=unknown (" << speed.status.message << ")\n";
            continue;
        }
        ctx.out << "  Fan " << f << ": speed=" << speed.value << "%\n";
    }
    return kExitOk;
}

static int cmdSet(const std::vector<std::string>& args, CliContext& ctx) {
    int gpu = 0;
    int speed = -1;
    std::string fansStr = "0";
    bool verbose = false;
    FlagSet fs("set");
    fs.addInt("gpu", &gpu);
    fs.addString("fans", &fansStr);
    fs.addInt("speed", &speed);
    fs.addBool("v", &verbose);
    fs.parse(args);
    if (fs.helpRequested()) { printUsage(ctx.out); return kExitOk; }
    requireNoPositionals(fs, "set");

    if (!fs.seen("speed")) {
        throw ValidationError("set: -speed is required");
    }
    if (speed < 0 || speed > 100) {
        throw ValidationError("set: -speed must be 0..100 (got " + std::to_string(speed) + ")");
    }
    requireGpuIndex(gpu, "set");
    std::vector<int> fans = parseFanList(fansStr);

    Logger log(LogLevel::Info, cliMirror(verbose));
    BackendSession be(ctx, log);
    checkGpuExists(be, gpu);
    checkFansExist(be, gpu, fans);

    for (int f : fans) {
        HwStatus st = be->setFanPolicy(gpu, f, FanPolicy::Manual);
        if (st.notSupported()) {
            throw HardwareError("manual fan policy not supported for GPU " + std::to_string(gpu) +
                                " Fan " + std::to_string(f));
        }
        if (!st.ok()) {
            throw HardwareError(st.message);
        }
        st = be->setFanSpeed(gpu, f, speed);
        if (!st.ok()) {
            throw HardwareError(st.message);
        }
        LOG_INFO(log, "Set GPU %d Fan %d to %d%% (MANUAL)", gpu, f, speed);
    }
    return kExitOk;
}

static int cmdAuto(const std::vector<std::string>& args, CliContext& ctx) {
    int gpu = 0;
    std::string fansStr = "0";
    bool verbose = false;
    FlagSet fs("auto");
    fs.addInt("gpu", &gpu);
    fs.addString("fans", &fansStr);
    fs.addBool("v", &verbose);
    fs.parse(args);
    if (fs.helpRequested()) { printUsage(ctx.out); return kExitOk; }
    requireNoPositionals(fs, "auto");
    requireGpuIndex(gpu, "auto");
    std::vector<int> fans = parseFanList(fansStr);

    Logger log(LogLevel::Info, cliMirror(verbose));
    BackendSession be(ctx, log);
    checkGpuExists(be, gpu);
    checkFansExist(be, gpu, fans);

    for (int f : fans) {
        HwStatus st = be->setFanPolicy(gpu, f, FanPolicy::Auto);
        if (st.notSupported()) {
            throw HardwareError("temperature fan policy not supported for GPU " + std::to_string(gpu) +
                                " Fan " + std::to_string(f));
        }
        if (!st.ok()) {
            throw HardwareError(st.message);
        }
        LOG_INFO(log, "Returned GPU %d Fan %d to AUTO control", gpu, f);
    }
    return kExitOk;
}

static int cmdGameMode(const std::vector<std::string>& args, CliContext& ctx) {
    std::string path = Config::defaultGameModePath();
    FlagSet fs("gamemode");
    fs.addString("file", &path);
    fs.parse(args);
    if (fs.helpRequested()) { printUsage(ctx.out); return kExitOk; }

    if (fs.positional().size() != 1) {
        throw ValidationError("gamemode: expected exactly one of on|off|status");
    }
    const std::string& action = fs.positional().front();
    GameModeFlag flag(util::expandUserPath(path));

    try {
        if (action == "on") {
            flag.set(true);
            ctx.out << "game mode on (" << flag.path() << ")\n";
        } else if (action == "off") {
            flag.set(false);
            ctx.out << "game mode off\n";
        } else if (action == "status") {
            ctx.out << (flag.active() ? "on" : "off") << "\n";
        } else {
            throw ValidationError("gamemode: unknown action \"" + action + "\" (expected on|off|status)");
        }
    } catch (const ValidationError&) {
        throw;
    } catch (const std::runtime_error& ex) {
        ctx.err << "gamemode: " << ex.what() << "\n";
        return kExitFailure;
    }
    return kExitOk;
}

static int cmdDaemon(const std::vector<std::string>& args, CliContext& ctx) {
    DaemonOptions opts = defaultDaemonOptions();
    FlagSet fs("daemon");
    fs.addString("config", &opts.configPath);
    fs.addString("log", &opts.logPath);
    fs.addBool("curve", &opts.curve);
    fs.addBool("debug", &opts.debug);
    fs.addString("gamemode-file", &opts.gameModePath);
    fs.parse(args);
    if (fs.helpRequested()) { printUsage(ctx.out); return kExitOk; }
    requireNoPositionals(fs, "daemon");
    expandPaths(opts);

    Logger log(opts.debug ? LogLevel::Debug : LogLevel::Info, MirrorMode::Off);
    if (!log.setFile(opts.logPath)) {
        ctx.err << "FATAL: unable to open log file " << opts.logPath << "\n";
        return kExitFailure;
    }
    LOG_INFO(log, "gpufanctl daemon starting (version %s)", GFC_VERSION);

    std::unique_ptr<FanBackend> backend;
    if (ctx.makeBackend) backend = ctx.makeBackend(log);

    Daemon daemon(std::move(backend), log);
    try {
        daemon.init(opts);
    } catch (const ConfigError& ex) {
        LOG_ERROR(log, "FATAL: %s", ex.what());
        return kExitFailure;
    } catch (const HardwareError& ex) {
        LOG_ERROR(log, "FATAL: %s", ex.what());
        return kExitFailure;
    }

    if (!daemon.hasWork()) {
        LOG_INFO(log, "No devices with controllable fans were found or initialized. Exiting.");
        return kExitOk;
    }

    gStop.store(false);
    install_signals();

    // Run loop in a dedicated thread; this thread waits for the stop signal.
    std::thread loopThread([&]{
        daemon.runLoop();
    });

    while (!gStop.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO(log, "gpufanctl daemon shutting down (signal received)");
    daemon.requestStop();
    if (loopThread.joinable()) loopThread.join();
    daemon.shutdown();
    log.shutdown();
    return kExitOk;
}

/* ----------------------------------------------------------------------------
 * Dispatch
 * ----------------------------------------------------------------------------*/

int runCli(const std::vector<std::string>& args, CliContext& ctx) {
    if (args.empty()) {
        printUsage(ctx.err);
        return kExitUsage;
    }

    const std::string& cmd = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    if (cmd == "help" || cmd == "-h" || cmd == "--help") {
        printUsage(ctx.out);
        return kExitOk;
    }

    try {
        if (cmd == "daemon")   return cmdDaemon(rest, ctx);
        if (cmd == "status")   return cmdStatus(rest, ctx);
        if (cmd == "set")      return cmdSet(rest, ctx);
        if (cmd == "auto")     return cmdAuto(rest, ctx);
        if (cmd == "gamemode") return cmdGameMode(rest, ctx);
    } catch (const ValidationError& ex) {
        ctx.err << ex.what() << "\n";
        return kExitUsage;
    } catch (const HardwareError& ex) {
        ctx.err << ex.what() << "\n";
        return kExitFailure;
    }

    ctx.err << "unknown command: " << cmd << "\n";
    printUsage(ctx.err);
    return kExitUsage;
}

} // namespace gfc
