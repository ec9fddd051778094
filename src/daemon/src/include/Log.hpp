/*
 * GPU Fan Control — Logging (header)
 * - Thread-safe logger with optional file output and size-based rotation
 * - Minimal dependencies; printf-style API for fast call-sites
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace gfc {

/* Severity levels (ascending verbosity). */
enum class LogLevel {
    Error = 0,  // serious failure, user-visible
    Warn  = 1,  // recoverable anomaly
    Info  = 2,  // default operational messages
    Debug = 3,  // developer diagnostics
    Trace = 4   // very verbose, tight loops
};

/* Where mirrored lines go. Split sends Error/Warn to stderr, the rest to stdout. */
enum class MirrorMode {
    Off = 0,
    Split = 1,
    Stderr = 2
};

/*
 * Logger: one instance per process role, handed to components by reference.
 * - No sink configured means messages are dropped (quiet CLI default).
 * - Rotation is size-based (maxBytes/maxFiles). Rotation reopens a fresh file.
 * - Messages are mirrored to stdout/stderr when mirror mode is enabled.
 */
class Logger {
public:
    Logger() = default;
    Logger(LogLevel lvl, MirrorMode mirror);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /*
     * Open (append) the given log file, creating the parent directory when needed.
     * Returns false if the file cannot be opened; the logger then keeps no file sink.
     */
    bool setFile(const std::string& path);

    /* Change mirroring to stdio at runtime. */
    void setMirror(MirrorMode mode);
    MirrorMode mirror() const;

    void setLevel(LogLevel lvl);
    LogLevel level() const;

    /* Path of the active file sink (empty if none). */
    std::string filePath() const;

    /* Close file (idempotent). */
    void shutdown();

    /*
     * Configure rotation:
     *  - maxBytes: rotate when file would exceed this size (>0 to enable).
     *  - maxFiles: how many rotated files to keep (>=1).
     * Default is 5 MiB / 5 files.
     */
    void enableRotation(size_t maxBytes, int maxFiles);

    /* Core write (printf-style). Thread-safe. */
    void write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    void vwrite(LogLevel lvl, const char* fmt, va_list ap);

private:
    bool openUnlocked();
    void closeUnlocked();
    void rotateUnlocked();
    bool rotationDue(size_t incoming) const;

    mutable std::mutex mtx_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
    std::atomic<int> mirror_{static_cast<int>(MirrorMode::Off)};

    std::string path_;
    FILE*       fp_{nullptr};
    size_t      written_{0};

    size_t maxBytes_{5 * 1024 * 1024};
    int    maxFiles_{5};
};

/* Convenience macros; `lg` is a Logger reference. */
#define LOG_ERROR(lg, fmt, ...) (lg).write(::gfc::LogLevel::Error, fmt, ##__VA_ARGS__)
#define LOG_WARN(lg, fmt, ...)  (lg).write(::gfc::LogLevel::Warn,  fmt, ##__VA_ARGS__)
#define LOG_INFO(lg, fmt, ...)  (lg).write(::gfc::LogLevel::Info,  fmt, ##__VA_ARGS__)
#define LOG_DEBUG(lg, fmt, ...) (lg).write(::gfc::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOG_TRACE(lg, fmt, ...) (lg).write(::gfc::LogLevel::Trace, fmt, ##__VA_ARGS__)

} // namespace gfc
