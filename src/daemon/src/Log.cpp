/*
 * GPU Fan Control — Logging (implementation)
 * - Thread-safe logger with optional file output and size-based rotation
 * (c) 2025 GpuFanControl contributors
 */

#include "include/Log.hpp"

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace gfc {

namespace {

char levelLetter(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return 'E';
        case LogLevel::Warn:  return 'W';
        case LogLevel::Info:  return 'I';
        case LogLevel::Debug: return 'D';
        case LogLevel::Trace: return 'T';
    }
    return '?';
}

/* "YYYY-MM-DD HH:MM:SS [L] " */
std::string linePrefix(LogLevel lvl) {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[24] = "1970-01-01 00:00:00";
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::string out(stamp);
    out += " [";
    out += levelLetter(lvl);
    out += "] ";
    return out;
}

std::string vformat(const char* fmt, va_list ap) {
    va_list probe;
    va_copy(probe, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, probe);
    va_end(probe);
    if (n <= 0) return std::string();

    std::string out(static_cast<size_t>(n) + 1, '\0');
    std::vsnprintf(&out[0], out.size(), fmt, ap);
    out.resize(static_cast<size_t>(n));
    return out;
}

/* Replace `to` with `from` if `from` exists; errors are ignored. */
void moveOver(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (!fs::exists(from, ec)) return;
    fs::remove(to, ec);
    fs::rename(from, to, ec);
}

} // namespace

Logger::Logger(LogLevel lvl, MirrorMode mirror)
    : level_(static_cast<int>(lvl)), mirror_(static_cast<int>(mirror)) {}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeUnlocked();
}

bool Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx_);
    closeUnlocked();
    path_ = path;
    written_ = 0;
    if (path_.empty()) return true;

    std::error_code ec;
    const fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    if (!openUnlocked()) {
        path_.clear();
        return false;
    }
    if (rotationDue(0)) {
        rotateUnlocked();
        openUnlocked();
    }
    return true;
}

void Logger::setMirror(MirrorMode mode) {
    mirror_.store(static_cast<int>(mode), std::memory_order_relaxed);
}

MirrorMode Logger::mirror() const {
    return static_cast<MirrorMode>(mirror_.load(std::memory_order_relaxed));
}

void Logger::setLevel(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

std::string Logger::filePath() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return path_;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeUnlocked();
    path_.clear();
}

void Logger::enableRotation(size_t maxBytes, int maxFiles) {
    std::lock_guard<std::mutex> lock(mtx_);
    maxBytes_ = maxBytes;
    maxFiles_ = maxFiles;
    if (fp_ && rotationDue(0)) {
        rotateUnlocked();
        openUnlocked();
    }
}

bool Logger::openUnlocked() {
    if (fp_) return true;
    if (path_.empty()) return false;
    fp_ = std::fopen(path_.c_str(), "a");
    if (!fp_) return false;

    std::error_code ec;
    const auto size = fs::file_size(path_, ec);
    written_ = ec ? 0 : static_cast<size_t>(size);
    return true;
}

void Logger::closeUnlocked() {
    if (!fp_) return;
    std::fflush(fp_);
    std::fclose(fp_);
    fp_ = nullptr;
}

bool Logger::rotationDue(size_t incoming) const {
    if (maxBytes_ == 0 || maxFiles_ <= 0 || path_.empty()) return false;
    if (incoming == 0) return written_ >= maxBytes_;
    return written_ + incoming > maxBytes_;
}

/* log.N-1 -> log.N, ..., log -> log.1 */
void Logger::rotateUnlocked() {
    closeUnlocked();
    for (int i = maxFiles_ - 1; i >= 1; --i) {
        moveOver(path_ + "." + std::to_string(i), path_ + "." + std::to_string(i + 1));
    }
    moveOver(path_, path_ + ".1");
    written_ = 0;
}

void Logger::write(LogLevel lvl, const char* fmt, ...) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    va_list ap;
    va_start(ap, fmt);
    vwrite(lvl, fmt, ap);
    va_end(ap);
}

void Logger::vwrite(LogLevel lvl, const char* fmt, va_list ap) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;
    const MirrorMode mirror = this->mirror();

    std::lock_guard<std::mutex> lock(mtx_);
    if (mirror == MirrorMode::Off && path_.empty()) return;

    std::string line = linePrefix(lvl) + vformat(fmt, ap);
    if (line.back() != '\n') line.push_back('\n');

    if (!path_.empty()) {
        if (rotationDue(line.size())) rotateUnlocked();
        if (openUnlocked()) {
            std::fwrite(line.data(), 1, line.size(), fp_);
            std::fflush(fp_);
            written_ += line.size();
        }
    }

    if (mirror != MirrorMode::Off) {
        const bool toErr = mirror == MirrorMode::Stderr ||
                           lvl == LogLevel::Error || lvl == LogLevel::Warn;
        FILE* out = toErr ? stderr : stdout;
        std::fwrite(line.data(), 1, line.size(), out);
        std::fflush(out);
    }
}

} // namespace gfc
