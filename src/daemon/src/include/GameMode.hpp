/*
 * GPU Fan Control — Game-mode latch
 * - Process-external boolean that keeps curve mode in MANUAL while set
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <string>

namespace gfc {

class GameModeSource {
public:
    virtual ~GameModeSource() = default;
    virtual bool active() const = 0;
};

/* Latch backed by the existence of a flag file; shared between CLI and daemon. */
class GameModeFlag : public GameModeSource {
public:
    explicit GameModeFlag(std::string path);

    bool active() const override;

    /* Create (on) or remove (off) the flag file. Throws std::runtime_error on failure. */
    void set(bool on);

    const std::string& path() const noexcept { return path_; }

    /* /run/gpufanctl.gamemode regardless of the caller's privileges. */
    static std::string defaultPath();

private:
    std::string path_;
};

} // namespace gfc
