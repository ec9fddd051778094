/*
 * GPU Fan Control — Game-mode latch (implementation)
 * (c) 2025 GpuFanControl contributors
 */

#include "include/GameMode.hpp"
#include "include/Utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gfc {

GameModeFlag::GameModeFlag(std::string path)
    : path_(std::move(path)) {}

bool GameModeFlag::active() const {
    std::error_code ec;
    return fs::exists(path_, ec) && !ec;
}

void GameModeFlag::set(bool on) {
    if (on) {
        std::error_code ec;
        util::ensure_parent_dirs(path_, &ec);
        if (ec) {
            throw std::runtime_error("cannot create parent dirs for " + path_ + " (" + ec.message() + ")");
        }
        std::ofstream os(path_, std::ios::trunc);
        if (!os) {
            throw std::runtime_error("cannot create " + path_ + ": " + std::strerror(errno));
        }
        os << ::getpid() << '\n';
        if (!os.good()) {
            throw std::runtime_error("cannot write " + path_);
        }
        return;
    }

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        throw std::runtime_error("cannot remove " + path_ + " (" + ec.message() + ")");
    }
}

std::string GameModeFlag::defaultPath() {
    return "/run/gpufanctl.gamemode";
}

} // namespace gfc
