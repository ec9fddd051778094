/*
 * GPU Fan Control — Error taxonomy
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <stdexcept>
#include <string>

namespace gfc {

/* Missing or malformed configuration file. Fatal for the daemon at startup. */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/* Hardware collaborator failure outside the tick loop (init, enumeration, CLI writes). */
class HardwareError : public std::runtime_error {
public:
    explicit HardwareError(const std::string& what) : std::runtime_error(what) {}
};

/* Bad command-line argument; reported before any hardware call. */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

/* Curve profile requested from an empty range table. */
class EmptyRangesError : public std::runtime_error {
public:
    explicit EmptyRangesError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace gfc
