/*
 * GPU Fan Control — Command line front-end (header)
 * - Subcommands: daemon, status, set, auto, gamemode
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "FanBackend.hpp"

namespace gfc {

class Logger;

enum ExitCode : int {
    kExitOk      = 0,
    kExitFailure = 1,   // runtime or hardware error
    kExitUsage   = 2    // bad arguments, reported before any hardware call
};

/* Creates the hardware collaborator; called at most once per command, after validation. */
using BackendFactory = std::function<std::unique_ptr<FanBackend>(Logger&)>;

struct CliContext {
    BackendFactory makeBackend;
    std::ostream&  out;
    std::ostream&  err;
};

/*
 * Minimal Go-style flag parser: "-name value", "-name=value" and "--name".
 * Bool flags take no separate value. Non-flag tokens are collected as positionals.
 * Throws ValidationError on unknown flags, missing or non-integer values.
 */
class FlagSet {
public:
    explicit FlagSet(std::string command);
    FlagSet(const FlagSet&) = delete;
    FlagSet& operator=(const FlagSet&) = delete;

    void addInt(const std::string& name, int* target);
    void addString(const std::string& name, std::string* target);
    void addBool(const std::string& name, bool* target);

    void parse(const std::vector<std::string>& args);

    bool seen(const std::string& name) const { return seen_.count(name) != 0; }
    bool helpRequested() const noexcept { return help_; }
    const std::vector<std::string>& positional() const noexcept { return positional_; }

private:
    struct Flag {
        bool isBool;
        std::function<void(const std::string&)> set;   // throws ValidationError on a bad value
    };

    std::string                 command_;
    std::map<std::string, Flag> flags_;
    std::map<std::string, bool> seen_;
    std::vector<std::string>    positional_;
    bool                        help_{false};
};

/*
 * Comma-separated fan indices. Items are trimmed and empty items skipped;
 * non-integers, negatives and a list without any index throw ValidationError.
 */
std::vector<int> parseFanList(const std::string& s);

void printUsage(std::ostream& os);

/* args excludes the program name. Returns the process exit code. */
int runCli(const std::vector<std::string>& args, CliContext& ctx);

} // namespace gfc
