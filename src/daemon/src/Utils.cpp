/*
 * GPU Fan Control — Utility helpers (implementation; Linux-only)
 * (c) 2025 GpuFanControl contributors
 */

#include "include/Utils.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace gfc { namespace util {

using json = nlohmann::json;

std::optional<std::string> getenv_str(const char* key) {
    if (key == nullptr || *key == '\0') return std::nullopt;
    if (const char* v = std::getenv(key)) return std::string(v);
    return std::nullopt;
}

/* ----------------------------------------------------------------------------
 * Strings
 * ----------------------------------------------------------------------------*/

static bool isSpace_(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(std::string_view sv) {
    while (!sv.empty() && isSpace_(sv.front())) sv.remove_prefix(1);
    while (!sv.empty() && isSpace_(sv.back())) sv.remove_suffix(1);
    return std::string(sv);
}

std::vector<std::string> split(std::string_view sv, char delim) {
    std::vector<std::string> out;
    for (;;) {
        const auto pos = sv.find(delim);
        out.emplace_back(sv.substr(0, pos));
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty() || &p != &parts.front()) out.append(sep);
        out += p;
    }
    return out;
}

std::optional<int> parse_int(std::string_view sv) {
    std::string s = trim(sv);
    if (!s.empty() && s.front() == '+') s.erase(0, 1);
    if (s.empty()) return std::nullopt;

    int value = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    const auto res = std::from_chars(first, last, value, 10);
    if (res.ec != std::errc() || res.ptr != last) return std::nullopt;
    return value;
}

/* ----------------------------------------------------------------------------
 * Filesystem
 * ----------------------------------------------------------------------------*/

void ensure_parent_dirs(const fs::path& p, std::error_code* ec) {
    std::error_code local;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), local);
    if (ec) *ec = local;
}

json read_json_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open '" + p.string() + "': " + std::strerror(errno));
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("read error on '" + p.string() + "'");
    }

    // UTF-8 BOM
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);

    try {
        return json::parse(text);
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("invalid JSON in '" + p.string() + "': " + ex.what());
    }
}

/* ----------------------------------------------------------------------------
 * Path expansion
 * ----------------------------------------------------------------------------*/

static std::string envOrEmpty_(const std::string& key) {
    auto v = getenv_str(key.c_str());
    return v ? *v : std::string();
}

std::string expandUserPath(const std::string& in) {
    std::string src = in;
    if (!src.empty() && src[0] == '~' && (src.size() == 1 || src[1] == '/')) {
        const std::string home = envOrEmpty_("HOME");
        if (!home.empty()) src = home + src.substr(1);
    }

    std::string out;
    out.reserve(src.size());
    size_t i = 0;
    while (i < src.size()) {
        if (src[i] != '$' || i + 1 >= src.size()) {
            out.push_back(src[i++]);
            continue;
        }
        if (src[i + 1] == '{') {
            const size_t close = src.find('}', i + 2);
            if (close == std::string::npos) {
                out.push_back(src[i++]);
                continue;
            }
            out += envOrEmpty_(src.substr(i + 2, close - i - 2));
            i = close + 1;
            continue;
        }
        size_t end = i + 1;
        while (end < src.size() && (src[end] == '_' || std::isalnum(static_cast<unsigned char>(src[end])))) ++end;
        if (end == i + 1) {
            out.push_back(src[i++]);
            continue;
        }
        out += envOrEmpty_(src.substr(i + 1, end - i - 1));
        i = end;
    }
    return out;
}

}} // namespace gfc::util
