#pragma once
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace hookgate::core::config {

    inline constexpr const char* kDefaultSessionId = "default";

    // Generates a simple 8-character hex suffix, used for temp files and scratch dirs.
    inline std::string generate_suffix() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // 32-bit FNV-1a, rendered as 8 hex digits.
    inline std::string short_hash(const std::string& text) {
        std::uint32_t hash = 2166136261u;
        for (const unsigned char c : text) {
            hash ^= c;
            hash *= 16777619u;
        }
        std::stringstream ss;
        ss << std::hex << std::setw(8) << std::setfill('0') << hash;
        return ss.str();
    }

    // Maps a host-supplied session id onto a safe file name component.
    // Anything outside [A-Za-z0-9._-] becomes '_' and an id that had to change
    // gets "-<hash of the raw id>" appended, so distinct ids never share a
    // record. Empty input maps to "default".
    inline std::string sanitize_session_id(const std::string& raw) {
        if (raw.empty()) {
            return kDefaultSessionId;
        }
        std::string out;
        out.reserve(raw.size() + 9);
        for (const unsigned char c : raw) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back('_');
            }
        }
        if (out.find_first_not_of('.') == std::string::npos) {
            out.assign(out.size(), '_');
        }
        if (out != raw) {
            out += "-" + short_hash(raw);
        }
        return out;
    }

} // namespace hookgate::core::config
