#pragma once

/**
 * @file event_logger.hpp
 * @brief Diagnostic event logging for key exchange and key lifecycle.
 *
 * Lines go to stderr as "[QKM-DEBUG] <ROLE> <operation> ...". Key material
 * is only ever printed as a short hex prefix.
 *
 * Enable via CMake: -DQKMAIL_DEBUG_EVENTS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace qkmail::debug {

enum class Role {
    Master,
    Slave,
    Local,
    Unknown
};

#ifdef QKMAIL_DEBUG_EVENTS

inline std::string HexPrefix(std::span<const uint8_t> data, size_t max_bytes = 4) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    result.reserve(shown * 2 + 24);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    result += "...(" + std::to_string(data.size()) + " bytes)";
    return result;
}

inline const char* RoleToString(Role role) {
    switch (role) {
        case Role::Master: return "MASTER";
        case Role::Slave: return "SLAVE";
        case Role::Local: return "LOCAL";
        default: return "UNKNOWN";
    }
}

#define QKM_LOG_EVENT(role, operation, message) \
    do { \
        fprintf(stderr, "[QKM-DEBUG] %s %s %s\n", \
            ::qkmail::debug::RoleToString(role), \
            operation, \
            std::string(message).c_str()); \
    } while(0)

#define QKM_LOG_VALUE(role, operation, name, value) \
    do { \
        fprintf(stderr, "[QKM-DEBUG] %s %s %s=%s\n", \
            ::qkmail::debug::RoleToString(role), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
    } while(0)

#define QKM_LOG_KEY(role, operation, key_id, data) \
    do { \
        fprintf(stderr, "[QKM-DEBUG] %s %s key_id=%s key=%s\n", \
            ::qkmail::debug::RoleToString(role), \
            operation, \
            std::string(key_id).c_str(), \
            ::qkmail::debug::HexPrefix(data).c_str()); \
    } while(0)

#define QKM_LOG_SECTION(role, section_name) \
    do { \
        fprintf(stderr, "[QKM-DEBUG] %s ---------- %s ----------\n", \
            ::qkmail::debug::RoleToString(role), \
            section_name); \
    } while(0)

#else // !QKMAIL_DEBUG_EVENTS

#define QKM_LOG_EVENT(role, operation, message) ((void)0)
#define QKM_LOG_VALUE(role, operation, name, value) ((void)0)
#define QKM_LOG_KEY(role, operation, key_id, data) ((void)0)
#define QKM_LOG_SECTION(role, section_name) ((void)0)

#endif // QKMAIL_DEBUG_EVENTS

} // namespace qkmail::debug
