#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace qkmail::encryption {

enum class SecurityLevel : uint8_t {
    Basic = 1,
    Standard = 2,
    High = 3,
    Maximum = 4
};

[[nodiscard]] constexpr std::string_view SecurityLevelName(const SecurityLevel level) noexcept {
    switch (level) {
        case SecurityLevel::Basic: return "basic";
        case SecurityLevel::Standard: return "standard";
        case SecurityLevel::High: return "high";
        case SecurityLevel::Maximum: return "maximum";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<SecurityLevel> SecurityLevelFromInt(const int value) noexcept {
    switch (value) {
        case 1: return SecurityLevel::Basic;
        case 2: return SecurityLevel::Standard;
        case 3: return SecurityLevel::High;
        case 4: return SecurityLevel::Maximum;
        default: return std::nullopt;
    }
}

} // namespace qkmail::encryption
