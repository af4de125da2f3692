#pragma once

#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/core/constants.hpp"
#include "qkmail/core/format.hpp"

#include <string>
#include <string_view>

namespace qkmail::keys {

/// Key ids double as file names: [A-Za-z0-9._-], at most 128 characters, no leading '.'
[[nodiscard]] inline Result<Unit, QkdFailure> ValidateKeyId(std::string_view key_id) {
    if (key_id.empty()) {
        return Result<Unit, QkdFailure>::Err(QkdFailure::InvalidInput("Key id is empty"));
    }
    if (key_id.size() > KeyPolicyConstants::MAX_KEY_ID_LENGTH) {
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::InvalidInput(compat::format("Key id exceeds {} characters",
                KeyPolicyConstants::MAX_KEY_ID_LENGTH)));
    }
    if (key_id.front() == '.') {
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::InvalidInput("Key id must not start with '.'"));
    }
    for (const char c : key_id) {
        const bool allowed =
            (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '.' || c == '_' || c == '-';
        if (!allowed) {
            return Result<Unit, QkdFailure>::Err(
                QkdFailure::InvalidInput("Key id contains a character outside [A-Za-z0-9._-]"));
        }
    }
    return Result<Unit, QkdFailure>::Ok(unit);
}

} // namespace qkmail::keys
