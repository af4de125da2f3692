#pragma once
#include <string>
#include <string_view>
namespace qkmail {
enum class SodiumFailureType {
    InitializationFailed,
    EncodingFailed
};
enum class QkdFailureType {
    ProviderTransport,
    ProviderProtocol,
    KeyPolicy,
    KeyLifecycleMiss,
    CryptoIntegrity,
    EavesdroppingDetected,
    KeyNotFound,
    InvalidInput,
    Decode,
    Encode,
    Storage,
    Generic
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure EncodingFailed(std::string msg) {
        return {SodiumFailureType::EncodingFailed, std::move(msg)};
    }
};

/**
 * @brief Error value carried by every fallible core operation.
 *
 * The first five types are the categories a caller must be able to tell
 * apart when a key exchange or a decrypt goes wrong:
 * - ProviderTransport: the KME could not be reached (network, TLS, timeout)
 * - ProviderProtocol: the KME answered with an API error or unusable key material
 * - KeyPolicy: the request violates a key policy (OTP too short, size above
 *   the advertised maximum, wrong SAE role)
 * - KeyLifecycleMiss: the key is absent, expired or already consumed
 * - CryptoIntegrity: AEAD authentication failed on decrypt
 */
class QkdFailure {
public:
    QkdFailureType type;
    std::string message;
    QkdFailure(const QkdFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static QkdFailure ProviderTransport(std::string msg) {
        return {QkdFailureType::ProviderTransport, std::move(msg)};
    }
    static QkdFailure ProviderProtocol(std::string msg) {
        return {QkdFailureType::ProviderProtocol, std::move(msg)};
    }
    static QkdFailure KeyPolicy(std::string msg) {
        return {QkdFailureType::KeyPolicy, std::move(msg)};
    }
    static QkdFailure KeyLifecycleMiss(std::string msg) {
        return {QkdFailureType::KeyLifecycleMiss, std::move(msg)};
    }
    static QkdFailure CryptoIntegrity(std::string msg) {
        return {QkdFailureType::CryptoIntegrity, std::move(msg)};
    }
    static QkdFailure EavesdroppingDetected(std::string msg) {
        return {QkdFailureType::EavesdroppingDetected, std::move(msg)};
    }
    static QkdFailure KeyNotFound(std::string msg) {
        return {QkdFailureType::KeyNotFound, std::move(msg)};
    }
    static QkdFailure InvalidInput(std::string msg) {
        return {QkdFailureType::InvalidInput, std::move(msg)};
    }
    static QkdFailure Decode(std::string msg) {
        return {QkdFailureType::Decode, std::move(msg)};
    }
    static QkdFailure Encode(std::string msg) {
        return {QkdFailureType::Encode, std::move(msg)};
    }
    static QkdFailure Storage(std::string msg) {
        return {QkdFailureType::Storage, std::move(msg)};
    }
    static QkdFailure Generic(std::string msg) {
        return {QkdFailureType::Generic, std::move(msg)};
    }
};
[[nodiscard]] constexpr std::string_view FailureTypeName(const QkdFailureType type) noexcept {
    switch (type) {
        case QkdFailureType::ProviderTransport: return "ProviderTransport";
        case QkdFailureType::ProviderProtocol: return "ProviderProtocol";
        case QkdFailureType::KeyPolicy: return "KeyPolicy";
        case QkdFailureType::KeyLifecycleMiss: return "KeyLifecycleMiss";
        case QkdFailureType::CryptoIntegrity: return "CryptoIntegrity";
        case QkdFailureType::EavesdroppingDetected: return "EavesdroppingDetected";
        case QkdFailureType::KeyNotFound: return "KeyNotFound";
        case QkdFailureType::InvalidInput: return "InvalidInput";
        case QkdFailureType::Decode: return "Decode";
        case QkdFailureType::Encode: return "Encode";
        case QkdFailureType::Storage: return "Storage";
        case QkdFailureType::Generic: return "Generic";
    }
    return "Unknown";
}
}
