#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace qkmail {
struct Constants {
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t CHACHA20_KEY_SIZE = 32;
    static constexpr size_t AEAD_NONCE_SIZE = 12;
    static constexpr size_t AEAD_TAG_SIZE = 16;
    static constexpr size_t EPHEMERAL_KEY_SIZE = 32;
    static constexpr size_t BITS_PER_BYTE = 8;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr int RSA_DEFAULT_BITS = 2048;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct QkdConstants {
    static constexpr uint32_t DEFAULT_KEY_LENGTH_BITS = 256;
    static constexpr uint32_t OVERSAMPLING_FACTOR = 4;
    static constexpr size_t QBER_SAMPLE_SIZE = 50;
    static constexpr double QBER_THRESHOLD = 0.11;
    static constexpr uint32_t ERROR_RATE_RESOLUTION = 1'000'000;
    static constexpr size_t KEY_ID_HEX_LENGTH = 16;
    static constexpr uint32_t MAX_KEY_LENGTH_BITS = 1u << 20;
    static constexpr std::string_view LOCAL_PROVENANCE = "local-bb84";
    static constexpr std::string_view LOCAL_STANDARD = "BB84-simulated";
};
struct EtsiConstants {
    static constexpr std::string_view PROVIDER_SOURCE = "qukaydee";
    static constexpr std::string_view STANDARD = "ETSI-GS-QKD-014";
    static constexpr std::string_view API_BASE_PATH = "/api/v1";
    static constexpr std::string_view QUKAYDEE_DOMAIN = "etsi-qkd-api.qukaydee.com";
    static constexpr uint16_t HTTPS_PORT = 443;
    static constexpr int HTTP_VERSION_1_1 = 11;
    static constexpr unsigned int HTTP_OK_MIN = 200;
    static constexpr unsigned int HTTP_OK_MAX = 299;
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{10};
    static constexpr std::chrono::seconds DEFAULT_KEY_EXPIRY{600};
    static constexpr std::string_view FIELD_KEYS = "keys";
    static constexpr std::string_view FIELD_KEY = "key";
    static constexpr std::string_view FIELD_ERROR = "error";
    static constexpr std::string_view FIELD_ERRORS = "errors";
    static constexpr std::string_view FIELD_MESSAGE = "message";
    static constexpr std::string_view FIELD_STORED_KEY_COUNT = "stored_key_count";
    static constexpr std::string_view FIELD_MAX_KEY_SIZE = "max_key_size";
    static constexpr std::string_view FIELD_KEY_EXPIRY_TIME = "key_expiry_time";
    static constexpr std::string_view NORMALIZED_KEY_ID_FIELD = "keyid";
};
struct KeyPolicyConstants {
    static constexpr std::chrono::minutes INTERACTIVE_TTL{10};
    static constexpr std::chrono::hours STORAGE_TTL{24};
    static constexpr uint32_t INTERACTIVE_MAX_USAGE = 1;
    static constexpr uint32_t STORAGE_MAX_USAGE = 2;
    static constexpr size_t MAX_KEY_ID_LENGTH = 128;
    static constexpr size_t SECURE_OVERWRITE_MIN_BYTES = 1024;
    static constexpr std::string_view KEY_FILE_EXTENSION = ".key";
    static constexpr std::string_view RETIRED_INDEX_FILE = ".retired";
    static constexpr std::string_view EXCHANGE_PURPOSE = "email_encryption";
};
struct PackageConstants {
    static constexpr std::string_view PROTOCOL = "ETSI-GS-QKD-014";
    static constexpr std::string_view VERSION = "1.0";
    static constexpr std::string_view ALGORITHM_OTP = "XOR_OTP";
    static constexpr std::string_view ALGORITHM_AES_GCM = "AES-256-GCM";
    static constexpr std::string_view ALGORITHM_CHACHA20 = "ChaCha20-Poly1305";
    static constexpr std::string_view ALGORITHM_HYBRID = "Hybrid-RSA-AES-256-GCM-Quantum";
    static constexpr std::string_view EPHEMERAL_RSA_WRAPPED = "rsa-oaep-wrapped";
    static constexpr std::string_view EPHEMERAL_QUANTUM_DERIVED = "quantum-derived";
};
}
