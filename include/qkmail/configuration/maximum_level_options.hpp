#pragma once

namespace qkmail::crypto {
class RsaKeyPair;
}

namespace qkmail::configuration {

/// Ephemeral-key handling for SecurityLevel::Maximum
///
/// With `recipient_public_key` set, the ephemeral key is wrapped with
/// RSA-OAEP for the recipient. Without it, encryption fails unless
/// `allow_quantum_derived_ephemeral` is set, in which case the ephemeral key
/// is derived from the quantum key and the metadata is labeled accordingly.
struct MaximumLevelOptions {
    const crypto::RsaKeyPair* recipient_public_key = nullptr;
    bool allow_quantum_derived_ephemeral = false;
};

} // namespace qkmail::configuration
