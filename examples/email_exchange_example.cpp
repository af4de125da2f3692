/**
 * @file email_exchange_example.cpp
 * @brief Alice sends Bob one message at each security level over a simulated BB84 link
 */

#include "qkmail/keys/key_manager.hpp"
#include "qkmail/keys/in_memory_key_repository.hpp"
#include "qkmail/providers/local_key_provider.hpp"
#include "qkmail/encryption/encryption_engine.hpp"
#include "qkmail/encryption/package_codec.hpp"
#include "qkmail/crypto/rsa_key_pair.hpp"
#include "qkmail/crypto/sodium_interop.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace qkmail;
using namespace qkmail::encryption;
using namespace qkmail::keys;

namespace {

bool SendAndReceive(
    KeyManager& alice,
    KeyManager& bob,
    const std::string& text,
    const SecurityLevel level,
    const configuration::MaximumLevelOptions& options,
    const crypto::RsaKeyPair* bob_private_key) {
    std::cout << "--- Level " << static_cast<int>(level) << " (" << SecurityLevelName(level) << ") ---" << std::endl;

    auto key = alice.RequestQuantumKey(bob.OwnerId(), 512);
    if (key.IsErr()) {
        std::cerr << "   Key request failed: " << key.UnwrapErr().message << std::endl;
        return false;
    }
    std::cout << "   ✓ Quantum key " << key.Unwrap().key_id << " (" << key.Unwrap().key_bytes.size() << " bytes)" << std::endl;

    const std::vector<uint8_t> body(text.begin(), text.end());
    auto encrypted = EncryptionEngine::Encrypt(body, key.Unwrap().key_bytes, level, options);
    if (encrypted.IsErr()) {
        std::cerr << "   Encryption failed: " << encrypted.UnwrapErr().message << std::endl;
        return false;
    }
    EncryptionResult result = std::move(encrypted).Unwrap();
    std::cout << "   ✓ Encrypted with " << AlgorithmOf(result.metadata) << std::endl;

    auto armored = PackageCodec::Armor(PackageCodec::BuildPackage(
        std::move(result.ciphertext), key.Unwrap().key_id, std::move(result.metadata), alice.OwnerId()));
    if (armored.IsErr()) {
        std::cerr << "   Packaging failed: " << armored.UnwrapErr().message << std::endl;
        return false;
    }
    std::cout << "   ✓ Armored package: " << armored.Unwrap().size() << " characters" << std::endl;

    auto package = PackageCodec::Dearmor(armored.Unwrap());
    if (package.IsErr()) {
        std::cerr << "   Package rejected: " << package.UnwrapErr().message << std::endl;
        return false;
    }
    auto bob_key = bob.RetrieveQuantumKey(package.Unwrap().sender_id, package.Unwrap().key_id);
    if (bob_key.IsErr()) {
        std::cerr << "   Key retrieval failed: " << bob_key.UnwrapErr().message << std::endl;
        return false;
    }
    auto decrypted = EncryptionEngine::Decrypt(
        package.Unwrap().ciphertext, bob_key.Unwrap().key_bytes, package.Unwrap().metadata, bob_private_key);
    if (decrypted.IsErr()) {
        std::cerr << "   Decryption failed: " << decrypted.UnwrapErr().message << std::endl;
        return false;
    }
    std::cout << "   ✓ Bob reads: " << std::string(decrypted.Unwrap().begin(), decrypted.Unwrap().end()) << std::endl;
    std::cout << std::endl;
    return true;
}

}

int main() {
    std::cout << "=== qkmail - Quantum Key Email Exchange ===" << std::endl;
    std::cout << std::endl;

    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }

    auto channel = std::make_shared<qkd::LocalKeyChannel>();
    KeyManager alice("alice@example.org", std::make_unique<InMemoryKeyRepository>(),
        std::make_shared<providers::LocalKeyProvider>(channel), configuration::KeyPolicy::Interactive());
    KeyManager bob("bob@example.org", std::make_unique<InMemoryKeyRepository>(),
        std::make_shared<providers::LocalKeyProvider>(channel), configuration::KeyPolicy::Interactive());

    auto bob_rsa = crypto::RsaKeyPair::Generate();
    if (bob_rsa.IsErr()) {
        std::cerr << "Failed to generate RSA key: " << bob_rsa.UnwrapErr().message << std::endl;
        return 1;
    }
    configuration::MaximumLevelOptions wrapped;
    wrapped.recipient_public_key = &bob_rsa.Unwrap();

    bool ok = true;
    ok &= SendAndReceive(alice, bob, "Lunch at noon?", SecurityLevel::Basic, {}, nullptr);
    ok &= SendAndReceive(alice, bob, "Draft contract attached.", SecurityLevel::Standard, {}, nullptr);
    ok &= SendAndReceive(alice, bob, "Payroll export for March.", SecurityLevel::High, {}, nullptr);
    ok &= SendAndReceive(alice, bob, "Acquisition shortlist.", SecurityLevel::Maximum, wrapped, &bob_rsa.Unwrap());

    auto alice_removed = alice.CleanupExpiredKeys();
    auto bob_removed = bob.CleanupExpiredKeys();
    if (alice_removed.IsErr() || bob_removed.IsErr()) {
        std::cerr << "Cleanup failed" << std::endl;
        return 1;
    }
    std::cout << "Cleanup erased " << alice_removed.Unwrap() << " keys for alice and "
              << bob_removed.Unwrap() << " for bob" << std::endl;

    return ok ? 0 : 1;
}
