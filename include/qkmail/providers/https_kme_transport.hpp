#pragma once
#include "qkmail/interfaces/i_kme_transport.hpp"
#include "qkmail/configuration/kme_config.hpp"
#include <boost/asio/ssl/context.hpp>
#include <memory>
namespace qkmail::providers {

/**
 * @brief HTTPS/1.1 transport with mutual TLS, one connection per call
 *
 * The client certificate chain and private key identify the SAE to the KME;
 * the KME certificate is verified against the configured CA and the host
 * name. Resolve, connect, handshake, write and read each get the configured
 * timeout. Send is safe to call from several threads at once.
 */
class HttpsKmeTransport final : public interfaces::IKmeTransport {
public:
    /// Loads CA and client credentials; unreadable or mismatched PEM files are ProviderTransport
    [[nodiscard]] static Result<std::unique_ptr<HttpsKmeTransport>, QkdFailure> Create(
        const configuration::KmeConfig& config);

    [[nodiscard]] Result<interfaces::KmeResponse, QkdFailure> Send(
        const interfaces::KmeRequest& request) override;

private:
    explicit HttpsKmeTransport(const configuration::KmeConfig& config);

    [[nodiscard]] Result<Unit, QkdFailure> LoadCredentials();

    configuration::KmeConfig config_;
    boost::asio::ssl::context ssl_context_;
};
}
