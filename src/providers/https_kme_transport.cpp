#include "qkmail/providers/https_kme_transport.hpp"
#include "qkmail/core/format.hpp"
#include "qkmail/debug/event_logger.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <string_view>
namespace qkmail::providers {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using interfaces::HttpMethod;
using interfaces::KmeRequest;
using interfaces::KmeResponse;
using debug::Role;
namespace {
    constexpr std::string_view USER_AGENT = "qkmail-kme-client/1.0";
    constexpr std::string_view JSON_CONTENT_TYPE = "application/json";

    QkdFailure StepFailure(const std::string& step, const beast::error_code& ec) {
        if (ec == beast::error::timeout) {
            return QkdFailure::ProviderTransport("Timed out during " + step);
        }
        return QkdFailure::ProviderTransport(step + " failed: " + ec.message());
    }

    /// Runs one asynchronous operation to completion on a private io_context.
    template<typename Initiation>
    beast::error_code RunStep(net::io_context& ioc, Initiation&& initiate) {
        beast::error_code result = net::error::operation_aborted;
        std::forward<Initiation>(initiate)([&result](beast::error_code ec, auto&&...) {
            result = ec;
        });
        ioc.run();
        ioc.restart();
        return result;
    }
}
HttpsKmeTransport::HttpsKmeTransport(const configuration::KmeConfig& config)
    : config_(config), ssl_context_(ssl::context::tls_client) {}
Result<std::unique_ptr<HttpsKmeTransport>, QkdFailure> HttpsKmeTransport::Create(
    const configuration::KmeConfig& config) {
    if (config.host.empty()) {
        return Result<std::unique_ptr<HttpsKmeTransport>, QkdFailure>::Err(
            QkdFailure::InvalidInput("KME host is required"));
    }
    if (config.ca_cert_path.empty() || config.client_cert_path.empty() || config.client_key_path.empty()) {
        return Result<std::unique_ptr<HttpsKmeTransport>, QkdFailure>::Err(
            QkdFailure::InvalidInput("KME CA certificate, client certificate and client key paths are required"));
    }
    std::unique_ptr<HttpsKmeTransport> transport(new HttpsKmeTransport(config));
    if (auto loaded = transport->LoadCredentials(); loaded.IsErr()) {
        return Result<std::unique_ptr<HttpsKmeTransport>, QkdFailure>::Err(std::move(loaded).UnwrapErr());
    }
    return Result<std::unique_ptr<HttpsKmeTransport>, QkdFailure>::Ok(std::move(transport));
}
Result<Unit, QkdFailure> HttpsKmeTransport::LoadCredentials() {
    beast::error_code ec;
    ssl_context_.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1, ec);
    if (ec) {
        return Result<Unit, QkdFailure>::Err(StepFailure("TLS option setup", ec));
    }
    ssl_context_.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
    if (ec) {
        return Result<Unit, QkdFailure>::Err(StepFailure("TLS verify mode setup", ec));
    }
    ssl_context_.load_verify_file(config_.ca_cert_path, ec);
    if (ec) {
        return Result<Unit, QkdFailure>::Err(StepFailure("Loading KME CA " + config_.ca_cert_path, ec));
    }
    ssl_context_.use_certificate_chain_file(config_.client_cert_path, ec);
    if (ec) {
        return Result<Unit, QkdFailure>::Err(
            StepFailure("Loading SAE certificate " + config_.client_cert_path, ec));
    }
    ssl_context_.use_private_key_file(config_.client_key_path, ssl::context::pem, ec);
    if (ec) {
        return Result<Unit, QkdFailure>::Err(
            StepFailure("Loading SAE private key " + config_.client_key_path, ec));
    }
    if (SSL_CTX_check_private_key(ssl_context_.native_handle()) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::ProviderTransport("SAE private key does not match its certificate"));
    }
    return Result<Unit, QkdFailure>::Ok(unit);
}
Result<KmeResponse, QkdFailure> HttpsKmeTransport::Send(const KmeRequest& request) {
    QKM_LOG_EVENT(Role::Unknown, "kme.send", config_.host + request.target);
    try {
        net::io_context ioc;
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_context_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), config_.host.c_str())) {
            return Result<KmeResponse, QkdFailure>::Err(
                QkdFailure::ProviderTransport("Failed to set TLS server name " + config_.host));
        }
        stream.set_verify_callback(ssl::host_name_verification(config_.host));

        tcp::resolver resolver(ioc);
        tcp::resolver::results_type endpoints;
        beast::error_code ec = net::error::would_block;
        resolver.async_resolve(config_.host, std::to_string(config_.port),
            [&ec, &endpoints](beast::error_code resolve_ec, tcp::resolver::results_type results) {
                ec = resolve_ec;
                endpoints = std::move(results);
            });
        ioc.run_for(config_.timeout);
        if (ec == net::error::would_block) {
            resolver.cancel();
            ioc.restart();
            ioc.run();
            return Result<KmeResponse, QkdFailure>::Err(
                QkdFailure::ProviderTransport("Timed out resolving " + config_.host));
        }
        ioc.restart();
        if (ec) {
            return Result<KmeResponse, QkdFailure>::Err(StepFailure("Resolving " + config_.host, ec));
        }

        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        ec = RunStep(ioc, [&](auto handler) {
            beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
        });
        if (ec) {
            return Result<KmeResponse, QkdFailure>::Err(StepFailure("Connecting to " + config_.host, ec));
        }

        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        ec = RunStep(ioc, [&](auto handler) {
            stream.async_handshake(ssl::stream_base::client, std::move(handler));
        });
        if (ec) {
            return Result<KmeResponse, QkdFailure>::Err(StepFailure("TLS handshake", ec));
        }

        http::request<http::string_body> http_request{
            request.method == HttpMethod::Post ? http::verb::post : http::verb::get,
            request.target,
            EtsiConstants::HTTP_VERSION_1_1};
        http_request.set(http::field::host,
            config_.port == EtsiConstants::HTTPS_PORT
                ? config_.host
                : compat::format("{}:{}", config_.host, config_.port));
        http_request.set(http::field::user_agent, std::string(USER_AGENT));
        http_request.set(http::field::accept, std::string(JSON_CONTENT_TYPE));
        http_request.set(http::field::content_type, std::string(JSON_CONTENT_TYPE));
        http_request.body() = request.body;
        http_request.prepare_payload();

        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        ec = RunStep(ioc, [&](auto handler) {
            http::async_write(stream, http_request, std::move(handler));
        });
        if (ec) {
            return Result<KmeResponse, QkdFailure>::Err(StepFailure("Sending request", ec));
        }

        beast::flat_buffer buffer;
        http::response<http::string_body> http_response;
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        ec = RunStep(ioc, [&](auto handler) {
            http::async_read(stream, buffer, http_response, std::move(handler));
        });
        if (ec) {
            return Result<KmeResponse, QkdFailure>::Err(StepFailure("Reading response", ec));
        }

        // The response is complete; a KME that drops the connection without
        // close_notify does not invalidate it.
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        ec = RunStep(ioc, [&](auto handler) {
            stream.async_shutdown(std::move(handler));
        });
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            QKM_LOG_EVENT(Role::Unknown, "kme.shutdown", ec.message());
        }

        QKM_LOG_VALUE(Role::Unknown, "kme.send", "status", http_response.result_int());
        return Result<KmeResponse, QkdFailure>::Ok(
            KmeResponse{http_response.result_int(), std::move(http_response.body())});
    } catch (const std::exception& ex) {
        return Result<KmeResponse, QkdFailure>::Err(
            QkdFailure::ProviderTransport("KME request failed: " + std::string(ex.what())));
    }
}
}
