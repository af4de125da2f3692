#pragma once
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include <string>
namespace qkmail::interfaces {

enum class HttpMethod {
    Get,
    Post
};

struct KmeRequest {
    HttpMethod method = HttpMethod::Get;
    /// Path and query relative to the host, e.g. "/api/v1/keys/SAE_B/status"
    std::string target;
    std::string body;
};

struct KmeResponse {
    unsigned int status = 0;
    std::string body;
};

/**
 * One round trip to a KME.
 *
 * Implementations return Err(ProviderTransport) only when no HTTP response
 * was obtained (resolve, connect, TLS, timeout). Any HTTP status, including
 * 4xx and 5xx, is a successful Send.
 */
class IKmeTransport {
public:
    virtual ~IKmeTransport() = default;
    [[nodiscard]] virtual Result<KmeResponse, QkdFailure> Send(const KmeRequest& request) = 0;
};
}
