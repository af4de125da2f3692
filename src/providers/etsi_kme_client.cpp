#include "qkmail/providers/etsi_kme_client.hpp"
#include "qkmail/core/constants.hpp"
#include "qkmail/core/format.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <cctype>
#include <sstream>
#include <stdexcept>
namespace qkmail::providers {
namespace pt = boost::property_tree;
using interfaces::HttpMethod;
using interfaces::IKmeTransport;
using interfaces::KmeRequest;
using interfaces::KmeResponse;
namespace {
    constexpr size_t MAX_ERROR_BODY_CHARS = 512;

    std::string Truncate(const std::string& text) {
        if (text.size() <= MAX_ERROR_BODY_CHARS) {
            return text;
        }
        return text.substr(0, MAX_ERROR_BODY_CHARS) + "...";
    }

    bool IsFalsyLeaf(const pt::ptree& node) {
        if (!node.empty()) {
            return false;
        }
        const std::string& data = node.data();
        return data.empty() || data == "null" || data == "false";
    }

    /// Flattens an "error"/"errors" payload into one line, preferring "message" members.
    std::string Describe(const pt::ptree& node) {
        if (node.empty()) {
            return node.data();
        }
        if (const auto message = node.get_optional<std::string>(std::string(EtsiConstants::FIELD_MESSAGE))) {
            return *message;
        }
        std::string joined;
        for (const auto& [name, child] : node) {
            const std::string part = Describe(child);
            if (part.empty()) {
                continue;
            }
            if (!joined.empty()) {
                joined += "; ";
            }
            joined += name.empty() ? part : name + ": " + part;
        }
        return joined;
    }

    std::optional<std::string> FindApiError(const pt::ptree& body) {
        const auto error = body.find(std::string(EtsiConstants::FIELD_ERROR));
        if (error != body.not_found()) {
            return Describe(error->second);
        }
        const auto errors = body.find(std::string(EtsiConstants::FIELD_ERRORS));
        if (errors != body.not_found() && !IsFalsyLeaf(errors->second)) {
            return Describe(errors->second);
        }
        return std::nullopt;
    }

    bool IsSuccessStatus(const unsigned int status) {
        return status >= EtsiConstants::HTTP_OK_MIN && status <= EtsiConstants::HTTP_OK_MAX;
    }

    Result<pt::ptree, QkdFailure> Exchange(
        IKmeTransport& transport,
        const HttpMethod method,
        std::string target) {
        auto sent = transport.Send(KmeRequest{method, std::move(target), {}});
        if (sent.IsErr()) {
            return Result<pt::ptree, QkdFailure>::Err(std::move(sent).UnwrapErr());
        }
        const KmeResponse& response = sent.Unwrap();
        const std::string status_text = compat::format("HTTP {}", response.status);

        pt::ptree body;
        bool is_json = false;
        if (!response.body.empty()) {
            try {
                std::istringstream input(response.body);
                pt::read_json(input, body);
                is_json = true;
            } catch (const pt::json_parser_error&) {
                is_json = false;
            }
        }

        if (!is_json) {
            if (!IsSuccessStatus(response.status)) {
                return Result<pt::ptree, QkdFailure>::Err(
                    QkdFailure::ProviderTransport(status_text + ": " + Truncate(response.body)));
            }
            return Result<pt::ptree, QkdFailure>::Err(
                QkdFailure::ProviderProtocol(status_text + ": KME response is not a JSON object"));
        }
        if (auto api_error = FindApiError(body)) {
            return Result<pt::ptree, QkdFailure>::Err(
                QkdFailure::ProviderProtocol("KME API error (" + status_text + "): " + *api_error));
        }
        if (!IsSuccessStatus(response.status)) {
            if (const auto message = body.get_optional<std::string>(std::string(EtsiConstants::FIELD_MESSAGE))) {
                return Result<pt::ptree, QkdFailure>::Err(
                    QkdFailure::ProviderProtocol("KME API error (" + status_text + "): " + *message));
            }
            return Result<pt::ptree, QkdFailure>::Err(
                QkdFailure::ProviderTransport(status_text + ": " + Truncate(response.body)));
        }
        return Result<pt::ptree, QkdFailure>::Ok(std::move(body));
    }

    std::optional<int64_t> ReadInteger(const pt::ptree& body, std::string_view field) {
        if (const auto value = body.get_optional<int64_t>(std::string(field))) {
            return *value;
        }
        return std::nullopt;
    }

    Result<std::vector<KeyContainerEntry>, QkdFailure> ParseKeyContainer(const pt::ptree& body) {
        std::vector<KeyContainerEntry> entries;
        const auto keys = body.get_child_optional(std::string(EtsiConstants::FIELD_KEYS));
        if (!keys) {
            return Result<std::vector<KeyContainerEntry>, QkdFailure>::Ok(std::move(entries));
        }
        for (const auto& [unused_name, element] : *keys) {
            KeyContainerEntry entry;
            bool has_id = false;
            bool has_key = false;
            for (const auto& [field, value] : element) {
                if (EtsiKmeClient::IsKeyIdField(field)) {
                    entry.key_id = value.data();
                    has_id = true;
                } else if (field == EtsiConstants::FIELD_KEY) {
                    entry.key_base64 = value.data();
                    has_key = true;
                }
            }
            if (!has_id || entry.key_id.empty()) {
                return Result<std::vector<KeyContainerEntry>, QkdFailure>::Err(
                    QkdFailure::ProviderProtocol("Key container entry has no key_ID"));
            }
            if (!has_key || entry.key_base64.empty()) {
                return Result<std::vector<KeyContainerEntry>, QkdFailure>::Err(
                    QkdFailure::ProviderProtocol("Key container entry " + entry.key_id + " has no key material"));
            }
            entries.push_back(std::move(entry));
        }
        return Result<std::vector<KeyContainerEntry>, QkdFailure>::Ok(std::move(entries));
    }
}
EtsiKmeClient::EtsiKmeClient(std::shared_ptr<IKmeTransport> transport, std::string base_path)
    : transport_(std::move(transport)), base_path_(std::move(base_path)) {
    if (!transport_) {
        throw std::invalid_argument("EtsiKmeClient requires a transport");
    }
    while (!base_path_.empty() && base_path_.back() == '/') {
        base_path_.pop_back();
    }
}
Result<KeyStreamStatus, QkdFailure> EtsiKmeClient::GetStatus(const std::string& slave_sae_id) {
    auto body = Exchange(*transport_, HttpMethod::Get,
        base_path_ + "/keys/" + PercentEncode(slave_sae_id) + "/status");
    if (body.IsErr()) {
        return Result<KeyStreamStatus, QkdFailure>::Err(std::move(body).UnwrapErr());
    }
    const pt::ptree& tree = body.Unwrap();
    KeyStreamStatus status;
    if (const auto count = ReadInteger(tree, EtsiConstants::FIELD_STORED_KEY_COUNT)) {
        status.stored_key_count = *count > 0 ? static_cast<uint64_t>(*count) : 0;
    }
    if (const auto max_size = ReadInteger(tree, EtsiConstants::FIELD_MAX_KEY_SIZE); max_size && *max_size >= 0) {
        status.max_key_size = static_cast<uint32_t>(*max_size);
    }
    if (const auto expiry = ReadInteger(tree, EtsiConstants::FIELD_KEY_EXPIRY_TIME); expiry && *expiry >= 0) {
        status.key_expiry_time = std::chrono::seconds(*expiry);
    }
    return Result<KeyStreamStatus, QkdFailure>::Ok(status);
}
Result<std::vector<KeyContainerEntry>, QkdFailure> EtsiKmeClient::GetKeys(
    const std::string& slave_sae_id,
    const uint32_t number,
    const uint32_t size_bits) {
    auto body = Exchange(*transport_, HttpMethod::Post,
        compat::format("{}/keys/{}/enc_keys?number={}&size={}",
            base_path_, PercentEncode(slave_sae_id), number, size_bits));
    if (body.IsErr()) {
        return Result<std::vector<KeyContainerEntry>, QkdFailure>::Err(std::move(body).UnwrapErr());
    }
    return ParseKeyContainer(body.Unwrap());
}
Result<std::vector<KeyContainerEntry>, QkdFailure> EtsiKmeClient::GetKeysById(
    const std::string& master_sae_id,
    const std::vector<std::string>& key_ids) {
    std::vector<KeyContainerEntry> collected;
    for (const auto& key_id : key_ids) {
        auto body = Exchange(*transport_, HttpMethod::Get,
            base_path_ + "/keys/" + PercentEncode(master_sae_id) + "/dec_keys?key_ID=" + PercentEncode(key_id));
        if (body.IsErr()) {
            return Result<std::vector<KeyContainerEntry>, QkdFailure>::Err(std::move(body).UnwrapErr());
        }
        auto parsed = ParseKeyContainer(body.Unwrap());
        if (parsed.IsErr()) {
            return parsed;
        }
        for (auto& entry : parsed.Unwrap()) {
            collected.push_back(std::move(entry));
        }
    }
    return Result<std::vector<KeyContainerEntry>, QkdFailure>::Ok(std::move(collected));
}
std::string EtsiKmeClient::PercentEncode(std::string_view value) {
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (const char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '-' || c == '.' || c == '_' || c == '~') {
            encoded.push_back(c);
        } else {
            encoded.push_back('%');
            encoded.push_back(hex_chars[byte >> 4]);
            encoded.push_back(hex_chars[byte & 0x0F]);
        }
    }
    return encoded;
}
bool EtsiKmeClient::IsKeyIdField(std::string_view name) {
    std::string normalized;
    normalized.reserve(name.size());
    for (const char c : name) {
        if (c != '_') {
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return normalized == EtsiConstants::NORMALIZED_KEY_ID_FIELD;
}
}
