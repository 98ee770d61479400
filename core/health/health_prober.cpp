/**
 * @file health_prober.cpp
 * @brief Implementation of the HTTP health prober
 */

#include "health_prober.hpp"

#include <httplib.h>

#include <chrono>
#include <sstream>

#include "logging/logger.hpp"

namespace minekeeper {
namespace health {

namespace {

bool is_printable(unsigned char c) {
    // Same set as Python's string.printable: visible ASCII plus " \t\n\r\v\f"
    if (c >= 0x20 && c <= 0x7e) {
        return true;
    }
    return c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string request_path(const HealthEndpoint &endpoint) { return "/" + endpoint.page; }

}  // namespace

std::string build_url(const HealthEndpoint &endpoint) {
    std::ostringstream url;
    url << "http://";
    if (!endpoint.user.empty() && !endpoint.password.empty()) {
        url << endpoint.user << ":" << endpoint.password << "@";
    }
    url << endpoint.host << ":" << endpoint.port << request_path(endpoint);
    return url.str();
}

std::string sanitize_body(const std::string &raw) {
    std::string clean;
    clean.reserve(raw.size());
    for (char c : raw) {
        if (is_printable(static_cast<unsigned char>(c))) {
            clean += c;
        }
    }
    return clean;
}

double parse_status_body(const std::string &raw_body, const ThroughputParser &parser) {
    const std::string body = sanitize_body(raw_body);

    try {
        auto status = nlohmann::json::parse(body);
        if (status.is_null()) {
            return kProbeFailure;
        }
        return parser(status);
    } catch (const nlohmann::json::parse_error &e) {
        LOG_WARN("[Health] Malformed status document: " << e.what());
    } catch (const nlohmann::json::exception &e) {
        LOG_WARN("[Health] Unexpected status document layout: " << e.what());
    }
    return kProbeFailure;
}

double HealthProber::probe(const HealthEndpoint &endpoint) {
    if (endpoint.format != ResponseFormat::JSON) {
        LOG_ERROR("[Health] Unsupported response format");
        return kProbeFailure;
    }

    auto parser = find_parser(endpoint.parser);
    if (!parser) {
        LOG_ERROR("[Health] Unknown throughput parser '" << endpoint.parser << "'");
        return kProbeFailure;
    }

    LOG_DEBUG("[Health] GET " << build_url(endpoint));

    httplib::Client client(endpoint.host, endpoint.port);
    client.set_connection_timeout(std::chrono::seconds(endpoint.timeout_seconds));
    client.set_read_timeout(std::chrono::seconds(endpoint.timeout_seconds));
    client.set_write_timeout(std::chrono::seconds(endpoint.timeout_seconds));

    if (!endpoint.user.empty() && !endpoint.password.empty()) {
        client.set_basic_auth(endpoint.user, endpoint.password);
    }

    auto result = client.Get(request_path(endpoint));
    if (!result) {
        LOG_WARN("[Health] Request failed: " << httplib::to_string(result.error()));
        return kProbeFailure;
    }

    if (result->status != 200) {
        LOG_WARN("[Health] Endpoint returned HTTP " << result->status);
        return kProbeFailure;
    }

    return parse_status_body(result->body, *parser);
}

}  // namespace health
}  // namespace minekeeper
