#pragma once

/**
 * @file health_prober.hpp
 * @brief Reads the worker's throughput from its HTTP status endpoint
 *
 * A probe is one bounded GET against the endpoint followed by:
 * - sanitation of the raw body (workers emit stray non-ASCII bytes)
 * - JSON decoding with nlohmann::json
 * - extraction through the configured named parser
 *
 * Every transport, status, decode and parser error collapses into
 * kProbeFailure. The supervisor only ever sees a number.
 */

#include <string>

#include "health_endpoint.hpp"
#include "i_health_prober.hpp"
#include "throughput_parsers.hpp"

namespace minekeeper {
namespace health {

/**
 * @brief Build the endpoint URL: http://[user:password@]host:port/page
 *
 * Credentials are embedded only when both user and password are set.
 */
std::string build_url(const HealthEndpoint &endpoint);

/**
 * @brief Drop every byte that is not printable ASCII or ASCII whitespace
 */
std::string sanitize_body(const std::string &raw);

/**
 * @brief Sanitize, decode and run the parser over a response body
 *
 * @return Parsed throughput, or kProbeFailure if the body is not valid JSON
 *         or the parser rejects the document
 */
double parse_status_body(const std::string &raw_body, const ThroughputParser &parser);

class HealthProber : public IHealthProber {
public:
    HealthProber() = default;

    double probe(const HealthEndpoint &endpoint) override;
};

}  // namespace health
}  // namespace minekeeper
