#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace minekeeper {
namespace health {

// Returned by every parser and by the prober when no usable throughput exists.
// Any value <= 0 is treated as a failed health check.
constexpr double kProbeFailure = -1.0;

// cast-xmr reports H/s; policy targets are in kH/s.
constexpr double kCastXmrUnitDivisor = 1000.0;

// Extracts a throughput figure from a decoded status document.
// May throw nlohmann::json::exception on unexpected types; the prober maps that to kProbeFailure.
using ThroughputParser = std::function<double(const nlohmann::json &)>;

// cast-xmr: top-level "total_hash_rate", scaled down when positive.
double parse_castxmr(const nlohmann::json &status);

// xmr-stak: first element of "hashrate.total".
double parse_xmrstak(const nlohmann::json &status);

// Look up a parser by its configuration name ("castxmr", "xmrstak")
std::optional<ThroughputParser> find_parser(const std::string &name);

// Names accepted by find_parser, for config validation messages
std::vector<std::string> parser_names();

}  // namespace health
}  // namespace minekeeper
