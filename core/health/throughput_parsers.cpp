#include "throughput_parsers.hpp"

#include <map>

namespace minekeeper {
namespace health {

namespace {

const std::map<std::string, ThroughputParser> &parser_table() {
    static const std::map<std::string, ThroughputParser> table = {
        {"castxmr", parse_castxmr},
        {"xmrstak", parse_xmrstak},
    };
    return table;
}

}  // namespace

double parse_castxmr(const nlohmann::json &status) {
    auto it = status.find("total_hash_rate");
    if (it == status.end()) {
        return kProbeFailure;
    }

    double hashrate = it->get<double>();
    if (hashrate > 0) {
        hashrate = hashrate / kCastXmrUnitDivisor;
    }
    return hashrate;
}

double parse_xmrstak(const nlohmann::json &status) {
    auto hashrate_info = status.find("hashrate");
    if (hashrate_info == status.end() || !hashrate_info->is_object() || hashrate_info->empty()) {
        return kProbeFailure;
    }

    // "total" is [10s, 60s, 15m] averages; the short window is reported first
    auto total = hashrate_info->find("total");
    if (total == hashrate_info->end() || !total->is_array() || total->empty()) {
        return kProbeFailure;
    }

    const auto &latest = total->front();
    if (!latest.is_number()) {
        return kProbeFailure;
    }

    double hashrate = latest.get<double>();
    if (hashrate == 0.0) {
        return kProbeFailure;
    }
    return hashrate;
}

std::optional<ThroughputParser> find_parser(const std::string &name) {
    const auto &table = parser_table();
    auto it = table.find(name);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> parser_names() {
    std::vector<std::string> names;
    for (const auto &[name, _] : parser_table()) {
        names.push_back(name);
    }
    return names;
}

}  // namespace health
}  // namespace minekeeper
