#include "node/bandwidth.hpp"

#include <nlohmann/json.hpp>

namespace swarmbed::node {

using json = nlohmann::json;

Result<BandwidthStats> parse_bandwidth(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Result<BandwidthStats>::Err(ErrorCode::InvalidFormat,
            "bandwidth stats are not JSON", e.what());
    }

    if (!doc.is_object() || !doc.contains("TotalIn") || !doc.contains("TotalOut")) {
        return Result<BandwidthStats>::Err(ErrorCode::InvalidFormat,
            "bandwidth stats lack TotalIn/TotalOut", json_text);
    }

    BandwidthStats stats;
    try {
        stats.total_in = doc.at("TotalIn").get<uint64_t>();
        stats.total_out = doc.at("TotalOut").get<uint64_t>();
        stats.rate_in = doc.value("RateIn", 0.0);
        stats.rate_out = doc.value("RateOut", 0.0);
    } catch (const json::exception& e) {
        return Result<BandwidthStats>::Err(ErrorCode::InvalidFormat,
            "bandwidth stats have unexpected types", e.what());
    }
    return Result<BandwidthStats>::Ok(stats);
}

} // namespace swarmbed::node
