#pragma once

#include "swarmbed/error.hpp"
#include <cstdint>
#include <string>

namespace swarmbed::node {

struct BandwidthStats {
    uint64_t total_in = 0;
    uint64_t total_out = 0;
    double rate_in = 0.0;
    double rate_out = 0.0;
};

/**
 * Parse the JSON printed by `<daemon> stats bw --enc=json`
 * ({"TotalIn":..,"TotalOut":..,"RateIn":..,"RateOut":..}).
 * TotalIn and TotalOut are required, rates default to zero.
 */
Result<BandwidthStats> parse_bandwidth(const std::string& json_text);

} // namespace swarmbed::node
