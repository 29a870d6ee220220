#pragma once
#include <vector>

#include "lenia/grid.hpp"

namespace lenia {

struct ChannelMetrics {
    double mass = 0.0;
    double mean = 0.0;
    double entropy = 0.0;
};

// Shannon entropy (bits) of a 10-bin histogram over [0, 1].
double entropy(const std::vector<double>& data);

ChannelMetrics channel_metrics(const Grid& grid);
std::vector<ChannelMetrics> channel_metrics(const ChannelStack& channels);

}
