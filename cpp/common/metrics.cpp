#include "lenia/metrics.hpp"
#include <cmath>
#include <unordered_map>

namespace lenia {

double entropy(const std::vector<double>& data) {
    if (data.empty()) return 0.0;
    std::unordered_map<int, int> bins;
    for (double v : data) {
        int bucket = static_cast<int>(v * 10.0);
        if (bucket > 9) bucket = 9;
        if (bucket < 0) bucket = 0;
        bins[bucket]++;
    }
    const double total = static_cast<double>(data.size());
    double h = 0.0;
    for (auto& kv : bins) {
        double p = kv.second / total;
        h -= p * std::log2(p + 1e-12);
    }
    return h;
}

ChannelMetrics channel_metrics(const Grid& grid) {
    ChannelMetrics m;
    for (double v : grid.data) m.mass += v;
    m.mean = grid.data.empty() ? 0.0 : m.mass / static_cast<double>(grid.data.size());
    m.entropy = entropy(grid.data);
    return m;
}

std::vector<ChannelMetrics> channel_metrics(const ChannelStack& channels) {
    std::vector<ChannelMetrics> out;
    out.reserve(channels.size());
    for (const Grid& g : channels) out.push_back(channel_metrics(g));
    return out;
}

}
