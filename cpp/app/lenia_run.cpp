#include "lenia/ca_stepper.hpp"
#include "lenia/config.hpp"
#include "lenia/errors.hpp"
#include "lenia/kernel.hpp"
#include "lenia/log.hpp"
#include "lenia/metrics.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>

using namespace lenia;

// Low noise plus a handful of soft discs per channel.
static ChannelStack seed_channels(const SimulationConfig& cfg) {
    std::mt19937 gen(cfg.seed);
    std::uniform_real_distribution<double> dis(0.0, 1.0);
    ChannelStack channels = make_stack(cfg.channels, cfg.shape, 0.0);

    const double h = static_cast<double>(cfg.shape.height);
    const double w = static_cast<double>(cfg.shape.width);
    for (Grid& g : channels) {
        for (double& v : g.data) v = dis(gen) * 0.1;
        for (int blob = 0; blob < 4; ++blob) {
            const double cx = dis(gen) * w;
            const double cy = dis(gen) * h;
            const double r = std::max(2.0, (0.05 + 0.1 * dis(gen)) * std::min(h, w));
            for (std::size_t y = 0; y < cfg.shape.height; ++y) {
                for (std::size_t x = 0; x < cfg.shape.width; ++x) {
                    const double dx = x - cx;
                    const double dy = y - cy;
                    const double dist = std::sqrt(dx * dx + dy * dy);
                    if (dist < r) {
                        const double t = dist / r;
                        g.at(y, x) = std::max(g.at(y, x), (1.0 - t * t) * 0.9);
                    }
                }
            }
        }
    }
    return channels;
}

static void log_metrics(std::size_t step, const ChannelStack& channels) {
    const std::vector<ChannelMetrics> metrics = channel_metrics(channels);
    for (std::size_t c = 0; c < metrics.size(); ++c) {
        logger()->info("step {} channel {}: mass {:.2f} mean {:.4f} entropy {:.3f}", step, c,
                       metrics[c].mass, metrics[c].mean, metrics[c].entropy);
    }
}

int main(int argc, char** argv) {
    try {
        SimulationConfig cfg = argc > 1 ? load_simulation_config(argv[1]) : default_simulation_config();
        set_log_level(cfg.log_level);
        if (argc <= 1) logger()->info("no config file given, using built-in configuration");

        KernelGenerator generator;
        KernelBank bank(cfg.kernels, cfg.shape, cfg.channels, generator);
        ActiveSet active = ActiveSet::from_mask(cfg.active);
        logger()->info("{} of {} kernels active, growth {}, dt {}", active.size(), bank.size(),
                       growth_kind_name(cfg.growth), cfg.dt);

        ChannelStack channels = seed_channels(cfg);
        log_metrics(0, channels);

        const auto start = std::chrono::steady_clock::now();
        for (std::size_t step = 1; step <= cfg.steps; ++step) {
            channels = ca_step(channels, bank, active, cfg.growth, cfg.interaction, cfg.dt);
            if (cfg.log_every > 0 && step % cfg.log_every == 0) log_metrics(step, channels);
        }
        const double seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        logger()->info("{} steps in {:.2f}s", cfg.steps, seconds);
    } catch (const Error& e) {
        logger()->critical("{}", e.what());
        return 1;
    }
    return 0;
}
