#include "lenia/growth.hpp"
#include "lenia/errors.hpp"
#include <cmath>

namespace lenia {

static const double kPi = 3.14159265358979323846;

struct GrowthEntry {
    GrowthKind kind;
    const char* name;
    GrowthFn fn;
};

static const GrowthEntry kRegistry[] = {
    {GrowthKind::Gauss, "gauss", &gauss},
    {GrowthKind::Sigmoid, "sigmoid", &sigmoid},
    {GrowthKind::Sinusoidal, "sinusoidal", &sinusoidal},
    {GrowthKind::MultiPeak, "multi_peak", &multi_peak},
    {GrowthKind::Soft, "soft", &soft},
    {GrowthKind::MultiPeakSoft, "multi_peak_soft", &multi_peak_soft},
};

double gauss(double x, double mean, double sigma) {
    const double z = (x - mean) / sigma;
    return std::exp(-0.5 * z * z);
}

double sigmoid(double x, double mean, double sigma) {
    return 1.0 / (1.0 + std::exp(-(x - mean) / sigma));
}

double sinusoidal(double x, double mean, double sigma) {
    const double s = std::sin(kPi * (x - mean) / sigma);
    return s * s;
}

// Second peak fixed at 0.6 / 0.05.
double multi_peak(double x, double mean, double sigma) {
    return gauss(x, mean, sigma) + gauss(x, 0.6, 0.05);
}

double soft(double x, double mean, double sigma) {
    return gauss(x, mean, sigma) + 0.3 * gauss(x, 0.5, 0.05);
}

double multi_peak_soft(double x, double mean, double sigma) {
    return soft(x, mean, sigma) + 0.3;
}

GrowthFn growth_function(GrowthKind kind) {
    for (const GrowthEntry& e : kRegistry) {
        if (e.kind == kind) return e.fn;
    }
    throw ConfigurationError("unregistered growth kind " + std::to_string(static_cast<int>(kind)));
}

GrowthKind growth_kind_from_name(const std::string& name) {
    for (const GrowthEntry& e : kRegistry) {
        if (name == e.name) return e.kind;
    }
    throw ConfigurationError("unknown growth function '" + name + "'");
}

std::string growth_kind_name(GrowthKind kind) {
    for (const GrowthEntry& e : kRegistry) {
        if (e.kind == kind) return e.name;
    }
    throw ConfigurationError("unregistered growth kind " + std::to_string(static_cast<int>(kind)));
}

std::vector<std::string> growth_kind_names() {
    std::vector<std::string> names;
    for (const GrowthEntry& e : kRegistry) names.push_back(e.name);
    return names;
}

Grid apply_growth(GrowthKind kind, const Grid& values, double mean, double sigma) {
    if (!std::isfinite(sigma) || sigma <= 0.0) {
        throw ConfigurationError("growth sigma must be positive, got " + std::to_string(sigma));
    }
    if (!std::isfinite(mean)) {
        throw ConfigurationError("growth mean must be finite");
    }
    const GrowthFn fn = growth_function(kind);
    Grid out = values;
    const std::size_t n = out.data.size();
    #pragma omp parallel for if(n > 16384)
    for (long i = 0; i < static_cast<long>(n); ++i) {
        out.data[i] = fn(out.data[i], mean, sigma);
    }
    return out;
}

}
