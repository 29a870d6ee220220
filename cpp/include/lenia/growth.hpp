#pragma once
#include <string>
#include <vector>

#include "lenia/grid.hpp"

namespace lenia {

enum class GrowthKind {
    Gauss,
    Sigmoid,
    Sinusoidal,
    MultiPeak,
    Soft,
    MultiPeakSoft
};

double gauss(double x, double mean, double sigma);
double sigmoid(double x, double mean, double sigma);
double sinusoidal(double x, double mean, double sigma);
double multi_peak(double x, double mean, double sigma);
double soft(double x, double mean, double sigma);
double multi_peak_soft(double x, double mean, double sigma);

using GrowthFn = double (*)(double, double, double);

GrowthFn growth_function(GrowthKind kind);

// Throws ConfigurationError for an unregistered name.
GrowthKind growth_kind_from_name(const std::string& name);
std::string growth_kind_name(GrowthKind kind);
std::vector<std::string> growth_kind_names();

// Element-wise application; identical to calling the scalar form per cell.
// Throws ConfigurationError for sigma <= 0 or a non-finite mean.
Grid apply_growth(GrowthKind kind, const Grid& values, double mean, double sigma);

}
