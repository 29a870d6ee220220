#include "lenia/ca_stepper.hpp"
#include "lenia/errors.hpp"
#include "lenia/fft.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace lenia {

ActiveSet ActiveSet::all(std::size_t kernel_count) {
    ActiveSet s;
    s.indices_.reserve(kernel_count);
    for (std::size_t i = 0; i < kernel_count; ++i) s.indices_.push_back(i);
    return s;
}

ActiveSet ActiveSet::from_mask(const std::vector<bool>& mask) {
    ActiveSet s;
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) s.indices_.push_back(i);
    }
    return s;
}

void ActiveSet::set(std::size_t index, bool active) {
    auto it = std::lower_bound(indices_.begin(), indices_.end(), index);
    const bool present = it != indices_.end() && *it == index;
    if (active && !present) indices_.insert(it, index);
    if (!active && present) indices_.erase(it);
}

void ActiveSet::toggle(std::size_t index) {
    set(index, !contains(index));
}

bool ActiveSet::contains(std::size_t index) const {
    return std::binary_search(indices_.begin(), indices_.end(), index);
}

static void check_coefficient(std::size_t i, std::size_t j, double value) {
    if (!std::isfinite(value)) {
        throw ConfigurationError("interaction coefficient (" + std::to_string(i) + ", " +
                                 std::to_string(j) + ") must be finite");
    }
}

InteractionMatrix::InteractionMatrix(std::size_t channels)
    : n_(channels), coeffs_(channels * channels, 0.0) {}

InteractionMatrix::InteractionMatrix(const std::vector<std::vector<double>>& rows)
    : n_(rows.size()), coeffs_() {
    coeffs_.reserve(n_ * n_);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != n_) {
            throw ConfigurationError("interaction matrix row " + std::to_string(i) + " has " +
                                     std::to_string(rows[i].size()) + " entries, expected " +
                                     std::to_string(n_));
        }
        for (std::size_t j = 0; j < n_; ++j) {
            check_coefficient(i, j, rows[i][j]);
            coeffs_.push_back(rows[i][j]);
        }
    }
}

double InteractionMatrix::at(std::size_t i, std::size_t j) const {
    if (i >= n_ || j >= n_) {
        throw ConfigurationError("interaction index (" + std::to_string(i) + ", " +
                                 std::to_string(j) + ") outside " + std::to_string(n_) + "x" +
                                 std::to_string(n_));
    }
    return coeffs_[i * n_ + j];
}

void InteractionMatrix::set(std::size_t i, std::size_t j, double value) {
    if (i >= n_ || j >= n_) {
        throw ConfigurationError("interaction index (" + std::to_string(i) + ", " +
                                 std::to_string(j) + ") outside " + std::to_string(n_) + "x" +
                                 std::to_string(n_));
    }
    check_coefficient(i, j, value);
    coeffs_[i * n_ + j] = value;
}

InteractionMatrix InteractionMatrix::scaled(double factor) const {
    InteractionMatrix m = *this;
    for (std::size_t k = 0; k < m.coeffs_.size(); ++k) {
        m.coeffs_[k] *= factor;
        check_coefficient(k / n_, k % n_, m.coeffs_[k]);
    }
    return m;
}

static void validate_step(const ChannelStack& channels, const KernelBank& kernels,
                          const ActiveSet& active, const InteractionMatrix& interaction, double dt) {
    const GridShape shape = stack_shape(channels);
    if (shape != kernels.shape()) {
        throw ShapeMismatchError("channels are " + to_string(shape) + " but kernels were built for " +
                                 to_string(kernels.shape()));
    }
    if (channels.size() != kernels.channel_count()) {
        throw ConfigurationError("kernel bank expects " + std::to_string(kernels.channel_count()) +
                                 " channels, got " + std::to_string(channels.size()));
    }
    if (!active.empty() && active.indices().back() >= kernels.size()) {
        throw ConfigurationError("active kernel " + std::to_string(active.indices().back()) +
                                 " but only " + std::to_string(kernels.size()) + " kernels exist");
    }
    if (interaction.size() != 0 && interaction.size() != channels.size()) {
        throw ConfigurationError("interaction matrix is " + std::to_string(interaction.size()) +
                                 "x" + std::to_string(interaction.size()) + " for " +
                                 std::to_string(channels.size()) + " channels");
    }
    if (!std::isfinite(dt)) {
        throw ConfigurationError("dt must be finite");
    }
}

ChannelStack ca_step(const ChannelStack& channels, const KernelBank& kernels,
                     const ActiveSet& active, GrowthKind growth,
                     const InteractionMatrix& interaction, double dt) {
    validate_step(channels, kernels, active, interaction, dt);
    const GrowthFn fn = growth_function(growth);

    const GridShape shape = kernels.shape();
    const std::size_t cells = shape.cells();
    const long channel_count = static_cast<long>(channels.size());
    const std::vector<std::size_t>& idx = active.indices();
    const long kernel_count = static_cast<long>(idx.size());

    // Channel spectra are only needed for sources of active kernels.
    std::vector<bool> is_source(channels.size(), false);
    for (std::size_t k : idx) is_source[kernels.descriptor(k).source] = true;

    std::vector<Spectrum> spectra(channels.size());
    #pragma omp parallel if(cells > 4096)
    {
        Fft2D fft;
        #pragma omp for
        for (long c = 0; c < channel_count; ++c) {
            if (is_source[c]) spectra[c] = fft.forward(channels[c]);
        }
    }

    std::vector<Grid> activations(idx.size());
    #pragma omp parallel if(cells > 4096 && kernel_count > 1)
    {
        Fft2D fft;
        #pragma omp for schedule(dynamic)
        for (long n = 0; n < kernel_count; ++n) {
            const KernelDescriptor& k = kernels.descriptor(idx[n]);
            Grid u = fft.inverse_real(multiply(spectra[k.source], kernels.transform(idx[n])));
            for (double& v : u.data) v = 2.0 * fn(v, k.mean, k.sigma) - 1.0;
            activations[n] = std::move(u);
        }
    }

    ChannelStack acc = make_stack(channels.size(), shape, 0.0);
    // Merged in ascending kernel order so the summation order is fixed.
    for (long n = 0; n < kernel_count; ++n) {
        const KernelDescriptor& k = kernels.descriptor(idx[n]);
        std::vector<double>& dst = acc[k.destination].data;
        const std::vector<double>& a = activations[n].data;
        for (std::size_t p = 0; p < cells; ++p) dst[p] += k.height * a[p];
    }

    if (interaction.size() != 0) {
        for (std::size_t i = 0; i < channels.size(); ++i) {
            std::vector<double>& dst = acc[i].data;
            for (std::size_t j = 0; j < channels.size(); ++j) {
                if (i == j) continue;
                const double w = interaction.at(i, j);
                if (w == 0.0) continue;
                const std::vector<double>& src = channels[j].data;
                for (std::size_t p = 0; p < cells; ++p) dst[p] += w * src[p];
            }
        }
    }

    ChannelStack out(channels.size());
    #pragma omp parallel for if(cells > 4096)
    for (long c = 0; c < channel_count; ++c) {
        Grid g(shape);
        const std::vector<double>& x = channels[c].data;
        const std::vector<double>& g_acc = acc[c].data;
        for (std::size_t p = 0; p < cells; ++p) {
            double updated = x[p] + dt * g_acc[p];
            if (updated < 0.0) updated = 0.0;
            if (updated > 1.0) updated = 1.0;
            g.data[p] = updated;
        }
        out[c] = std::move(g);
    }
    return out;
}

}
