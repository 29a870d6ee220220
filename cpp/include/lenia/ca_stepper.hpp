#pragma once
#include <vector>
#include <cstddef>

#include "lenia/grid.hpp"
#include "lenia/growth.hpp"
#include "lenia/kernel.hpp"

namespace lenia {

// Kernel indices taking part in a step, kept sorted and unique.
class ActiveSet {
public:
    ActiveSet() = default;

    static ActiveSet all(std::size_t kernel_count);
    static ActiveSet none() { return ActiveSet(); }
    static ActiveSet from_mask(const std::vector<bool>& mask);

    void set(std::size_t index, bool active);
    void toggle(std::size_t index);
    bool contains(std::size_t index) const;

    const std::vector<std::size_t>& indices() const { return indices_; }
    std::size_t size() const { return indices_.size(); }
    bool empty() const { return indices_.empty(); }

private:
    std::vector<std::size_t> indices_;
};

// at(i, j) is the rate contribution of channel j to channel i. The diagonal
// is never read by ca_step. A 0x0 matrix disables coupling. Coefficients must
// be finite; the constructors, set and scaled throw ConfigurationError otherwise.
class InteractionMatrix {
public:
    InteractionMatrix() = default;
    explicit InteractionMatrix(std::size_t channels);
    // Rows must form a square matrix; throws ConfigurationError otherwise.
    explicit InteractionMatrix(const std::vector<std::vector<double>>& rows);

    double at(std::size_t i, std::size_t j) const;
    void set(std::size_t i, std::size_t j, double value);
    std::size_t size() const { return n_; }

    InteractionMatrix scaled(double factor) const;

private:
    std::size_t n_ = 0;
    std::vector<double> coeffs_;
};

// One time step. Returns a new stack; on any error nothing is produced and the
// input is untouched.
ChannelStack ca_step(const ChannelStack& channels, const KernelBank& kernels,
                     const ActiveSet& active, GrowthKind growth,
                     const InteractionMatrix& interaction, double dt);

}
