#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "lenia/fft.hpp"
#include "lenia/grid.hpp"

namespace lenia {

// Profile used to shape every ring; independent of the step's growth kind.
constexpr double kKernelProfileCenter = 0.5;
constexpr double kKernelProfileSpread = 0.15;

struct KernelDescriptor {
    std::vector<double> rings;   // weight per concentric ring, innermost first
    double radius = 1.0;         // absolute, in cells
    double mean = 0.5;
    double sigma = 0.15;
    double height = 1.0;         // negative inhibits
    std::size_t source = 0;
    std::size_t destination = 0;
};

// Throws ConfigurationError on empty/negative rings, radius <= 0, sigma <= 0
// or a non-finite mean or height.
void validate_descriptor(const KernelDescriptor& desc);

// Unit-mass radial kernel with its centre at (height/2, width/2).
// Throws DegenerateKernelError when the rings carry no mass on this grid.
Grid spatial_kernel(const std::vector<double>& rings, double radius, GridShape shape);

// Cyclic shift moving cell (height/2, width/2) to (0, 0).
Grid center_at_origin(const Grid& kernel);

using SpectralKernel = std::shared_ptr<const Spectrum>;

// Builds and caches kernel transforms. Only rings, radius and grid shape feed
// the key, so growth parameters can change without regenerating anything.
class KernelGenerator {
public:
    SpectralKernel generate(const KernelDescriptor& desc, GridShape shape);
    std::size_t cache_size() const;
    void clear();

private:
    struct Key {
        std::vector<double> rings;
        double radius;
        GridShape shape;
        bool operator<(const Key& o) const;
    };

    mutable std::mutex mutex_;
    std::map<Key, SpectralKernel> cache_;
};

// Descriptor list bound to one grid shape and channel count, with the
// transform of every descriptor precomputed.
class KernelBank {
public:
    KernelBank(std::vector<KernelDescriptor> descriptors, GridShape shape,
               std::size_t channel_count, KernelGenerator& generator);

    std::size_t size() const { return descriptors_.size(); }
    GridShape shape() const { return shape_; }
    std::size_t channel_count() const { return channel_count_; }
    const KernelDescriptor& descriptor(std::size_t index) const;
    const Spectrum& transform(std::size_t index) const;

    void set_growth_params(std::size_t index, double mean, double sigma, double height);

private:
    std::vector<KernelDescriptor> descriptors_;
    std::vector<SpectralKernel> transforms_;
    GridShape shape_;
    std::size_t channel_count_;
};

}
