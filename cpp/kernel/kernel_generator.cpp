#include "lenia/kernel.hpp"
#include "lenia/errors.hpp"
#include "lenia/growth.hpp"
#include "lenia/log.hpp"
#include <cmath>
#include <utility>

namespace lenia {

void validate_descriptor(const KernelDescriptor& desc) {
    if (desc.rings.empty()) {
        throw ConfigurationError("kernel has no rings");
    }
    for (std::size_t i = 0; i < desc.rings.size(); ++i) {
        if (!std::isfinite(desc.rings[i]) || desc.rings[i] < 0.0) {
            throw ConfigurationError("ring " + std::to_string(i) + " weight " +
                                     std::to_string(desc.rings[i]) + " is not a non-negative number");
        }
    }
    if (!std::isfinite(desc.radius) || desc.radius <= 0.0) {
        throw ConfigurationError("kernel radius must be positive, got " + std::to_string(desc.radius));
    }
    if (!std::isfinite(desc.sigma) || desc.sigma <= 0.0) {
        throw ConfigurationError("kernel sigma must be positive, got " + std::to_string(desc.sigma));
    }
    if (!std::isfinite(desc.mean) || !std::isfinite(desc.height)) {
        throw ConfigurationError("kernel mean and height must be finite");
    }
}

Grid spatial_kernel(const std::vector<double>& rings, double radius, GridShape shape) {
    if (rings.empty()) {
        throw ConfigurationError("kernel has no rings");
    }
    if (!std::isfinite(radius) || radius <= 0.0) {
        throw ConfigurationError("kernel radius must be positive, got " + std::to_string(radius));
    }

    Grid k(shape, 0.0);
    const long cy = static_cast<long>(shape.height / 2);
    const long cx = static_cast<long>(shape.width / 2);
    const double ring_count = static_cast<double>(rings.size());
    double mass = 0.0;

    for (std::size_t row = 0; row < shape.height; ++row) {
        for (std::size_t col = 0; col < shape.width; ++col) {
            const double y = static_cast<double>(static_cast<long>(row) - cy);
            const double x = static_cast<double>(static_cast<long>(col) - cx);
            const double d = std::sqrt(x * x + y * y) / radius * ring_count;
            const double ring = std::floor(d);
            if (ring >= ring_count) continue;
            const double w = rings[static_cast<std::size_t>(ring)] *
                             gauss(d - ring, kKernelProfileCenter, kKernelProfileSpread);
            k.at(row, col) = w;
            mass += w;
        }
    }

    if (mass == 0.0 || !std::isfinite(mass)) {
        throw DegenerateKernelError("kernel of radius " + std::to_string(radius) + " on " +
                                    to_string(shape) + " has zero mass");
    }
    for (double& v : k.data) v /= mass;
    return k;
}

Grid center_at_origin(const Grid& kernel) {
    const std::size_t h = kernel.shape.height;
    const std::size_t w = kernel.shape.width;
    Grid out(kernel.shape);
    for (std::size_t r = 0; r < h; ++r) {
        const std::size_t sr = (r + h / 2) % h;
        for (std::size_t c = 0; c < w; ++c) {
            out.at(r, c) = kernel.at(sr, (c + w / 2) % w);
        }
    }
    return out;
}

bool KernelGenerator::Key::operator<(const Key& o) const {
    if (shape != o.shape) return shape < o.shape;
    if (radius != o.radius) return radius < o.radius;
    return rings < o.rings;
}

SpectralKernel KernelGenerator::generate(const KernelDescriptor& desc, GridShape shape) {
    validate_descriptor(desc);
    Key key{desc.rings, desc.radius, shape};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            logger()->trace("kernel cache hit: radius {} rings {} on {}", desc.radius,
                            desc.rings.size(), to_string(shape));
            return it->second;
        }
    }

    Fft2D fft;
    auto spectrum = std::make_shared<const Spectrum>(
        fft.forward(center_at_origin(spatial_kernel(desc.rings, desc.radius, shape))));

    std::lock_guard<std::mutex> lock(mutex_);
    // another thread may have inserted the same key meanwhile; keep the first
    auto inserted = cache_.emplace(std::move(key), spectrum);
    logger()->debug("generated kernel transform: radius {} rings {} on {}", desc.radius,
                    desc.rings.size(), to_string(shape));
    return inserted.first->second;
}

std::size_t KernelGenerator::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void KernelGenerator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

KernelBank::KernelBank(std::vector<KernelDescriptor> descriptors, GridShape shape,
                       std::size_t channel_count, KernelGenerator& generator)
    : descriptors_(std::move(descriptors)), shape_(shape), channel_count_(channel_count) {
    if (shape_.cells() == 0) {
        throw ShapeMismatchError("kernel bank needs a non-empty grid, got " + to_string(shape_));
    }
    for (std::size_t i = 0; i < descriptors_.size(); ++i) {
        const KernelDescriptor& d = descriptors_[i];
        if (d.source >= channel_count_ || d.destination >= channel_count_) {
            throw ConfigurationError("kernel " + std::to_string(i) + " links channel " +
                                     std::to_string(d.source) + " -> " + std::to_string(d.destination) +
                                     " but only " + std::to_string(channel_count_) + " channels exist");
        }
    }
    transforms_.reserve(descriptors_.size());
    for (const KernelDescriptor& d : descriptors_) {
        transforms_.push_back(generator.generate(d, shape_));
    }
    logger()->info("kernel bank ready: {} kernels, {} channels, grid {}", descriptors_.size(),
                   channel_count_, to_string(shape_));
}

const KernelDescriptor& KernelBank::descriptor(std::size_t index) const {
    if (index >= descriptors_.size()) {
        throw ConfigurationError("kernel index " + std::to_string(index) + " out of range");
    }
    return descriptors_[index];
}

const Spectrum& KernelBank::transform(std::size_t index) const {
    if (index >= transforms_.size()) {
        throw ConfigurationError("kernel index " + std::to_string(index) + " out of range");
    }
    return *transforms_[index];
}

void KernelBank::set_growth_params(std::size_t index, double mean, double sigma, double height) {
    if (index >= descriptors_.size()) {
        throw ConfigurationError("kernel index " + std::to_string(index) + " out of range");
    }
    KernelDescriptor updated = descriptors_[index];
    updated.mean = mean;
    updated.sigma = sigma;
    updated.height = height;
    validate_descriptor(updated);
    descriptors_[index] = std::move(updated);
}

}
