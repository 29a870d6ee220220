#include "lenia/grid.hpp"
#include "lenia/errors.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace lenia {

std::string to_string(const GridShape& shape) {
    return std::to_string(shape.height) + "x" + std::to_string(shape.width);
}

Grid::Grid(GridShape s, std::vector<double> values) : shape(s), data(std::move(values)) {
    if (data.size() != shape.cells()) {
        throw ShapeMismatchError("grid " + to_string(shape) + " given " +
                                 std::to_string(data.size()) + " values");
    }
}

ChannelStack make_stack(std::size_t channels, GridShape shape, double value) {
    return ChannelStack(channels, Grid(shape, value));
}

GridShape stack_shape(const ChannelStack& channels) {
    if (channels.empty()) {
        throw ShapeMismatchError("channel stack is empty");
    }
    const GridShape shape = channels.front().shape;
    for (std::size_t c = 0; c < channels.size(); ++c) {
        const Grid& g = channels[c];
        if (g.shape != shape) {
            throw ShapeMismatchError("channel " + std::to_string(c) + " is " + to_string(g.shape) +
                                     ", channel 0 is " + to_string(shape));
        }
        if (g.data.size() != shape.cells()) {
            throw ShapeMismatchError("channel " + std::to_string(c) + " holds " +
                                     std::to_string(g.data.size()) + " values for " + to_string(shape));
        }
    }
    return shape;
}

void clip_unit(Grid& grid) {
    for (double& v : grid.data) {
        if (v < 0.0) v = 0.0;
        if (v > 1.0) v = 1.0;
    }
}

std::vector<std::uint8_t> stack_rgb(const ChannelStack& channels) {
    const GridShape shape = stack_shape(channels);
    std::vector<std::uint8_t> image(shape.cells() * 3, 0);
    const std::size_t planes = std::min<std::size_t>(channels.size(), 3);
    for (std::size_t c = 0; c < planes; ++c) {
        const std::vector<double>& src = channels[c].data;
        for (std::size_t i = 0; i < src.size(); ++i) {
            const double v = std::min(1.0, std::max(0.0, src[i]));
            image[i * 3 + c] = static_cast<std::uint8_t>(255.0 * v);
        }
    }
    return image;
}

}
