#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lenia {

struct GridShape {
    std::size_t height = 0;
    std::size_t width = 0;

    std::size_t cells() const { return height * width; }
    bool operator==(const GridShape& o) const { return height == o.height && width == o.width; }
    bool operator!=(const GridShape& o) const { return !(*this == o); }
    bool operator<(const GridShape& o) const {
        return height != o.height ? height < o.height : width < o.width;
    }
};

std::string to_string(const GridShape& shape);

// Row-major field of doubles, one per cell.
struct Grid {
    GridShape shape;
    std::vector<double> data;

    Grid() = default;
    explicit Grid(GridShape s, double value = 0.0) : shape(s), data(s.cells(), value) {}
    Grid(GridShape s, std::vector<double> values);

    double& at(std::size_t row, std::size_t col) { return data[row * shape.width + col]; }
    double at(std::size_t row, std::size_t col) const { return data[row * shape.width + col]; }
    std::size_t size() const { return data.size(); }
};

using ChannelStack = std::vector<Grid>;

ChannelStack make_stack(std::size_t channels, GridShape shape, double value = 0.0);

// Common shape of every grid in the stack; throws ShapeMismatchError if they
// disagree or a grid's storage does not match its shape.
GridShape stack_shape(const ChannelStack& channels);

void clip_unit(Grid& grid);

// H x W x 3 interleaved bytes; channels beyond the third are ignored and
// missing ones are left black.
std::vector<std::uint8_t> stack_rgb(const ChannelStack& channels);

}
