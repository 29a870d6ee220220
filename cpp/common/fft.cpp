#include "lenia/fft.hpp"
#include "lenia/errors.hpp"
#include <algorithm>

namespace lenia {

Spectrum Fft2D::forward(const Grid& grid) {
    Spectrum s;
    s.shape = grid.shape;
    s.data.assign(grid.data.begin(), grid.data.end());
    transform(s.data, s.shape, false);
    return s;
}

Spectrum Fft2D::forward(const Spectrum& spectrum) {
    Spectrum s = spectrum;
    transform(s.data, s.shape, false);
    return s;
}

Grid Fft2D::inverse_real(const Spectrum& spectrum) {
    std::vector<Complex> buf = spectrum.data;
    transform(buf, spectrum.shape, true);
    Grid out(spectrum.shape);
    for (std::size_t i = 0; i < buf.size(); ++i) {
        out.data[i] = buf[i].real();
    }
    return out;
}

void Fft2D::transform(std::vector<Complex>& data, GridShape shape, bool inverse) {
    const std::size_t h = shape.height;
    const std::size_t w = shape.width;
    if (data.size() != h * w) {
        throw ShapeMismatchError("fft buffer of " + std::to_string(data.size()) +
                                 " values for " + to_string(shape));
    }
    if (h == 0 || w == 0) return;

    // A length-1 DFT is the identity, and kissfft cannot plan one, so
    // single-row and single-column grids skip that pass.
    if (w > 1) {
        // rows are contiguous
        line_out_.resize(w);
        for (std::size_t r = 0; r < h; ++r) {
            Complex* row = data.data() + r * w;
            if (inverse) fft_.inv(line_out_.data(), row, static_cast<Eigen::Index>(w));
            else fft_.fwd(line_out_.data(), row, static_cast<Eigen::Index>(w));
            std::copy(line_out_.begin(), line_out_.end(), row);
        }
    }
    if (h == 1) return;

    line_in_.resize(h);
    line_out_.resize(h);
    for (std::size_t c = 0; c < w; ++c) {
        for (std::size_t r = 0; r < h; ++r) line_in_[r] = data[r * w + c];
        if (inverse) fft_.inv(line_out_.data(), line_in_.data(), static_cast<Eigen::Index>(h));
        else fft_.fwd(line_out_.data(), line_in_.data(), static_cast<Eigen::Index>(h));
        for (std::size_t r = 0; r < h; ++r) data[r * w + c] = line_out_[r];
    }
}

Spectrum multiply(const Spectrum& a, const Spectrum& b) {
    if (a.shape != b.shape || a.data.size() != b.data.size()) {
        throw ShapeMismatchError("spectrum " + to_string(a.shape) + " vs " + to_string(b.shape));
    }
    Spectrum out;
    out.shape = a.shape;
    out.data.resize(a.data.size());
    for (std::size_t i = 0; i < a.data.size(); ++i) {
        out.data[i] = a.data[i] * b.data[i];
    }
    return out;
}

}
