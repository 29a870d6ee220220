#pragma once
#include <complex>
#include <vector>
#include <unsupported/Eigen/FFT>

#include "lenia/grid.hpp"

namespace lenia {

using Complex = std::complex<double>;

// Full (not half) 2D spectrum of a grid, row-major like Grid.
struct Spectrum {
    GridShape shape;
    std::vector<Complex> data;
};

// Row/column 2D transform on top of Eigen's 1D FFT. Eigen::FFT caches plans
// and is not safe to share, so every thread needs its own Fft2D.
class Fft2D {
public:
    Spectrum forward(const Grid& grid);
    Spectrum forward(const Spectrum& spectrum);
    // Inverse transform scaled by 1/(H*W); returns the real part.
    Grid inverse_real(const Spectrum& spectrum);

private:
    void transform(std::vector<Complex>& data, GridShape shape, bool inverse);

    Eigen::FFT<double> fft_;
    std::vector<Complex> line_in_;
    std::vector<Complex> line_out_;
};

// out = a * b, element-wise; shapes must match.
Spectrum multiply(const Spectrum& a, const Spectrum& b);

}
