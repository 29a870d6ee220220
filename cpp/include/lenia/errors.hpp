#pragma once
#include <stdexcept>
#include <string>

namespace lenia {

struct Error : std::runtime_error {
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Bad descriptor, out-of-range channel/kernel index, malformed config.
struct ConfigurationError : Error {
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

// Kernel mass summed to zero; no transform is produced for it.
struct DegenerateKernelError : Error {
    explicit DegenerateKernelError(const std::string& what) : Error(what) {}
};

struct ShapeMismatchError : Error {
    explicit ShapeMismatchError(const std::string& what) : Error(what) {}
};

}
