#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <algorithm>
#include "lenia/ca_stepper.hpp"
#include "lenia/errors.hpp"
#include "lenia/growth.hpp"
#include "lenia/kernel.hpp"
#include "lenia/metrics.hpp"

namespace py = pybind11;
using namespace lenia;

using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

static Grid grid_from_array(const DoubleArray& values) {
    auto buf = values.request();
    if (buf.ndim != 2) {
        throw ShapeMismatchError("grid must be 2D");
    }
    GridShape shape{static_cast<std::size_t>(buf.shape[0]), static_cast<std::size_t>(buf.shape[1])};
    const double* ptr = static_cast<const double*>(buf.ptr);
    return Grid(shape, std::vector<double>(ptr, ptr + shape.cells()));
}

static DoubleArray grid_to_array(const Grid& grid) {
    return DoubleArray({static_cast<py::ssize_t>(grid.shape.height), static_cast<py::ssize_t>(grid.shape.width)},
                       grid.data.data());
}

static ChannelStack stack_from_array(const DoubleArray& values) {
    auto buf = values.request();
    if (buf.ndim != 3) {
        throw ShapeMismatchError("channels must be a (C, H, W) array");
    }
    const std::size_t channels = static_cast<std::size_t>(buf.shape[0]);
    GridShape shape{static_cast<std::size_t>(buf.shape[1]), static_cast<std::size_t>(buf.shape[2])};
    const double* ptr = static_cast<const double*>(buf.ptr);
    ChannelStack stack;
    stack.reserve(channels);
    for (std::size_t c = 0; c < channels; ++c) {
        const double* plane = ptr + c * shape.cells();
        stack.emplace_back(shape, std::vector<double>(plane, plane + shape.cells()));
    }
    return stack;
}

static DoubleArray stack_to_array(const ChannelStack& stack) {
    const GridShape shape = stack_shape(stack);
    DoubleArray out({static_cast<py::ssize_t>(stack.size()), static_cast<py::ssize_t>(shape.height),
                     static_cast<py::ssize_t>(shape.width)});
    double* dst = static_cast<double*>(out.request().ptr);
    for (const Grid& g : stack) {
        dst = std::copy(g.data.begin(), g.data.end(), dst);
    }
    return out;
}

// Descriptors arrive as dicts with the config-file keys.
static KernelDescriptor descriptor_from_dict(const py::dict& d) {
    KernelDescriptor k;
    k.rings = d["rings"].cast<std::vector<double>>();
    k.radius = d["radius"].cast<double>();
    if (d.contains("mean")) k.mean = d["mean"].cast<double>();
    if (d.contains("sigma")) k.sigma = d["sigma"].cast<double>();
    if (d.contains("height")) k.height = d["height"].cast<double>();
    if (d.contains("source")) k.source = d["source"].cast<std::size_t>();
    if (d.contains("destination")) k.destination = d["destination"].cast<std::size_t>();
    return k;
}

// Owns the generator so the bank's cached transforms stay alive.
class Engine {
public:
    Engine(const std::vector<py::dict>& descriptors, std::size_t height, std::size_t width,
           std::size_t channels)
        : bank_(to_descriptors(descriptors), GridShape{height, width}, channels, generator_) {}

    DoubleArray step(const DoubleArray& channels, const std::vector<std::size_t>& active,
                     const std::string& growth, const std::vector<std::vector<double>>& interaction,
                     double dt) const {
        ActiveSet set;
        for (std::size_t i : active) set.set(i, true);
        // Holds the GIL throughout, so set_growth_params cannot interleave.
        const ChannelStack out = ca_step(stack_from_array(channels), bank_, set,
                                         growth_kind_from_name(growth), InteractionMatrix(interaction), dt);
        return stack_to_array(out);
    }

    void set_growth_params(std::size_t index, double mean, double sigma, double height) {
        bank_.set_growth_params(index, mean, sigma, height);
    }

    std::size_t size() const { return bank_.size(); }

private:
    static std::vector<KernelDescriptor> to_descriptors(const std::vector<py::dict>& dicts) {
        std::vector<KernelDescriptor> out;
        for (const py::dict& d : dicts) out.push_back(descriptor_from_dict(d));
        return out;
    }

    KernelGenerator generator_;
    KernelBank bank_;
};

static DoubleArray py_growth(const std::string& name, DoubleArray x, double mean, double sigma) {
    return grid_to_array(apply_growth(growth_kind_from_name(name), grid_from_array(x), mean, sigma));
}

static DoubleArray py_spatial_kernel(const std::vector<double>& rings, double radius,
                                     std::size_t height, std::size_t width) {
    return grid_to_array(spatial_kernel(rings, radius, GridShape{height, width}));
}

static std::vector<py::dict> py_channel_metrics(const DoubleArray& channels) {
    std::vector<py::dict> out;
    for (const ChannelMetrics& m : channel_metrics(stack_from_array(channels))) {
        py::dict d;
        d["mass"] = m.mass;
        d["mean"] = m.mean;
        d["entropy"] = m.entropy;
        out.push_back(d);
    }
    return out;
}

PYBIND11_MODULE(lenia_native, m) {
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<DegenerateKernelError>(m, "DegenerateKernelError", PyExc_ValueError);
    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError", PyExc_ValueError);

    m.def("growth", &py_growth, "Apply a named growth function to a 2D array");
    m.def("growth_names", &growth_kind_names, "Registered growth function names");
    m.def("spatial_kernel", &py_spatial_kernel, "Normalized, centred spatial kernel");
    m.def("channel_metrics", &py_channel_metrics, "Per-channel mass, mean and entropy");

    py::class_<Engine>(m, "Engine")
        .def(py::init<const std::vector<py::dict>&, std::size_t, std::size_t, std::size_t>(),
             py::arg("descriptors"), py::arg("height"), py::arg("width"), py::arg("channels"))
        .def("step", &Engine::step, "Advance a (C, H, W) stack by one step",
             py::arg("channels"), py::arg("active"), py::arg("growth"), py::arg("interaction"),
             py::arg("dt"))
        .def("set_growth_params", &Engine::set_growth_params)
        .def("__len__", &Engine::size);
}
