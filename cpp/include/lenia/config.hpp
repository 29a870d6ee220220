#pragma once
#include <cstddef>
#include <istream>
#include <map>
#include <string>
#include <vector>

#include "lenia/ca_stepper.hpp"
#include "lenia/grid.hpp"
#include "lenia/growth.hpp"
#include "lenia/kernel.hpp"

namespace lenia {

/**
 * INI-style reader: [section] headers, key = value lines, '#' or ';'
 * comment lines and trailing '#' comments. Typed getters throw
 * ConfigurationError naming section and key when a value does not parse.
 */
class ConfigReader {
public:
    void load_file(const std::string& path);
    void load_string(const std::string& text);

    bool has_key(const std::string& section, const std::string& key) const;
    std::string get_string(const std::string& section, const std::string& key,
                           const std::string& default_val = "") const;
    double get_double(const std::string& section, const std::string& key, double default_val) const;
    long get_int(const std::string& section, const std::string& key, long default_val) const;
    bool get_bool(const std::string& section, const std::string& key, bool default_val) const;
    // Comma-separated; each entry may be a fraction such as 1/4.
    std::vector<double> get_double_array(const std::string& section, const std::string& key) const;
    std::vector<std::string> sections_matching(const std::string& prefix) const;

private:
    void parse(std::istream& in, const std::string& origin);

    std::map<std::string, std::map<std::string, std::string>> data_;
};

// Parses "0.25", "-3e-2" or "1/4"; throws ConfigurationError otherwise.
double parse_number(const std::string& text);

struct SimulationConfig {
    GridShape shape;
    double dt = 0.5;
    double base_radius = 12.0;
    std::size_t channels = 3;
    GrowthKind growth = GrowthKind::Gauss;
    std::size_t steps = 200;
    std::size_t log_every = 10;
    unsigned seed = 1;
    std::string log_level = "info";
    std::vector<KernelDescriptor> kernels;   // radius already scaled by base_radius
    std::vector<bool> active;
    InteractionMatrix interaction;
};

// 3 channels, 25 kernels, 384x684 grid.
SimulationConfig default_simulation_config();

SimulationConfig load_simulation_config(const ConfigReader& reader);
SimulationConfig load_simulation_config(const std::string& path);

}
