#include "lenia/config.hpp"
#include "lenia/errors.hpp"
#include "lenia/log.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace lenia {

static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

static std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

static bool parse_plain(const std::string& text, double& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return errno == 0 && end == text.c_str() + text.size() && std::isfinite(out);
}

static std::string where(const std::string& section, const std::string& key) {
    return "[" + section + "] " + key;
}

struct KernelRow {
    std::vector<double> rings;
    double mean, sigma, height, r;
    std::size_t source, destination;
};

// b, m, s, h, r, c0 -> c1
static const KernelRow kDefaultKernels[] = {
    {{1}, 0.272, 0.0595, 0.138, 0.91, 0, 0},
    {{1}, 0.349, 0.1585, 0.48, 0.62, 0, 0},
    {{1, 1.0 / 4}, 0.2, 0.0332, 0.284, 0.5, 0, 0},
    {{0, 1}, 0.114, 0.0528, 0.256, 0.97, 1, 1},
    {{1}, 0.447, 0.0777, 0.5, 0.72, 1, 1},
    {{5.0 / 6, 1}, 0.247, 0.0342, 0.622, 0.8, 1, 1},
    {{1}, 0.21, 0.0617, 0.35, 0.96, 2, 2},
    {{1}, 0.462, 0.1192, 0.218, 0.56, 2, 2},
    {{1}, 0.446, 0.1793, 0.556, 0.78, 2, 2},
    {{11.0 / 12, 1}, 0.327, 0.1408, 0.344, 0.79, 0, 1},
    {{3.0 / 4, 1}, 0.476, 0.0995, 0.456, 0.5, 0, 2},
    {{11.0 / 12, 1}, 0.379, 0.0697, 0.67, 0.72, 1, 0},
    {{1}, 0.262, 0.0877, 0.42, 0.68, 1, 2},
    {{1.0 / 6, 1, 0}, 0.412, 0.1101, 0.43, 0.82, 2, 0},
    {{1}, 0.201, 0.0786, 0.278, 0.82, 2, 1},
    {{1.0 / 4, 1}, 0.3, 0.1, -0.4, 1.2, 0, 0},
    {{1.0 / 10, 1}, 0.3, 0.2, -0.6, 2.0, 1, 1},
    {{3.0 / 4, 1}, 0.15, 0.05, -0.5, 6.0, 2, 2},
    {{3.0 / 4, 1}, 0.15, 0.05, -0.5, 6.0, 0, 0},
    {{1, 1.0 / 4}, 0.3, 0.1, -0.2, 2.5, 0, 1},
    {{1, 1.0 / 4}, 0.3, 0.1, -0.1, 2.5, 1, 0},
    {{1, 1.0 / 6}, 0.3, 0.15, 0.4, 3.0, 2, 0},
    {{1, 1.0 / 6}, 0.3, 0.15, 0.4, 2.0, 2, 0},
    {{1, 1.0 / 6}, 0.3, 0.15, -0.1, 3.0, 2, 2},
    {{1, 1.0 / 6}, 0.3, 0.15, 0.5, 3.0, 0, 0},
};

// Height N with a 16:9 width rounded up to even.
static GridShape widescreen_shape(std::size_t height) {
    std::size_t width = static_cast<std::size_t>(std::ceil(16.0 * static_cast<double>(height) / 9.0));
    if (width % 2 != 0) ++width;
    return GridShape{height, width};
}

static std::size_t to_count(long v, const std::string& section, const std::string& key) {
    if (v < 0) {
        throw ConfigurationError(where(section, key) + " must not be negative");
    }
    return static_cast<std::size_t>(v);
}

double parse_number(const std::string& text) {
    const std::string t = trim(text);
    double value = 0.0;
    const size_t slash = t.find('/');
    if (slash == std::string::npos) {
        if (parse_plain(t, value)) return value;
        throw ConfigurationError("'" + text + "' is not a number");
    }
    double num = 0.0, den = 0.0;
    if (!parse_plain(trim(t.substr(0, slash)), num) || !parse_plain(trim(t.substr(slash + 1)), den)) {
        throw ConfigurationError("'" + text + "' is not a fraction");
    }
    if (den == 0.0) {
        throw ConfigurationError("'" + text + "' divides by zero");
    }
    return num / den;
}

void ConfigReader::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open configuration file " + path);
    }
    parse(file, path);
    logger()->info("loaded configuration from {}", path);
}

void ConfigReader::load_string(const std::string& text) {
    std::istringstream in(text);
    parse(in, "<string>");
}

void ConfigReader::parse(std::istream& in, const std::string& origin) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            throw ConfigurationError(origin + ":" + std::to_string(line_num) + ": expected key = value");
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            throw ConfigurationError(origin + ":" + std::to_string(line_num) + ": key '" + key +
                                     "' outside any section");
        }

        data_[current_section][key] = value;
    }
}

bool ConfigReader::has_key(const std::string& section, const std::string& key) const {
    auto sec_it = data_.find(section);
    return sec_it != data_.end() && sec_it->second.count(key) > 0;
}

std::string ConfigReader::get_string(const std::string& section, const std::string& key,
                                     const std::string& default_val) const {
    auto sec_it = data_.find(section);
    if (sec_it == data_.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

double ConfigReader::get_double(const std::string& section, const std::string& key,
                                double default_val) const {
    if (!has_key(section, key)) return default_val;
    try {
        return parse_number(get_string(section, key));
    } catch (const ConfigurationError& e) {
        throw ConfigurationError(where(section, key) + ": " + e.what());
    }
}

long ConfigReader::get_int(const std::string& section, const std::string& key, long default_val) const {
    if (!has_key(section, key)) return default_val;
    const std::string val = get_string(section, key);
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(val.c_str(), &end, 10);
    if (val.empty() || errno != 0 || end != val.c_str() + val.size()) {
        throw ConfigurationError(where(section, key) + ": '" + val + "' is not an integer");
    }
    return v;
}

bool ConfigReader::get_bool(const std::string& section, const std::string& key, bool default_val) const {
    if (!has_key(section, key)) return default_val;
    std::string val = get_string(section, key);
    std::transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return std::tolower(c); });
    if (val == "true" || val == "yes" || val == "on" || val == "1") return true;
    if (val == "false" || val == "no" || val == "off" || val == "0") return false;
    throw ConfigurationError(where(section, key) + ": '" + val + "' is not a boolean");
}

std::vector<double> ConfigReader::get_double_array(const std::string& section,
                                                   const std::string& key) const {
    std::vector<double> result;
    for (const std::string& item : split(get_string(section, key), ',')) {
        try {
            result.push_back(parse_number(item));
        } catch (const ConfigurationError& e) {
            throw ConfigurationError(where(section, key) + ": " + e.what());
        }
    }
    return result;
}

std::vector<std::string> ConfigReader::sections_matching(const std::string& prefix) const {
    std::vector<std::string> names;
    for (const auto& kv : data_) {
        if (kv.first.compare(0, prefix.size(), prefix) == 0) names.push_back(kv.first);
    }
    return names;
}

SimulationConfig default_simulation_config() {
    SimulationConfig cfg;
    cfg.shape = widescreen_shape(384);
    cfg.interaction = InteractionMatrix({
        {0.3, 0.45, 0.37},
        {-0.2, 0.35, 0.03},
        {0.25, -0.22, 0.3},
    });
    for (const KernelRow& row : kDefaultKernels) {
        KernelDescriptor d;
        d.rings = row.rings;
        d.radius = cfg.base_radius * row.r;
        d.mean = row.mean;
        d.sigma = row.sigma;
        d.height = row.height;
        d.source = row.source;
        d.destination = row.destination;
        cfg.kernels.push_back(std::move(d));
    }
    cfg.active.assign(cfg.kernels.size(), true);
    return cfg;
}

SimulationConfig load_simulation_config(const ConfigReader& reader) {
    const std::string sim = "simulation";
    SimulationConfig cfg;

    const long height = reader.get_int(sim, "height", 384);
    if (height <= 0) {
        throw ConfigurationError(where(sim, "height") + " must be positive");
    }
    if (reader.has_key(sim, "width")) {
        const long width = reader.get_int(sim, "width", 0);
        if (width <= 0) {
            throw ConfigurationError(where(sim, "width") + " must be positive");
        }
        cfg.shape = GridShape{static_cast<std::size_t>(height), static_cast<std::size_t>(width)};
        if (cfg.shape.width % 2 != 0) ++cfg.shape.width;
    } else {
        cfg.shape = widescreen_shape(static_cast<std::size_t>(height));
    }

    cfg.dt = reader.get_double(sim, "dt", cfg.dt);
    cfg.base_radius = reader.get_double(sim, "base_radius", cfg.base_radius);
    if (cfg.base_radius <= 0.0) {
        throw ConfigurationError(where(sim, "base_radius") + " must be positive");
    }
    cfg.channels = to_count(reader.get_int(sim, "channels", 3), sim, "channels");
    if (cfg.channels == 0) {
        throw ConfigurationError(where(sim, "channels") + " must be at least 1");
    }
    cfg.growth = growth_kind_from_name(reader.get_string(sim, "growth", "gauss"));
    cfg.steps = to_count(reader.get_int(sim, "steps", 200), sim, "steps");
    cfg.log_every = to_count(reader.get_int(sim, "log_every", 10), sim, "log_every");
    const std::size_t seed = to_count(reader.get_int(sim, "seed", 1), sim, "seed");
    if (seed > std::numeric_limits<unsigned>::max()) {
        throw ConfigurationError(where(sim, "seed") + " does not fit in 32 bits");
    }
    cfg.seed = static_cast<unsigned>(seed);
    cfg.log_level = reader.get_string(sim, "log_level", cfg.log_level);

    cfg.interaction = InteractionMatrix(cfg.channels);
    for (std::size_t i = 0; i < cfg.channels; ++i) {
        const std::string key = "row" + std::to_string(i);
        if (!reader.has_key("interaction", key)) continue;
        const std::vector<double> row = reader.get_double_array("interaction", key);
        if (row.size() != cfg.channels) {
            throw ConfigurationError(where("interaction", key) + " needs " +
                                     std::to_string(cfg.channels) + " coefficients");
        }
        for (std::size_t j = 0; j < row.size(); ++j) cfg.interaction.set(i, j, row[j]);
    }

    std::vector<std::pair<long, std::string>> sections;
    for (const std::string& name : reader.sections_matching("kernel.")) {
        const std::string suffix = name.substr(7);
        char* end = nullptr;
        const long id = std::strtol(suffix.c_str(), &end, 10);
        if (suffix.empty() || end != suffix.c_str() + suffix.size()) {
            throw ConfigurationError("section [" + name + "] needs a numeric suffix");
        }
        sections.emplace_back(id, name);
    }
    std::sort(sections.begin(), sections.end());

    for (const auto& entry : sections) {
        const std::string& s = entry.second;
        if (!reader.has_key(s, "rings")) {
            throw ConfigurationError(where(s, "rings") + " is required");
        }
        KernelDescriptor d;
        d.rings = reader.get_double_array(s, "rings");
        d.radius = cfg.base_radius * reader.get_double(s, "r", 1.0);
        d.mean = reader.get_double(s, "mean", d.mean);
        d.sigma = reader.get_double(s, "sigma", d.sigma);
        d.height = reader.get_double(s, "height", d.height);
        d.source = to_count(reader.get_int(s, "source", 0), s, "source");
        d.destination = to_count(reader.get_int(s, "destination", 0), s, "destination");
        try {
            validate_descriptor(d);
        } catch (const ConfigurationError& e) {
            throw ConfigurationError("[" + s + "] " + e.what());
        }
        if (d.source >= cfg.channels || d.destination >= cfg.channels) {
            throw ConfigurationError("[" + s + "] references a channel outside 0.." +
                                     std::to_string(cfg.channels - 1));
        }
        cfg.kernels.push_back(std::move(d));
        cfg.active.push_back(reader.get_bool(s, "active", true));
    }

    logger()->info("simulation config: grid {}, {} channels, {} kernels, growth {}", to_string(cfg.shape),
                   cfg.channels, cfg.kernels.size(), growth_kind_name(cfg.growth));
    return cfg;
}

SimulationConfig load_simulation_config(const std::string& path) {
    ConfigReader reader;
    reader.load_file(path);
    return load_simulation_config(reader);
}

}
