#include "afmtools/settings.h"
#include "afmtools/errors.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

namespace afmtools::settings {

namespace {

using json = nlohmann::json;

constexpr std::string_view kFilesSection = "files_specifications";
constexpr std::string_view kCorrectionSection = "image_correction";
constexpr std::string_view kAnalysisSection = "data_analysis";
constexpr std::string_view kGraphicsSection = "graphics";

std::string qualified(std::string_view section, std::string_view key) {
    return std::string(section) + "." + std::string(key);
}

void reject_unknown_keys(const json& node, std::string_view section, std::initializer_list<std::string_view> known) {
    for (const auto& [key, value] : node.items()) {
        bool found = false;
        for (auto k : known) {
            if (key == k) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw ConfigError(qualified(section, key), value.dump(),
                              "unknown key '" + qualified(section, key) + "'");
        }
    }
}

const json& require_section(const json& root, std::string_view section) {
    const auto it = root.find(std::string(section));
    if (it == root.end()) {
        throw ConfigError(std::string(section), "", "missing section '" + std::string(section) + "'");
    }
    if (!it->is_object()) {
        throw ConfigError(std::string(section), it->dump(), "section '" + std::string(section) + "' must be an object");
    }
    return *it;
}

const json& require_key(const json& section_node, std::string_view section, std::string_view key) {
    const auto it = section_node.find(std::string(key));
    if (it == section_node.end()) {
        throw ConfigError(qualified(section, key), "", "missing key '" + qualified(section, key) + "'");
    }
    return *it;
}

std::string require_string(const json& section_node, std::string_view section, std::string_view key) {
    const json& v = require_key(section_node, section, key);
    if (!v.is_string()) {
        throw ConfigError(qualified(section, key), v.dump(), "'" + qualified(section, key) + "' must be a string");
    }
    return v.get<std::string>();
}

double require_positive_number(const json& section_node, std::string_view section, std::string_view key) {
    const json& v = require_key(section_node, section, key);
    if (!v.is_number() || !std::isfinite(v.get<double>()) || v.get<double>() <= 0.0) {
        throw ConfigError(qualified(section, key), v.dump(), "'" + qualified(section, key) + "' must be a positive number");
    }
    return v.get<double>();
}

size_t require_positive_count(const json& section_node, std::string_view section, std::string_view key) {
    const json& v = require_key(section_node, section, key);
    if (!v.is_number_integer() || v.get<long long>() <= 0) {
        throw ConfigError(qualified(section, key), v.dump(), "'" + qualified(section, key) + "' must be a positive integer");
    }
    return static_cast<size_t>(v.get<long long>());
}

FileSpecifications parse_files(const json& node) {
    reject_unknown_keys(node, kFilesSection,
                        {"input_file_name", "scanning_rate", "image_length", "height_scaling_factor", "lines",
                         "2D_image_output_file_name", "3D_image_output_file_name"});

    FileSpecifications files;
    if (node.contains("input_file_name")) {
        files.input_file_name = require_string(node, kFilesSection, "input_file_name");
    }
    files.scanning_rate = require_positive_count(node, kFilesSection, "scanning_rate");
    files.image_length = require_positive_number(node, kFilesSection, "image_length");
    if (node.contains("height_scaling_factor")) {
        files.height_scaling_factor = require_positive_number(node, kFilesSection, "height_scaling_factor");
    }
    files.lines = node.contains("lines") ? require_positive_count(node, kFilesSection, "lines") : files.scanning_rate;
    if (node.contains("2D_image_output_file_name")) {
        files.image_2d_output_file_name = require_string(node, kFilesSection, "2D_image_output_file_name");
    }
    if (node.contains("3D_image_output_file_name")) {
        files.image_3d_output_file_name = require_string(node, kFilesSection, "3D_image_output_file_name");
    }
    return files;
}

correction::CorrectionConfig parse_correction(const json& node) {
    using namespace correction;
    reject_unknown_keys(node, kCorrectionSection, {kPlaneSubtractionKey, kDriftCorrectionKey, kDataShiftKey});

    CorrectionConfig cfg;
    cfg.plane_subtraction = parse_plane_subtraction(require_string(node, kCorrectionSection, kPlaneSubtractionKey));
    cfg.drift_correction = parse_drift_correction(require_string(node, kCorrectionSection, kDriftCorrectionKey));
    cfg.data_shift = parse_data_shift(require_string(node, kCorrectionSection, kDataShiftKey));
    return cfg;
}

analysis::AnalysisConfig parse_analysis(const json& node) {
    using namespace analysis;
    reject_unknown_keys(node, kAnalysisSection, {kHeightDistributionKey, kRoughnessKey});

    AnalysisConfig cfg;
    cfg.height_distribution = parse_height_distribution(require_string(node, kAnalysisSection, kHeightDistributionKey));
    cfg.roughness = parse_roughness(require_string(node, kAnalysisSection, kRoughnessKey));
    return cfg;
}

Graphics parse_graphics(const json& node) {
    reject_unknown_keys(node, kGraphicsSection, {"color_map"});
    Graphics g;
    if (node.contains("color_map")) g.color_map = require_string(node, kGraphicsSection, "color_map");
    return g;
}

} // namespace

heightmap::ScanGeometry Settings::geometry() const {
    heightmap::ScanGeometry g;
    g.scanning_rate = files.scanning_rate;
    g.image_length = files.image_length;
    g.height_scaling_factor = files.height_scaling_factor;
    return g;
}

Settings parse_text(std::string_view text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError("settings", "", std::string("malformed settings document: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("settings", root.dump(), "settings document must be a JSON object");
    }
    reject_unknown_keys(root, "settings", {kFilesSection, kCorrectionSection, kAnalysisSection, kGraphicsSection});

    Settings s;
    s.files = parse_files(require_section(root, kFilesSection));
    s.correction = parse_correction(require_section(root, kCorrectionSection));
    s.analysis = parse_analysis(require_section(root, kAnalysisSection));
    if (root.contains(std::string(kGraphicsSection))) {
        s.graphics = parse_graphics(require_section(root, kGraphicsSection));
    }
    return s;
}

Settings load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("settings: cannot open " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_text(ss.str());
}

} // namespace afmtools::settings
