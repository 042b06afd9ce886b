#pragma once

#include "afmtools/analysis.h"
#include "afmtools/correction.h"
#include "afmtools/heightmap.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace afmtools::settings {

struct FileSpecifications {
    std::string input_file_name;
    size_t scanning_rate = 0;
    double image_length = 0.0;
    double height_scaling_factor = 1.0;
    size_t lines = 0;  // defaults to scanning_rate
    // Plot file names for the rendering collaborator.
    std::string image_2d_output_file_name;
    std::string image_3d_output_file_name;
};

// Graphics options are passed through to rendering collaborators untouched.
struct Graphics {
    std::string color_map = "Greys";
};

struct Settings {
    FileSpecifications files;
    correction::CorrectionConfig correction;
    analysis::AnalysisConfig analysis;
    Graphics graphics;

    [[nodiscard]] heightmap::ScanGeometry geometry() const;
};

// parse_text parses a JSON settings document. Every selector is required and
// matched case-insensitively; unknown sections, unknown keys, wrong value types
// and unrecognized selector values throw ConfigError.
Settings parse_text(std::string_view text);

// load reads and parses a settings file. Throws std::runtime_error when the
// file cannot be opened.
Settings load(const std::filesystem::path& path);

} // namespace afmtools::settings
