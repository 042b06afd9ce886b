#include "afmtools/errors.h"
#include "afmtools/settings.h"

#include <gtest/gtest.h>

#include <string>

namespace st = afmtools::settings;
namespace corr = afmtools::correction;
namespace an = afmtools::analysis;

namespace {

const char* kValid = R"({
    "files_specifications": {
        "input_file_name": "scan.rawf32",
        "scanning_rate": 128,
        "image_length": 5.0,
        "height_scaling_factor": 1e9
    },
    "image_correction": {
        "common_plane_subtraction": "YES",
        "line_drift_correction": "Linear",
        "data_shift": "minimum"
    },
    "data_analysis": {
        "height_values_distribution": "no",
        "roughness": "2D"
    },
    "graphics": {"color_map": "viridis"}
})";

std::string with_correction(const std::string& plane, const std::string& drift, const std::string& shift) {
    return R"({"files_specifications": {"scanning_rate": 4, "image_length": 1.0},
               "image_correction": {"common_plane_subtraction": ")" + plane +
           R"(", "line_drift_correction": ")" + drift + R"(", "data_shift": ")" + shift + R"("},
               "data_analysis": {"height_values_distribution": "no", "roughness": "no"}})";
}

} // namespace

TEST(Settings, ParsesValidDocument) {
    const st::Settings s = st::parse_text(kValid);
    EXPECT_EQ(s.files.input_file_name, "scan.rawf32");
    EXPECT_EQ(s.files.scanning_rate, 128u);
    EXPECT_EQ(s.files.lines, 128u);
    EXPECT_DOUBLE_EQ(s.files.image_length, 5.0);
    EXPECT_DOUBLE_EQ(s.files.height_scaling_factor, 1e9);
    EXPECT_EQ(s.correction.plane_subtraction, corr::PlaneSubtraction::Yes);
    EXPECT_EQ(s.correction.drift_correction, corr::DriftCorrection::Linear);
    EXPECT_EQ(s.correction.data_shift, corr::DataShift::Minimum);
    EXPECT_EQ(s.analysis.height_distribution, an::HeightDistribution::No);
    EXPECT_EQ(s.analysis.roughness, an::Roughness::TwoD);
    EXPECT_EQ(s.graphics.color_map, "viridis");

    const auto g = s.geometry();
    EXPECT_EQ(g.scanning_rate, 128u);
    EXPECT_DOUBLE_EQ(g.height_scaling_factor, 1e9);
}

TEST(Settings, KeyOrderDoesNotMatter) {
    const st::Settings a = st::parse_text(with_correction("yes", "mean", "no"));
    const st::Settings b = st::parse_text(R"({
        "data_analysis": {"roughness": "no", "height_values_distribution": "no"},
        "image_correction": {"data_shift": "no", "line_drift_correction": "mean", "common_plane_subtraction": "yes"},
        "files_specifications": {"image_length": 1.0, "scanning_rate": 4}
    })");
    EXPECT_EQ(corr::build_correction_pipeline(a.correction), corr::build_correction_pipeline(b.correction));
    EXPECT_EQ(an::build_analysis_pipeline(a.analysis, true), an::build_analysis_pipeline(b.analysis, true));
}

TEST(Settings, DefaultsApplied) {
    const st::Settings s = st::parse_text(with_correction("no", "no", "no"));
    EXPECT_TRUE(s.files.input_file_name.empty());
    EXPECT_DOUBLE_EQ(s.files.height_scaling_factor, 1.0);
    EXPECT_EQ(s.files.lines, 4u);
    EXPECT_EQ(s.graphics.color_map, "Greys");
}

TEST(Settings, InvalidSelectorNamesKeyAndValue) {
    try {
        (void)st::parse_text(with_correction("yes", "cubic", "no"));
        FAIL() << "expected ConfigError";
    } catch (const afmtools::ConfigError& e) {
        EXPECT_EQ(e.key(), "line_drift_correction");
        EXPECT_EQ(e.value(), "cubic");
    }
    EXPECT_THROW((void)st::parse_text(with_correction("sure", "no", "no")), afmtools::ConfigError);
    EXPECT_THROW((void)st::parse_text(with_correction("no", "no", "max")), afmtools::ConfigError);
}

TEST(Settings, UnknownKeysRejected) {
    EXPECT_THROW((void)st::parse_text(R"({
        "files_specifications": {"scanning_rate": 4, "image_length": 1.0},
        "image_correction": {"common_plane_subtraction": "no", "line_drift_correction": "no",
                             "data_shift": "no", "median_filter": "yes"},
        "data_analysis": {"height_values_distribution": "no", "roughness": "no"}
    })"), afmtools::ConfigError);

    EXPECT_THROW((void)st::parse_text(R"({
        "files_specifications": {"scanning_rate": 4, "image_length": 1.0},
        "image_correction": {"common_plane_subtraction": "no", "line_drift_correction": "no", "data_shift": "no"},
        "data_analysis": {"height_values_distribution": "no", "roughness": "no"},
        "plotting": {}
    })"), afmtools::ConfigError);
}

TEST(Settings, MissingSelectorRejected) {
    try {
        (void)st::parse_text(R"({
            "files_specifications": {"scanning_rate": 4, "image_length": 1.0},
            "image_correction": {"common_plane_subtraction": "no", "line_drift_correction": "no"},
            "data_analysis": {"height_values_distribution": "no", "roughness": "no"}
        })");
        FAIL() << "expected ConfigError";
    } catch (const afmtools::ConfigError& e) {
        EXPECT_EQ(e.key(), "image_correction.data_shift");
    }
}

TEST(Settings, WrongTypesRejected) {
    EXPECT_THROW((void)st::parse_text(R"({
        "files_specifications": {"scanning_rate": 4, "image_length": 1.0},
        "image_correction": {"common_plane_subtraction": true, "line_drift_correction": "no", "data_shift": "no"},
        "data_analysis": {"height_values_distribution": "no", "roughness": "no"}
    })"), afmtools::ConfigError);

    EXPECT_THROW((void)st::parse_text(R"({
        "files_specifications": {"scanning_rate": 4.5, "image_length": 1.0},
        "image_correction": {"common_plane_subtraction": "no", "line_drift_correction": "no", "data_shift": "no"},
        "data_analysis": {"height_values_distribution": "no", "roughness": "no"}
    })"), afmtools::ConfigError);

    EXPECT_THROW((void)st::parse_text(R"({
        "files_specifications": {"scanning_rate": 4, "image_length": -1.0},
        "image_correction": {"common_plane_subtraction": "no", "line_drift_correction": "no", "data_shift": "no"},
        "data_analysis": {"height_values_distribution": "no", "roughness": "no"}
    })"), afmtools::ConfigError);
}

TEST(Settings, TypeErrorsNameQualifiedKey) {
    try {
        (void)st::parse_text(R"({
            "files_specifications": {"scanning_rate": 4, "image_length": "long"},
            "image_correction": {"common_plane_subtraction": "no", "line_drift_correction": "no", "data_shift": "no"},
            "data_analysis": {"height_values_distribution": "no", "roughness": "no"}
        })");
        FAIL() << "expected ConfigError";
    } catch (const afmtools::ConfigError& e) {
        EXPECT_EQ(e.key(), "files_specifications.image_length");
        EXPECT_EQ(e.value(), "\"long\"");
    }

    try {
        (void)st::parse_text(R"({
            "files_specifications": {"scanning_rate": 0, "image_length": 1.0},
            "image_correction": {"common_plane_subtraction": "no", "line_drift_correction": "no", "data_shift": "no"},
            "data_analysis": {"height_values_distribution": "no", "roughness": "no"}
        })");
        FAIL() << "expected ConfigError";
    } catch (const afmtools::ConfigError& e) {
        EXPECT_EQ(e.key(), "files_specifications.scanning_rate");
    }

    try {
        (void)st::parse_text(R"({
            "files_specifications": {"scanning_rate": 4, "image_length": 1.0},
            "image_correction": {"common_plane_subtraction": 1, "line_drift_correction": "no", "data_shift": "no"},
            "data_analysis": {"height_values_distribution": "no", "roughness": "no"}
        })");
        FAIL() << "expected ConfigError";
    } catch (const afmtools::ConfigError& e) {
        EXPECT_EQ(e.key(), "image_correction.common_plane_subtraction");
    }
}

TEST(Settings, MalformedJsonRejected) {
    EXPECT_THROW((void)st::parse_text("{ not json"), afmtools::ConfigError);
    EXPECT_THROW((void)st::parse_text("[1, 2, 3]"), afmtools::ConfigError);
}

TEST(Settings, LoadMissingFileThrows) {
    EXPECT_THROW((void)st::load("/nonexistent/afmtools/settings.json"), std::runtime_error);
}
