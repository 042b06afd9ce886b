#pragma once

#include "afmtools/correction.h"
#include "afmtools/heightmap.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace afmtools::analysis {

using heightmap::HeightMatrix;
using heightmap::ScanGeometry;

enum class HeightDistribution { No, Yes };
enum class Roughness { No, OneD, TwoD };

struct AnalysisConfig {
    HeightDistribution height_distribution = HeightDistribution::No;
    Roughness roughness = Roughness::No;
};

inline constexpr std::string_view kHeightDistributionKey = "height_values_distribution";
inline constexpr std::string_view kRoughnessKey = "roughness";

std::string_view to_string(HeightDistribution v);
std::string_view to_string(Roughness v);

HeightDistribution parse_height_distribution(std::string_view value);
Roughness parse_roughness(std::string_view value);

enum class RoughnessKind { OneD, TwoD };

struct RoughnessResult {
    RoughnessKind kind = RoughnessKind::OneD;
    double roughness_nm = 0.0;
    std::optional<double> std_nm;              // 1D only
    std::vector<double> line_roughness_nm;     // 1D only, one value per scan line
};

struct AnalysisReport {
    std::optional<std::vector<double>> height_values;  // scaled to nm
    std::optional<RoughnessResult> roughness;

    [[nodiscard]] bool empty() const;
};

// height_values returns every sample scaled by height_scaling_factor, in
// row-major order.
std::vector<double> height_values(const HeightMatrix& m, double height_scaling_factor);

// roughness_1d fits a line to every scaled scan line and reports the mean and
// population standard deviation of the per-line residual RMS.
RoughnessResult roughness_1d(const HeightMatrix& m, double height_scaling_factor);

// roughness_2d fits one plane to the scaled surface and reports the residual
// RMS over all pixels.
RoughnessResult roughness_2d(const HeightMatrix& m, double height_scaling_factor);

struct Histogram {
    std::vector<double> bin_centers;
    std::vector<uint64_t> counts;
};

// height_histogram spreads values over `bins` equal bins spanning [min, max].
// Bins are half-open except the last, which also takes max. Constant data
// uses the range [v - 0.5, v + 0.5].
Histogram height_histogram(std::span<const double> values, size_t bins = 100);

enum class AnalysisStep { HeightDistribution, Roughness1D, Roughness2D };

std::string_view step_name(AnalysisStep step);

// build_analysis_pipeline returns the enabled stages, distribution first.
// Throws SequenceError unless correction_complete is set, before looking at
// the configuration, and ConfigError for out-of-range selectors.
std::vector<AnalysisStep> build_analysis_pipeline(const AnalysisConfig& config, bool correction_complete);

// run_analysis evaluates the steps against the corrected surface.
AnalysisReport run_analysis(const correction::CorrectionResult& corrected, const ScanGeometry& geometry,
                            const std::vector<AnalysisStep>& steps);

AnalysisReport analyze(const correction::CorrectionResult& corrected, const ScanGeometry& geometry,
                       const AnalysisConfig& config);

} // namespace afmtools::analysis
