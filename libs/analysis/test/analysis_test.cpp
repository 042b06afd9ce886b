#include "afmtools/analysis.h"
#include "afmtools/errors.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

namespace hm = afmtools::heightmap;
namespace corr = afmtools::correction;
namespace an = afmtools::analysis;

namespace {

hm::HeightMatrix plane_with_noise(size_t n, double amplitude, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(-amplitude, amplitude);
    hm::HeightMatrix m(n, n);
    for (size_t y = 0; y < n; ++y) {
        for (size_t x = 0; x < n; ++x) {
            m.at(y, x) = 0.02 * static_cast<double>(x) - 0.05 * static_cast<double>(y) + 4.0 + dist(rng);
        }
    }
    return m;
}

hm::ScanGeometry geometry_for(const hm::HeightMatrix& m, double scale = 1.0) {
    hm::ScanGeometry g;
    g.scanning_rate = m.cols;
    g.image_length = 5.0;
    g.height_scaling_factor = scale;
    return g;
}

corr::CorrectionResult completed(const hm::HeightMatrix& m) {
    return corr::correct(m, geometry_for(m), corr::CorrectionConfig{});
}

} // namespace

TEST(Analysis, HeightValuesAreScaledCopies) {
    const hm::HeightMatrix m{{1, 2}, {3, 4}};
    const std::vector<double> values = an::height_values(m, 10.0);
    const std::vector<double> expected = {10, 20, 30, 40};
    EXPECT_EQ(values, expected);
}

TEST(Analysis, Roughness1DPlanarRowsAreZero) {
    const hm::HeightMatrix m{{0, 1, 2, 3}, {5, 3, 1, -1}, {2, 2, 2, 2}};
    const an::RoughnessResult r = an::roughness_1d(m, 1.0);
    EXPECT_EQ(r.kind, an::RoughnessKind::OneD);
    EXPECT_NEAR(r.roughness_nm, 0.0, 1e-12);
    ASSERT_TRUE(r.std_nm.has_value());
    EXPECT_NEAR(*r.std_nm, 0.0, 1e-12);
    EXPECT_EQ(r.line_roughness_nm.size(), 3u);
}

TEST(Analysis, Roughness1DKnownResidual) {
    // Residuals of the best line through {0, 1, 0} are {-1/3, 2/3, -1/3}.
    const hm::HeightMatrix m{{0, 1, 0}, {0, 0, 0}};
    const an::RoughnessResult r = an::roughness_1d(m, 3.0);
    const double line0 = 3.0 * std::sqrt(2.0 / 9.0);
    ASSERT_EQ(r.line_roughness_nm.size(), 2u);
    EXPECT_NEAR(r.line_roughness_nm[0], line0, 1e-12);
    EXPECT_NEAR(r.line_roughness_nm[1], 0.0, 1e-12);
    EXPECT_NEAR(r.roughness_nm, line0 / 2.0, 1e-12);
    EXPECT_NEAR(*r.std_nm, line0 / 2.0, 1e-12);
}

TEST(Analysis, Roughness1DNonNegative) {
    const an::RoughnessResult r = an::roughness_1d(plane_with_noise(32, 0.4, 3), 1.0);
    EXPECT_GE(r.roughness_nm, 0.0);
    for (double v : r.line_roughness_nm) EXPECT_GE(v, 0.0);
}

TEST(Analysis, Roughness1DMatchesAfterLinearDrift) {
    const hm::HeightMatrix raw = plane_with_noise(24, 0.3, 11);
    const hm::HeightMatrix drifted = corr::subtract_linear_drift(raw);
    const an::RoughnessResult a = an::roughness_1d(raw, 1.0);
    const an::RoughnessResult b = an::roughness_1d(drifted, 1.0);
    EXPECT_NEAR(a.roughness_nm, b.roughness_nm, 1e-10);
    EXPECT_NEAR(*a.std_nm, *b.std_nm, 1e-10);
}

TEST(Analysis, Roughness1DNeedsTwoSamplesPerLine) {
    const hm::HeightMatrix column{{1.0}, {2.0}, {4.0}};
    EXPECT_THROW((void)an::roughness_1d(column, 1.0), afmtools::ShapeError);
}

TEST(Analysis, Roughness2DNeedsThreePixels) {
    const hm::HeightMatrix pair{{1.0, 2.0}};
    EXPECT_THROW((void)an::roughness_2d(pair, 1.0), afmtools::ShapeError);
}

TEST(Analysis, Roughness2DHasNoSpread) {
    const an::RoughnessResult r = an::roughness_2d(plane_with_noise(8, 0.1, 1), 1.0);
    EXPECT_EQ(r.kind, an::RoughnessKind::TwoD);
    EXPECT_FALSE(r.std_nm.has_value());
    EXPECT_TRUE(r.line_roughness_nm.empty());
}

TEST(Analysis, Roughness2DConvergesToNoiseRms) {
    const double amplitude = 0.6;
    const double expected = amplitude / std::sqrt(3.0);
    const an::RoughnessResult r = an::roughness_2d(plane_with_noise(256, amplitude, 42), 1.0);
    EXPECT_NEAR(r.roughness_nm, expected, 0.01 * expected);
}

TEST(Analysis, Roughness2DScalesLinearly) {
    const hm::HeightMatrix m = plane_with_noise(16, 0.2, 5);
    const double unit = an::roughness_2d(m, 1.0).roughness_nm;
    EXPECT_NEAR(an::roughness_2d(m, 1000.0).roughness_nm, 1000.0 * unit, 1e-9);
}

TEST(Analysis, HistogramBinsSpanRange) {
    std::vector<double> values;
    for (int i = 0; i <= 100; ++i) values.push_back(static_cast<double>(i));
    const an::Histogram h = an::height_histogram(values, 10);

    ASSERT_EQ(h.bin_centers.size(), 10u);
    ASSERT_EQ(h.counts.size(), 10u);
    EXPECT_DOUBLE_EQ(h.bin_centers.front(), 5.0);
    EXPECT_DOUBLE_EQ(h.bin_centers.back(), 95.0);
    for (size_t i = 0; i + 1 < h.counts.size(); ++i) EXPECT_EQ(h.counts[i], 10u);
    EXPECT_EQ(h.counts.back(), 11u);  // last bin is closed
}

TEST(Analysis, HistogramCountsEverySample) {
    const std::vector<double> values = an::height_values(plane_with_noise(20, 1.0, 9), 1.0);
    const an::Histogram h = an::height_histogram(values);
    EXPECT_EQ(h.counts.size(), 100u);
    EXPECT_EQ(std::accumulate(h.counts.begin(), h.counts.end(), uint64_t{0}), values.size());
}

TEST(Analysis, HistogramConstantData) {
    const std::vector<double> values(7, 2.0);
    const an::Histogram h = an::height_histogram(values, 5);
    EXPECT_NEAR(h.bin_centers[2], 2.0, 1e-12);
    EXPECT_EQ(std::accumulate(h.counts.begin(), h.counts.end(), uint64_t{0}), 7u);
}

TEST(Analysis, HistogramRejectsDegenerateInput) {
    const std::vector<double> none;
    EXPECT_THROW((void)an::height_histogram(none), afmtools::ShapeError);
    const std::vector<double> one = {1.0};
    EXPECT_THROW((void)an::height_histogram(one, 0), afmtools::ConfigError);
}

TEST(Analysis, ParseSelectors) {
    EXPECT_EQ(an::parse_roughness("1D"), an::Roughness::OneD);
    EXPECT_EQ(an::parse_roughness("2d"), an::Roughness::TwoD);
    EXPECT_EQ(an::parse_height_distribution("Yes"), an::HeightDistribution::Yes);
    try {
        (void)an::parse_roughness("3d");
        FAIL() << "expected ConfigError";
    } catch (const afmtools::ConfigError& e) {
        EXPECT_EQ(e.key(), "roughness");
        EXPECT_EQ(e.value(), "3d");
    }
}

TEST(Analysis, PipelineDistributionFirst) {
    an::AnalysisConfig cfg;
    cfg.roughness = an::Roughness::TwoD;
    cfg.height_distribution = an::HeightDistribution::Yes;
    const std::vector<an::AnalysisStep> expected = {
        an::AnalysisStep::HeightDistribution,
        an::AnalysisStep::Roughness2D,
    };
    EXPECT_EQ(an::build_analysis_pipeline(cfg, true), expected);
}

TEST(Analysis, PipelineRejectsOutOfRangeRoughness) {
    an::AnalysisConfig cfg;
    cfg.roughness = static_cast<an::Roughness>(9);
    EXPECT_THROW((void)an::build_analysis_pipeline(cfg, true), afmtools::ConfigError);
}

TEST(Analysis, PipelineBeforeCorrectionIsSequenceError) {
    an::AnalysisConfig valid;
    valid.roughness = an::Roughness::OneD;
    EXPECT_THROW((void)an::build_analysis_pipeline(valid, false), afmtools::SequenceError);

    an::AnalysisConfig invalid;
    invalid.roughness = static_cast<an::Roughness>(9);
    EXPECT_THROW((void)an::build_analysis_pipeline(invalid, false), afmtools::SequenceError);
    EXPECT_THROW((void)an::build_analysis_pipeline(an::AnalysisConfig{}, false), afmtools::SequenceError);
}

TEST(Analysis, AnalyzeIncompleteCorrectionIsSequenceError) {
    const hm::HeightMatrix m{{1, 2}, {3, 4}};
    corr::CorrectionResult pending;
    pending.corrected = m;
    EXPECT_THROW((void)an::analyze(pending, geometry_for(m), an::AnalysisConfig{}), afmtools::SequenceError);
    EXPECT_THROW((void)an::run_analysis(pending, geometry_for(m), {}), afmtools::SequenceError);
}

TEST(Analysis, AnalyzeFillsRequestedEntries) {
    const hm::HeightMatrix m = plane_with_noise(10, 0.1, 2);
    an::AnalysisConfig cfg;
    cfg.height_distribution = an::HeightDistribution::Yes;
    cfg.roughness = an::Roughness::OneD;

    const an::AnalysisReport report = an::analyze(completed(m), geometry_for(m, 2.0), cfg);
    ASSERT_TRUE(report.height_values.has_value());
    EXPECT_EQ(report.height_values->size(), m.size());
    EXPECT_DOUBLE_EQ(report.height_values->front(), 2.0 * m.data.front());
    ASSERT_TRUE(report.roughness.has_value());
    EXPECT_TRUE(report.roughness->std_nm.has_value());
}

TEST(Analysis, AnalyzeNothingRequested) {
    const hm::HeightMatrix m{{1, 2}, {3, 4}};
    const an::AnalysisReport report = an::analyze(completed(m), geometry_for(m), an::AnalysisConfig{});
    EXPECT_TRUE(report.empty());
}
