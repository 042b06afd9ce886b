#include "afmtools/analysis.h"
#include "afmtools/errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace afmtools::analysis {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

HeightMatrix scaled(const HeightMatrix& m, double factor) {
    HeightMatrix out = m;
    for (double& v : out.data) v *= factor;
    return out;
}

} // namespace

std::string_view to_string(HeightDistribution v) {
    switch (v) {
        case HeightDistribution::No:  return "no";
        case HeightDistribution::Yes: return "yes";
    }
    return "invalid";
}

std::string_view to_string(Roughness v) {
    switch (v) {
        case Roughness::No:   return "no";
        case Roughness::OneD: return "1d";
        case Roughness::TwoD: return "2d";
    }
    return "invalid";
}

HeightDistribution parse_height_distribution(std::string_view value) {
    const std::string v = lowercase(value);
    if (v == "yes") return HeightDistribution::Yes;
    if (v == "no") return HeightDistribution::No;
    throw ConfigError(std::string(kHeightDistributionKey), std::string(value));
}

Roughness parse_roughness(std::string_view value) {
    const std::string v = lowercase(value);
    if (v == "1d") return Roughness::OneD;
    if (v == "2d") return Roughness::TwoD;
    if (v == "no") return Roughness::No;
    throw ConfigError(std::string(kRoughnessKey), std::string(value));
}

bool AnalysisReport::empty() const {
    return !height_values && !roughness;
}

std::vector<double> height_values(const HeightMatrix& m, double height_scaling_factor) {
    std::vector<double> out;
    out.reserve(m.data.size());
    for (double v : m.data) out.push_back(v * height_scaling_factor);
    return out;
}

RoughnessResult roughness_1d(const HeightMatrix& m, double height_scaling_factor) {
    const HeightMatrix nm = scaled(m, height_scaling_factor);

    RoughnessResult r;
    r.kind = RoughnessKind::OneD;
    r.line_roughness_nm.reserve(nm.rows);
    for (size_t y = 0; y < nm.rows; ++y) {
        const auto line = nm.row(y);
        r.line_roughness_nm.push_back(heightmap::residual_rms(line, heightmap::fit_line(line)));
    }
    r.roughness_nm = heightmap::mean(r.line_roughness_nm);
    r.std_nm = heightmap::stddev(r.line_roughness_nm);
    return r;
}

RoughnessResult roughness_2d(const HeightMatrix& m, double height_scaling_factor) {
    const HeightMatrix nm = scaled(m, height_scaling_factor);

    RoughnessResult r;
    r.kind = RoughnessKind::TwoD;
    r.roughness_nm = heightmap::residual_rms(nm, heightmap::fit_plane(nm));
    return r;
}

Histogram height_histogram(std::span<const double> values, size_t bins) {
    if (bins == 0) throw ConfigError("bins", "0", "histogram needs at least one bin");
    if (values.empty()) throw ShapeError("histogram needs at least one value", 0);

    const auto [mn_it, mx_it] = std::minmax_element(values.begin(), values.end());
    double lo = *mn_it;
    double hi = *mx_it;
    if (lo == hi) {
        lo -= 0.5;
        hi += 0.5;
    }

    std::vector<double> edges(bins + 1);
    const double width = (hi - lo) / static_cast<double>(bins);
    for (size_t i = 0; i <= bins; ++i) edges[i] = lo + width * static_cast<double>(i);
    edges.back() = hi;

    Histogram h;
    h.bin_centers.resize(bins);
    h.counts.assign(bins, 0);
    for (size_t i = 0; i < bins; ++i) h.bin_centers[i] = 0.5 * (edges[i] + edges[i + 1]);

    for (double v : values) {
        if (v == hi) {
            ++h.counts.back();
            continue;
        }
        auto idx = static_cast<size_t>((v - lo) / width);
        idx = std::min(idx, bins - 1);
        // Rounding in the division can land one bin off near an edge.
        if (idx > 0 && v < edges[idx]) --idx;
        else if (idx + 1 < bins && v >= edges[idx + 1]) ++idx;
        ++h.counts[idx];
    }
    return h;
}

std::string_view step_name(AnalysisStep step) {
    switch (step) {
        case AnalysisStep::HeightDistribution: return "height_distribution";
        case AnalysisStep::Roughness1D:        return "roughness_1d";
        case AnalysisStep::Roughness2D:        return "roughness_2d";
    }
    return "unknown";
}

std::vector<AnalysisStep> build_analysis_pipeline(const AnalysisConfig& config, bool correction_complete) {
    if (!correction_complete) {
        throw SequenceError("analysis requested before image correction completed");
    }

    std::vector<AnalysisStep> steps;
    switch (config.height_distribution) {
        case HeightDistribution::Yes: steps.push_back(AnalysisStep::HeightDistribution); break;
        case HeightDistribution::No: break;
        default:
            throw ConfigError(std::string(kHeightDistributionKey),
                              std::to_string(static_cast<int>(config.height_distribution)));
    }

    switch (config.roughness) {
        case Roughness::OneD: steps.push_back(AnalysisStep::Roughness1D); break;
        case Roughness::TwoD: steps.push_back(AnalysisStep::Roughness2D); break;
        case Roughness::No: break;
        default:
            throw ConfigError(std::string(kRoughnessKey), std::to_string(static_cast<int>(config.roughness)));
    }
    return steps;
}

AnalysisReport run_analysis(const correction::CorrectionResult& corrected, const ScanGeometry& geometry,
                            const std::vector<AnalysisStep>& steps) {
    if (!corrected.complete) {
        throw SequenceError("analysis requested before image correction completed");
    }
    const HeightMatrix& surface = corrected.corrected;
    heightmap::check_geometry(geometry, surface);

    AnalysisReport report;
    for (AnalysisStep step : steps) {
        switch (step) {
            case AnalysisStep::HeightDistribution:
                report.height_values = height_values(surface, geometry.height_scaling_factor);
                break;
            case AnalysisStep::Roughness1D:
                report.roughness = roughness_1d(surface, geometry.height_scaling_factor);
                break;
            case AnalysisStep::Roughness2D:
                report.roughness = roughness_2d(surface, geometry.height_scaling_factor);
                break;
        }
    }
    return report;
}

AnalysisReport analyze(const correction::CorrectionResult& corrected, const ScanGeometry& geometry,
                       const AnalysisConfig& config) {
    return run_analysis(corrected, geometry, build_analysis_pipeline(config, corrected.complete));
}

} // namespace afmtools::analysis
