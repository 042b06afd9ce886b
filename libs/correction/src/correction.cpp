#include "afmtools/correction.h"
#include "afmtools/errors.h"

#include <cctype>
#include <string>
#include <utility>

namespace afmtools::correction {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

[[noreturn]] void throw_out_of_range(std::string_view key, int raw) {
    throw ConfigError(std::string(key), std::to_string(raw));
}

} // namespace

std::string_view to_string(PlaneSubtraction v) {
    switch (v) {
        case PlaneSubtraction::No:  return "no";
        case PlaneSubtraction::Yes: return "yes";
    }
    return "invalid";
}

std::string_view to_string(DriftCorrection v) {
    switch (v) {
        case DriftCorrection::No:     return "no";
        case DriftCorrection::Linear: return "linear";
        case DriftCorrection::Mean:   return "mean";
    }
    return "invalid";
}

std::string_view to_string(DataShift v) {
    switch (v) {
        case DataShift::No:      return "no";
        case DataShift::Minimum: return "minimum";
        case DataShift::Mean:    return "mean";
    }
    return "invalid";
}

PlaneSubtraction parse_plane_subtraction(std::string_view value) {
    const std::string v = lowercase(value);
    if (v == "yes") return PlaneSubtraction::Yes;
    if (v == "no") return PlaneSubtraction::No;
    throw ConfigError(std::string(kPlaneSubtractionKey), std::string(value));
}

DriftCorrection parse_drift_correction(std::string_view value) {
    const std::string v = lowercase(value);
    if (v == "linear") return DriftCorrection::Linear;
    if (v == "mean") return DriftCorrection::Mean;
    if (v == "no") return DriftCorrection::No;
    throw ConfigError(std::string(kDriftCorrectionKey), std::string(value));
}

DataShift parse_data_shift(std::string_view value) {
    const std::string v = lowercase(value);
    if (v == "minimum") return DataShift::Minimum;
    if (v == "mean") return DataShift::Mean;
    if (v == "no") return DataShift::No;
    throw ConfigError(std::string(kDataShiftKey), std::string(value));
}

bool CorrectionReport::empty() const {
    return !plane && !linear_drift && !mean_drift && !shift;
}

HeightMatrix subtract_plane(const HeightMatrix& in, PlaneFit* fit_out) {
    const PlaneFit fit = heightmap::fit_plane(in);
    HeightMatrix out = in;
    for (size_t y = 0; y < out.rows; ++y) {
        for (size_t x = 0; x < out.cols; ++x) {
            out.at(y, x) -= heightmap::evaluate(fit, static_cast<double>(x), static_cast<double>(y));
        }
    }
    if (fit_out) *fit_out = fit;
    return out;
}

HeightMatrix subtract_linear_drift(const HeightMatrix& in, LinearDriftStats* stats_out,
                                   std::vector<LineFit>* line_fits_out) {
    HeightMatrix out = in;
    std::vector<double> m_set;
    std::vector<double> q_set;
    std::vector<LineFit> fits;
    m_set.reserve(out.rows);
    q_set.reserve(out.rows);
    fits.reserve(out.rows);

    // Each line is fitted on its own samples only.
    for (size_t y = 0; y < out.rows; ++y) {
        auto line = out.row(y);
        const LineFit fit = heightmap::fit_line(line);
        for (size_t x = 0; x < line.size(); ++x) {
            line[x] -= heightmap::evaluate(fit, static_cast<double>(x));
        }
        m_set.push_back(fit.m);
        q_set.push_back(fit.q);
        fits.push_back(fit);
    }

    if (stats_out) {
        stats_out->mean_m = heightmap::mean(m_set);
        stats_out->std_m = heightmap::stddev(m_set);
        stats_out->mean_q = heightmap::mean(q_set);
        stats_out->std_q = heightmap::stddev(q_set);
    }
    if (line_fits_out) *line_fits_out = std::move(fits);
    return out;
}

HeightMatrix subtract_mean_drift(const HeightMatrix& in, MeanDriftStats* stats_out) {
    HeightMatrix out = in;
    std::vector<double> mean_set;
    mean_set.reserve(out.rows);

    for (size_t y = 0; y < out.rows; ++y) {
        auto line = out.row(y);
        const double line_mean = heightmap::mean(line);
        for (double& v : line) v -= line_mean;
        mean_set.push_back(line_mean);
    }

    if (stats_out) {
        stats_out->mean_offset = heightmap::mean(mean_set);
        stats_out->std_offset = heightmap::stddev(mean_set);
    }
    return out;
}

HeightMatrix shift_data(const HeightMatrix& in, DataShift mode, double* offset_out) {
    double offset = 0.0;
    switch (mode) {
        case DataShift::No:
            if (offset_out) *offset_out = 0.0;
            return in;
        case DataShift::Minimum:
            offset = -heightmap::min_value(in);
            break;
        case DataShift::Mean:
            offset = -heightmap::mean_value(in);
            break;
        default:
            throw_out_of_range(kDataShiftKey, static_cast<int>(mode));
    }

    HeightMatrix out = in;
    for (double& v : out.data) v += offset;
    if (offset_out) *offset_out = offset;
    return out;
}

std::string_view step_name(CorrectionStep step) {
    switch (step) {
        case CorrectionStep::PlaneSubtraction: return "plane_subtraction";
        case CorrectionStep::LinearDrift:      return "linear_drift";
        case CorrectionStep::MeanDrift:        return "mean_drift";
        case CorrectionStep::ShiftMinimum:     return "shift_minimum";
        case CorrectionStep::ShiftMean:        return "shift_mean";
    }
    return "unknown";
}

std::vector<CorrectionStep> build_correction_pipeline(const CorrectionConfig& config) {
    std::vector<CorrectionStep> steps;

    switch (config.plane_subtraction) {
        case PlaneSubtraction::Yes: steps.push_back(CorrectionStep::PlaneSubtraction); break;
        case PlaneSubtraction::No: break;
        default: throw_out_of_range(kPlaneSubtractionKey, static_cast<int>(config.plane_subtraction));
    }

    switch (config.drift_correction) {
        case DriftCorrection::Linear: steps.push_back(CorrectionStep::LinearDrift); break;
        case DriftCorrection::Mean: steps.push_back(CorrectionStep::MeanDrift); break;
        case DriftCorrection::No: break;
        default: throw_out_of_range(kDriftCorrectionKey, static_cast<int>(config.drift_correction));
    }

    switch (config.data_shift) {
        case DataShift::Minimum: steps.push_back(CorrectionStep::ShiftMinimum); break;
        case DataShift::Mean: steps.push_back(CorrectionStep::ShiftMean); break;
        case DataShift::No: break;
        default: throw_out_of_range(kDataShiftKey, static_cast<int>(config.data_shift));
    }

    return steps;
}

CorrectionResult run_correction(const HeightMatrix& raw, const ScanGeometry& geometry,
                                const std::vector<CorrectionStep>& steps) {
    heightmap::validate(raw);
    heightmap::check_geometry(geometry, raw);

    HeightMatrix current = raw;
    CorrectionReport report;
    for (CorrectionStep step : steps) {
        switch (step) {
            case CorrectionStep::PlaneSubtraction: {
                PlaneFit fit;
                current = subtract_plane(current, &fit);
                report.plane = fit;
                break;
            }
            case CorrectionStep::LinearDrift: {
                LinearDriftStats stats;
                current = subtract_linear_drift(current, &stats);
                report.linear_drift = stats;
                break;
            }
            case CorrectionStep::MeanDrift: {
                MeanDriftStats stats;
                current = subtract_mean_drift(current, &stats);
                report.mean_drift = stats;
                break;
            }
            case CorrectionStep::ShiftMinimum:
            case CorrectionStep::ShiftMean: {
                const DataShift mode = step == CorrectionStep::ShiftMinimum ? DataShift::Minimum : DataShift::Mean;
                double offset = 0.0;
                current = shift_data(current, mode, &offset);
                report.shift = ShiftApplied{mode, offset};
                break;
            }
        }
    }

    CorrectionResult result;
    result.corrected = std::move(current);
    result.report = std::move(report);
    result.complete = true;
    return result;
}

CorrectionResult correct(const HeightMatrix& raw, const ScanGeometry& geometry, const CorrectionConfig& config) {
    return run_correction(raw, geometry, build_correction_pipeline(config));
}

} // namespace afmtools::correction
