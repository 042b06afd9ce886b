#pragma once

#include "afmtools/heightmap.h"

#include <optional>
#include <string_view>
#include <vector>

namespace afmtools::correction {

using heightmap::HeightMatrix;
using heightmap::LineFit;
using heightmap::PlaneFit;
using heightmap::ScanGeometry;

enum class PlaneSubtraction { No, Yes };
enum class DriftCorrection { No, Linear, Mean };
enum class DataShift { No, Minimum, Mean };

struct CorrectionConfig {
    PlaneSubtraction plane_subtraction = PlaneSubtraction::No;
    DriftCorrection drift_correction = DriftCorrection::No;
    DataShift data_shift = DataShift::No;
};

// Settings keys naming each selector; also used as ConfigError keys.
inline constexpr std::string_view kPlaneSubtractionKey = "common_plane_subtraction";
inline constexpr std::string_view kDriftCorrectionKey = "line_drift_correction";
inline constexpr std::string_view kDataShiftKey = "data_shift";

std::string_view to_string(PlaneSubtraction v);
std::string_view to_string(DriftCorrection v);
std::string_view to_string(DataShift v);

// parse_* map a settings value (case-insensitive) to its selector and throw
// ConfigError naming the key for anything else.
PlaneSubtraction parse_plane_subtraction(std::string_view value);
DriftCorrection parse_drift_correction(std::string_view value);
DataShift parse_data_shift(std::string_view value);

struct LinearDriftStats {
    double mean_m = 0.0;
    double std_m = 0.0;
    double mean_q = 0.0;
    double std_q = 0.0;
};

// Statistics of the per-line means measured before they were subtracted.
struct MeanDriftStats {
    double mean_offset = 0.0;
    double std_offset = 0.0;
};

struct ShiftApplied {
    DataShift mode = DataShift::No;
    double offset = 0.0;  // value added to every pixel
};

// CorrectionReport collects what each executed stage measured. A missing
// entry means the stage did not run.
struct CorrectionReport {
    std::optional<PlaneFit> plane;
    std::optional<LinearDriftStats> linear_drift;
    std::optional<MeanDriftStats> mean_drift;
    std::optional<ShiftApplied> shift;

    [[nodiscard]] bool empty() const;
};

// --- Primitives ---

// subtract_plane removes the least-squares plane z = a*x + b*y + c.
HeightMatrix subtract_plane(const HeightMatrix& in, PlaneFit* fit_out = nullptr);

// subtract_linear_drift fits z = m*x + q to every scan line independently and
// subtracts it. line_fits_out, when given, receives one fit per row.
HeightMatrix subtract_linear_drift(const HeightMatrix& in, LinearDriftStats* stats_out = nullptr,
                                   std::vector<LineFit>* line_fits_out = nullptr);

// subtract_mean_drift subtracts each scan line's mean from that line.
HeightMatrix subtract_mean_drift(const HeightMatrix& in, MeanDriftStats* stats_out = nullptr);

// shift_data adds one offset to every pixel: minus the global minimum
// (Minimum) or minus the global mean (Mean). No returns the input unchanged.
HeightMatrix shift_data(const HeightMatrix& in, DataShift mode, double* offset_out = nullptr);

// --- Pipeline ---

enum class CorrectionStep { PlaneSubtraction, LinearDrift, MeanDrift, ShiftMinimum, ShiftMean };

std::string_view step_name(CorrectionStep step);

// build_correction_pipeline returns the enabled stages in canonical order:
// plane subtraction, drift correction, data shift. Throws ConfigError for a
// selector holding a value outside its enumeration.
std::vector<CorrectionStep> build_correction_pipeline(const CorrectionConfig& config);

struct CorrectionResult {
    HeightMatrix corrected;
    CorrectionReport report;
    bool complete = false;  // set once every stage ran
};

// run_correction validates the raster against the geometry, then applies the
// steps in order, each one consuming the previous one's output. Nothing is
// returned unless every step succeeded.
CorrectionResult run_correction(const HeightMatrix& raw, const ScanGeometry& geometry,
                                const std::vector<CorrectionStep>& steps);

CorrectionResult correct(const HeightMatrix& raw, const ScanGeometry& geometry, const CorrectionConfig& config);

} // namespace afmtools::correction
