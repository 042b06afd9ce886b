#pragma once

#include <cstddef>
#include <initializer_list>
#include <span>
#include <vector>

namespace afmtools::heightmap {

// HeightMatrix is a row-major raster of surface heights. Rows follow the slow
// scan axis (one row per scan line), columns the fast scan axis.
struct HeightMatrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<double> data;

    HeightMatrix() = default;
    HeightMatrix(size_t rows, size_t cols, double value = 0.0);
    HeightMatrix(std::initializer_list<std::initializer_list<double>> values);

    [[nodiscard]] bool empty() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] double& at(size_t row, size_t col);
    [[nodiscard]] const double& at(size_t row, size_t col) const;
    [[nodiscard]] std::span<double> row(size_t r);
    [[nodiscard]] std::span<const double> row(size_t r) const;
};

// validate throws ShapeError for an empty or non-rectangular matrix and for
// non-finite samples.
void validate(const HeightMatrix& m);

double min_value(const HeightMatrix& m);
double max_value(const HeightMatrix& m);
double mean_value(const HeightMatrix& m);

// ScanGeometry holds the physical scan parameters of one raster.
struct ScanGeometry {
    size_t scanning_rate = 0;        // samples per scan line
    double image_length = 0.0;       // physical side length of the scanned area
    double height_scaling_factor = 1.0;

    // pixel_size returns the physical distance between adjacent samples.
    // Samples sit on [0, image_length] with both ends included, so the step
    // is image_length / (scanning_rate - 1); 0 for fewer than 2 samples.
    [[nodiscard]] double pixel_size() const;
};

// check_geometry verifies that geometry describes m: scanning_rate must equal
// the column count (ShapeError), image_length and height_scaling_factor must be
// finite and positive (ConfigError).
void check_geometry(const ScanGeometry& geometry, const HeightMatrix& m);

// Fits use pixel index coordinates: x is the column index, y the row index.

// LineFit is z = m*x + q.
struct LineFit {
    double m = 0.0;
    double q = 0.0;
};

// PlaneFit is z = a*x + b*y + c.
struct PlaneFit {
    double a = 0.0;
    double b = 0.0;
    double c = 0.0;
};

// fit_line returns the least-squares line through samples, x being the sample
// index. Throws ShapeError for fewer than 2 samples.
LineFit fit_line(std::span<const double> samples);

// fit_plane returns the least-squares plane through every pixel. Throws
// ShapeError for fewer than 3 pixels. When the matrix has a single row (or
// column) the slope along that axis is undetermined and reported as 0.
PlaneFit fit_plane(const HeightMatrix& m);

[[nodiscard]] inline double evaluate(const LineFit& f, double x) { return f.m * x + f.q; }
[[nodiscard]] inline double evaluate(const PlaneFit& f, double x, double y) { return f.a * x + f.b * y + f.c; }

// Root mean square of the residuals left by a fit.
double residual_rms(std::span<const double> samples, const LineFit& fit);
double residual_rms(const HeightMatrix& m, const PlaneFit& fit);

// mean and stddev over a sample set; stddev is the population deviation.
// Both return 0 for an empty set.
double mean(std::span<const double> values);
double stddev(std::span<const double> values);

} // namespace afmtools::heightmap
