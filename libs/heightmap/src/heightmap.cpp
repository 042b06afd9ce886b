#include "afmtools/heightmap.h"
#include "afmtools/errors.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace afmtools::heightmap {

HeightMatrix::HeightMatrix(size_t r, size_t c, double value)
    : rows(r), cols(c), data(r * c, value) {}

HeightMatrix::HeightMatrix(std::initializer_list<std::initializer_list<double>> values) {
    rows = values.size();
    cols = rows > 0 ? values.begin()->size() : 0;
    data.reserve(rows * cols);
    for (const auto& line : values) {
        if (line.size() != cols) {
            throw ShapeError(std::format("row length differs from first row length {}", cols), line.size());
        }
        data.insert(data.end(), line.begin(), line.end());
    }
}

bool HeightMatrix::empty() const {
    return rows == 0 || cols == 0 || data.empty();
}

size_t HeightMatrix::size() const {
    return data.size();
}

double& HeightMatrix::at(size_t row, size_t col) {
    return data[row * cols + col];
}

const double& HeightMatrix::at(size_t row, size_t col) const {
    return data[row * cols + col];
}

std::span<double> HeightMatrix::row(size_t r) {
    return {data.data() + r * cols, cols};
}

std::span<const double> HeightMatrix::row(size_t r) const {
    return {data.data() + r * cols, cols};
}

void validate(const HeightMatrix& m) {
    if (m.empty()) throw ShapeError("height matrix is empty", m.size());
    if (m.data.size() != m.rows * m.cols) {
        throw ShapeError(std::format("height matrix buffer does not hold {}x{} samples", m.rows, m.cols),
                         m.data.size());
    }
    for (size_t i = 0; i < m.data.size(); ++i) {
        if (!std::isfinite(m.data[i])) {
            throw ShapeError(std::format("non-finite height at row {} column {}", i / m.cols, i % m.cols), i);
        }
    }
}

double min_value(const HeightMatrix& m) {
    if (m.data.empty()) return 0.0;
    return *std::min_element(m.data.begin(), m.data.end());
}

double max_value(const HeightMatrix& m) {
    if (m.data.empty()) return 0.0;
    return *std::max_element(m.data.begin(), m.data.end());
}

double mean_value(const HeightMatrix& m) {
    return mean(m.data);
}

double ScanGeometry::pixel_size() const {
    if (scanning_rate < 2) return 0.0;
    return image_length / static_cast<double>(scanning_rate - 1);
}

void check_geometry(const ScanGeometry& geometry, const HeightMatrix& m) {
    if (geometry.scanning_rate != m.cols) {
        throw ShapeError(std::format("scanning rate {} does not match samples per line", geometry.scanning_rate),
                         m.cols);
    }
    if (!std::isfinite(geometry.image_length) || geometry.image_length <= 0.0) {
        throw ConfigError("image_length", std::format("{}", geometry.image_length),
                          "image_length must be a positive number");
    }
    if (!std::isfinite(geometry.height_scaling_factor) || geometry.height_scaling_factor <= 0.0) {
        throw ConfigError("height_scaling_factor", std::format("{}", geometry.height_scaling_factor),
                          "height_scaling_factor must be a positive number");
    }
}

LineFit fit_line(std::span<const double> samples) {
    const size_t n = samples.size();
    if (n < 2) throw ShapeError("linear fit needs at least 2 samples per line", n);

    // Centered coordinates keep the normal equations well conditioned.
    const double x_mean = static_cast<double>(n - 1) / 2.0;
    const double z_mean = mean(samples);
    double sxx = 0.0;
    double sxz = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        sxx += dx * dx;
        sxz += dx * (samples[i] - z_mean);
    }

    LineFit fit;
    fit.m = sxz / sxx;
    fit.q = z_mean - fit.m * x_mean;
    return fit;
}

PlaneFit fit_plane(const HeightMatrix& m) {
    if (m.size() < 3 || m.data.size() != m.rows * m.cols) {
        throw ShapeError("plane fit needs at least 3 pixels", m.data.size());
    }

    const double x_mean = static_cast<double>(m.cols - 1) / 2.0;
    const double y_mean = static_cast<double>(m.rows - 1) / 2.0;
    const double z_mean = mean(m.data);

    double sxx = 0.0, syy = 0.0, sxy = 0.0, sxz = 0.0, syz = 0.0;
    for (size_t r = 0; r < m.rows; ++r) {
        const double dy = static_cast<double>(r) - y_mean;
        for (size_t c = 0; c < m.cols; ++c) {
            const double dx = static_cast<double>(c) - x_mean;
            const double dz = m.at(r, c) - z_mean;
            sxx += dx * dx;
            syy += dy * dy;
            sxy += dx * dy;
            sxz += dx * dz;
            syz += dy * dz;
        }
    }

    PlaneFit fit;
    if (sxx > 0.0 && syy > 0.0) {
        const double det = sxx * syy - sxy * sxy;
        fit.a = (sxz * syy - syz * sxy) / det;
        fit.b = (syz * sxx - sxz * sxy) / det;
    } else if (sxx > 0.0) {
        fit.a = sxz / sxx;
    } else {
        fit.b = syz / syy;
    }
    fit.c = z_mean - fit.a * x_mean - fit.b * y_mean;
    return fit;
}

double residual_rms(std::span<const double> samples, const LineFit& fit) {
    if (samples.empty()) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < samples.size(); ++i) {
        const double d = samples[i] - evaluate(fit, static_cast<double>(i));
        sum += d * d;
    }
    return std::sqrt(sum / static_cast<double>(samples.size()));
}

double residual_rms(const HeightMatrix& m, const PlaneFit& fit) {
    if (m.data.empty()) return 0.0;
    double sum = 0.0;
    for (size_t r = 0; r < m.rows; ++r) {
        for (size_t c = 0; c < m.cols; ++c) {
            const double d = m.at(r, c) - evaluate(fit, static_cast<double>(c), static_cast<double>(r));
            sum += d * d;
        }
    }
    return std::sqrt(sum / static_cast<double>(m.data.size()));
}

double mean(std::span<const double> values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double stddev(std::span<const double> values) {
    if (values.empty()) return 0.0;
    const double mu = mean(values);
    double sum = 0.0;
    for (double v : values) sum += (v - mu) * (v - mu);
    return std::sqrt(sum / static_cast<double>(values.size()));
}

} // namespace afmtools::heightmap
