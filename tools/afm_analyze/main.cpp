#include "afmtools/analysis.h"
#include "afmtools/correction.h"
#include "afmtools/errors.h"
#include "afmtools/report.h"
#include "afmtools/settings.h"

#include "../common/cli_logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace hm = afmtools::heightmap;
namespace corr = afmtools::correction;
namespace an = afmtools::analysis;
namespace rp = afmtools::report;
namespace st = afmtools::settings;

struct Cli {
    std::string settings_path;
    std::string input_path;
    std::optional<fs::path> results_path;
    std::string json_path;
    std::string out_path;
    std::string histogram_path;
    size_t bins = 100;
    int verbosity = 0;
};

static void usage() {
    std::cerr
        << "Usage: afm_analyze <settings.json> [--input path] [--results [file]]\n"
        << "       [--json report.json] [--out corrected.rawf32]\n"
        << "       [--histogram hist.csv] [--bins N] [-v|-vv]\n\n"
        << "Corrects an AFM height map and evaluates its roughness as configured\n"
        << "in the settings file.\n\n"
        << "RAW format: little-endian float32 array, row-major, no header,\n"
        << "lines x scanning_rate samples.\n\n"
        << "Options:\n"
        << "  --input      Raster file, overrides files_specifications.input_file_name\n"
        << "  --results    Write text results (default file: results.txt)\n"
        << "  --json       Write the JSON report\n"
        << "  --out        Write the corrected raster\n"
        << "  --histogram  Write bin_center,count CSV of the height distribution\n"
        << "  --bins       Histogram bin count (default 100)\n"
        << "  -v, -vv      Verbose or debug logging\n";
}

// parse_cli returns 0 to run, 1 after printing help, -1 on a usage error.
static int parse_cli(int argc, char** argv, Cli& cli) {
    std::vector<std::string> pos;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) cli.input_path = argv[++i];
        else if (std::strcmp(argv[i], "--json") == 0 && i + 1 < argc) cli.json_path = argv[++i];
        else if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) cli.out_path = argv[++i];
        else if (std::strcmp(argv[i], "--histogram") == 0 && i + 1 < argc) cli.histogram_path = argv[++i];
        else if (std::strcmp(argv[i], "--bins") == 0 && i + 1 < argc) {
            try {
                const long long n = std::stoll(argv[++i]);
                if (n <= 0) return -1;
                cli.bins = static_cast<size_t>(n);
            } catch (const std::exception&) {
                return -1;
            }
        } else if (std::strcmp(argv[i], "--results") == 0) {
            // The file name is optional; a following .json argument is the settings file.
            if (i + 1 < argc && argv[i + 1][0] != '-' && fs::path(argv[i + 1]).extension() != ".json") {
                cli.results_path = fs::path(argv[++i]);
            } else {
                cli.results_path = fs::path("results.txt");
            }
        } else if (std::strcmp(argv[i], "-v") == 0) cli.verbosity = std::max(cli.verbosity, 1);
        else if (std::strcmp(argv[i], "-vv") == 0) cli.verbosity = 2;
        else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) return 1;
        else if (argv[i][0] == '-') return -1;
        else pos.emplace_back(argv[i]);
    }

    if (pos.size() != 1) return -1;
    cli.settings_path = pos[0];
    return 0;
}

static fs::path resolve_input(const Cli& cli, const st::Settings& settings) {
    if (!cli.input_path.empty()) return fs::path(cli.input_path);
    if (settings.files.input_file_name.empty()) {
        throw afmtools::ConfigError("files_specifications.input_file_name", "",
                                    "no input raster given (use --input or files_specifications.input_file_name)");
    }
    fs::path p(settings.files.input_file_name);
    if (p.is_relative()) p = fs::path(cli.settings_path).parent_path() / p;
    return p;
}

static hm::HeightMatrix read_raw(const fs::path& path, size_t rows, size_t cols) {
    std::vector<float> buf(rows * cols);
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open input: " + path.string());
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size() * sizeof(float)));
    if (in.gcount() != static_cast<std::streamsize>(buf.size() * sizeof(float))) {
        throw std::runtime_error("input size mismatch for " + path.string());
    }

    hm::HeightMatrix m(rows, cols);
    for (size_t i = 0; i < buf.size(); ++i) m.data[i] = static_cast<double>(buf[i]);
    return m;
}

static void write_raw(const fs::path& path, const hm::HeightMatrix& m) {
    if (!path.parent_path().empty()) fs::create_directories(path.parent_path());
    std::vector<float> buf(m.data.size());
    for (size_t i = 0; i < buf.size(); ++i) buf[i] = static_cast<float>(m.data[i]);
    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("cannot write output: " + path.string());
    out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size() * sizeof(float)));
    if (!out) throw std::runtime_error("failed while writing: " + path.string());
}

static void write_histogram_csv(const fs::path& path, const an::Histogram& h) {
    if (!path.parent_path().empty()) fs::create_directories(path.parent_path());
    std::ofstream out(path);
    if (!out) throw std::runtime_error("cannot write histogram: " + path.string());
    out << "bin_center,count\n";
    out << std::setprecision(17);
    for (size_t i = 0; i < h.counts.size(); ++i) out << h.bin_centers[i] << ',' << h.counts[i] << '\n';
    if (!out) throw std::runtime_error("failed while writing: " + path.string());
}

static void write_json_file(const fs::path& path, const nlohmann::ordered_json& doc) {
    if (!path.parent_path().empty()) fs::create_directories(path.parent_path());
    std::ofstream f(path);
    if (!f) throw std::runtime_error("creating " + path.string());
    f << std::setw(2) << doc << '\n';
}

int main(int argc, char** argv) {
    Cli cli;
    const int parse_result = parse_cli(argc, argv, cli);
    if (parse_result != 0) {
        usage();
        return parse_result > 0 ? 0 : 2;
    }
    afmtools::log::set_verbosity(cli.verbosity);

    try {
        const st::Settings settings = st::load(cli.settings_path);
        const hm::ScanGeometry geometry = settings.geometry();
        LOGI("settings:", cli.settings_path);

        if (settings.correction.drift_correction != corr::DriftCorrection::No &&
            settings.correction.plane_subtraction == corr::PlaneSubtraction::No) {
            LOGW("line drift correction without common plane subtraction; results may keep a global tilt");
        }

        const fs::path input = resolve_input(cli, settings);
        const hm::HeightMatrix raw = read_raw(input, settings.files.lines, settings.files.scanning_rate);
        LOGI("input:", input.string(), std::to_string(raw.rows) + "x" + std::to_string(raw.cols));

        const std::vector<corr::CorrectionStep> steps = corr::build_correction_pipeline(settings.correction);
        for (auto step : steps) LOGI("correction stage:", corr::step_name(step));
        const corr::CorrectionResult corrected = corr::run_correction(raw, geometry, steps);
        LOGD("corrected range:", hm::min_value(corrected.corrected), hm::max_value(corrected.corrected));

        const std::vector<an::AnalysisStep> analysis_steps =
            an::build_analysis_pipeline(settings.analysis, corrected.complete);
        for (auto step : analysis_steps) LOGI("analysis stage:", an::step_name(step));
        const an::AnalysisReport analysis = an::run_analysis(corrected, geometry, analysis_steps);

        auto sink = rp::make_results_sink(cli.results_path);
        rp::emit(*sink, corrected.report, analysis);
        if (cli.results_path) LOGI("results:", cli.results_path->string());

        if (!cli.out_path.empty()) write_raw(cli.out_path, corrected.corrected);

        if (!cli.histogram_path.empty()) {
            if (analysis.height_values) {
                write_histogram_csv(cli.histogram_path, an::height_histogram(*analysis.height_values, cli.bins));
            } else {
                LOGW("--histogram ignored: height_values_distribution is disabled");
            }
        }

        if (!cli.json_path.empty()) {
            write_json_file(cli.json_path, rp::build_report_json(geometry, settings.correction, corrected.report,
                                                                 settings.analysis, analysis));
        }

        std::cerr << "afm_analyze: " << raw.rows << "x" << raw.cols << ", " << steps.size()
                  << " correction stage(s), " << analysis_steps.size() << " analysis stage(s)";
        if (analysis.roughness) std::cerr << ", roughness " << analysis.roughness->roughness_nm << " nm";
        std::cerr << "\n";
        return 0;
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
}
