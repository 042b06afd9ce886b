#include "afmtools/report.h"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace afmtools::report {

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace {

void append_line(std::string& out, std::string_view line) {
    out.append(line);
    out.push_back('\n');
}

void close_block(std::string& out) {
    append_line(out, kBlockRule);
}

std::string_view roughness_kind_name(analysis::RoughnessKind kind) {
    return kind == analysis::RoughnessKind::OneD ? "1d" : "2d";
}

} // namespace

TextResultsWriter::TextResultsWriter(const fs::path& path) : path_(path) {
    if (!path_.parent_path().empty()) fs::create_directories(path_.parent_path());
    out_.open(path_, std::ios::out | std::ios::trunc);
    if (!out_) throw std::runtime_error("cannot write results: " + path_.string());
}

void TextResultsWriter::write(std::string_view block) {
    out_ << block << '\n';
    out_.flush();
    if (!out_) throw std::runtime_error("failed while writing: " + path_.string());
}

std::unique_ptr<ResultsSink> make_results_sink(const std::optional<fs::path>& path) {
    if (path) return std::make_unique<TextResultsWriter>(*path);
    return std::make_unique<NullResultsWriter>();
}

std::string format_correction_report(const correction::CorrectionReport& report) {
    std::string out;
    if (report.plane) {
        append_line(out, "COMMON PLANE SUBTRACTION");
        append_line(out, "plane equation: z = a*x + b*y + c");
        append_line(out, std::format("a = {}", report.plane->a));
        append_line(out, std::format("b = {}", report.plane->b));
        append_line(out, std::format("c = {}", report.plane->c));
        close_block(out);
    }
    if (report.linear_drift) {
        const auto& d = *report.linear_drift;
        append_line(out, "LINE DRIFT SUBTRACTION");
        append_line(out, "line equation: z = m*x + q");
        append_line(out, std::format("average m value = {}", d.mean_m));
        append_line(out, std::format("m values standard deviation = {}", d.std_m));
        append_line(out, std::format("average q value = {}", d.mean_q));
        append_line(out, std::format("q values standard deviation = {}", d.std_q));
        close_block(out);
    }
    if (report.mean_drift) {
        append_line(out, "MEAN DRIFT SUBTRACTION");
        append_line(out, std::format("average mean value = {}", report.mean_drift->mean_offset));
        append_line(out, std::format("standard deviation = {}", report.mean_drift->std_offset));
        close_block(out);
    }
    if (report.shift) {
        append_line(out, "DATA SHIFT");
        append_line(out, std::format("mode = {}", correction::to_string(report.shift->mode)));
        append_line(out, std::format("offset = {}", report.shift->offset));
        close_block(out);
    }
    return out;
}

std::string format_analysis_report(const analysis::AnalysisReport& report) {
    std::string out;
    if (!report.roughness) return out;

    const auto& r = *report.roughness;
    if (r.kind == analysis::RoughnessKind::OneD) {
        append_line(out, "1D ROUGHNESS");
        append_line(out, std::format("roughness = {} nm", r.roughness_nm));
        append_line(out, std::format("standard deviation = {} nm", r.std_nm.value_or(0.0)));
    } else {
        append_line(out, "2D ROUGHNESS");
        append_line(out, std::format("roughness = {} nm", r.roughness_nm));
    }
    close_block(out);
    return out;
}

void emit(ResultsSink& sink, const correction::CorrectionReport& correction,
          const analysis::AnalysisReport& analysis) {
    const std::string corr_text = format_correction_report(correction);
    if (!corr_text.empty()) sink.write(corr_text);
    const std::string analysis_text = format_analysis_report(analysis);
    if (!analysis_text.empty()) sink.write(analysis_text);
}

json to_json(const heightmap::ScanGeometry& geometry) {
    return json{
        {"scanningRate", geometry.scanning_rate},
        {"imageLength", geometry.image_length},
        {"pixelSize", geometry.pixel_size()},
        {"heightScalingFactor", geometry.height_scaling_factor},
    };
}

json to_json(const correction::CorrectionReport& report) {
    json j = json::object();
    if (report.plane) {
        j["plane"] = {{"a", report.plane->a}, {"b", report.plane->b}, {"c", report.plane->c}};
    }
    if (report.linear_drift) {
        const auto& d = *report.linear_drift;
        j["linearDrift"] = {{"meanM", d.mean_m}, {"stdM", d.std_m}, {"meanQ", d.mean_q}, {"stdQ", d.std_q}};
    }
    if (report.mean_drift) {
        j["meanDrift"] = {{"meanOffset", report.mean_drift->mean_offset},
                          {"stdOffset", report.mean_drift->std_offset}};
    }
    if (report.shift) {
        j["shift"] = {{"mode", std::string(correction::to_string(report.shift->mode))}, {"offset", report.shift->offset}};
    }
    return j;
}

json to_json(const analysis::AnalysisReport& report) {
    json j = json::object();
    if (report.height_values) {
        const auto& v = *report.height_values;
        json summary = {{"count", v.size()}};
        if (!v.empty()) {
            const auto [mn, mx] = std::minmax_element(v.begin(), v.end());
            summary["minNm"] = *mn;
            summary["maxNm"] = *mx;
        }
        j["heightValues"] = summary;
    }
    if (report.roughness) {
        const auto& r = *report.roughness;
        json rj = {{"kind", std::string(roughness_kind_name(r.kind))}, {"roughnessNm", r.roughness_nm}};
        if (r.std_nm) rj["stdNm"] = *r.std_nm;
        if (!r.line_roughness_nm.empty()) rj["lineRoughnessNm"] = r.line_roughness_nm;
        j["roughness"] = rj;
    }
    return j;
}

json build_report_json(const heightmap::ScanGeometry& geometry,
                       const correction::CorrectionConfig& correction_config,
                       const correction::CorrectionReport& correction,
                       const analysis::AnalysisConfig& analysis_config,
                       const analysis::AnalysisReport& analysis) {
    json steps = json::array();
    for (auto step : correction::build_correction_pipeline(correction_config)) {
        steps.push_back(std::string(correction::step_name(step)));
    }
    json analysis_steps = json::array();
    for (auto step : analysis::build_analysis_pipeline(analysis_config, true)) {
        analysis_steps.push_back(std::string(analysis::step_name(step)));
    }

    return json{
        {"schemaVersion", kSchemaVersion},
        {"geometry", to_json(geometry)},
        {"correction", {{"steps", steps}, {"results", to_json(correction)}}},
        {"analysis", {{"steps", analysis_steps}, {"results", to_json(analysis)}}},
    };
}

} // namespace afmtools::report
