#pragma once

#include "afmtools/analysis.h"
#include "afmtools/correction.h"
#include "afmtools/heightmap.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace afmtools::report {

inline constexpr int kSchemaVersion = 1;

// Rule closing every results block.
inline constexpr std::string_view kBlockRule = "----------------------------";

// ResultsSink receives formatted result blocks. The pipeline core never holds
// one; the caller picks an implementation once and feeds it the reports.
class ResultsSink {
public:
    virtual ~ResultsSink() = default;
    virtual void write(std::string_view block) = 0;
};

// TextResultsWriter appends every block, followed by a newline, to a file.
class TextResultsWriter : public ResultsSink {
public:
    explicit TextResultsWriter(const std::filesystem::path& path);

    void write(std::string_view block) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
};

class NullResultsWriter : public ResultsSink {
public:
    void write(std::string_view) override {}
};

// make_results_sink returns a TextResultsWriter for a path, or a
// NullResultsWriter when none is given.
std::unique_ptr<ResultsSink> make_results_sink(const std::optional<std::filesystem::path>& path);

// format_correction_report renders one block per executed correction stage,
// in pipeline order. Returns an empty string for an empty report.
std::string format_correction_report(const correction::CorrectionReport& report);

std::string format_analysis_report(const analysis::AnalysisReport& report);

// emit writes every non-empty block of both reports to the sink.
void emit(ResultsSink& sink, const correction::CorrectionReport& correction,
          const analysis::AnalysisReport& analysis);

nlohmann::ordered_json to_json(const heightmap::ScanGeometry& geometry);
nlohmann::ordered_json to_json(const correction::CorrectionReport& report);
nlohmann::ordered_json to_json(const analysis::AnalysisReport& report);

// build_report_json assembles the machine-readable report. Height values are
// summarized by count, min and max rather than embedded.
nlohmann::ordered_json build_report_json(const heightmap::ScanGeometry& geometry,
                                         const correction::CorrectionConfig& correction_config,
                                         const correction::CorrectionReport& correction,
                                         const analysis::AnalysisConfig& analysis_config,
                                         const analysis::AnalysisReport& analysis);

} // namespace afmtools::report
