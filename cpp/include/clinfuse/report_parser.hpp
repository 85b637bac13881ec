#ifndef CLINFUSE_REPORT_PARSER_HPP
#define CLINFUSE_REPORT_PARSER_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "clinfuse/evidence.hpp"
#include "clinfuse/logging.hpp"

namespace clinfuse {

// The only place analyzer output is coerced into an AnalyzerReport. It never
// throws: anything it cannot decode becomes an empty report tagged
// ParseStatus::kParseError, and field-level repairs are tagged kRecovered.
class ReportParser {
public:
    explicit ReportParser(Logger logger = get_logger("ReportParser"));

    AnalyzerReport parse(const std::string& analyzer, const nlohmann::json& payload) const;

    // Accepts free text with an embedded JSON object, as returned by
    // language-model backed analyzers.
    AnalyzerReport parse_text(const std::string& analyzer, const std::string& text) const;

    // `reports` maps analyzer name to either a report object or a string.
    ReportSet parse_all(const nlohmann::json& reports) const;

private:
    Logger logger_;
};

AnalyzerReport default_report(const std::string& analyzer, const std::string& error);

}  // namespace clinfuse

#endif  // CLINFUSE_REPORT_PARSER_HPP
