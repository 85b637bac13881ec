#include "clinfuse/report_parser.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "clinfuse/common.hpp"

namespace clinfuse {

namespace {

using json = nlohmann::json;

// Tracks whether any field had to be repaired while decoding one report.
struct DecodeContext {
    bool recovered = false;
    std::size_t skipped_entries = 0;
};

// Entries of a findings/evidence list must be objects or bare strings.
bool decodable_entry(const json& value, DecodeContext& ctx) {
    if (value.is_object() || value.is_string()) {
        return true;
    }
    ctx.recovered = true;
    ++ctx.skipped_entries;
    return false;
}

double read_unit_value(const json& value, DecodeContext& ctx) {
    if (value.is_number()) {
        const double raw = value.get<double>();
        const double clamped = clamp_unit(raw);
        if (clamped != raw) {
            ctx.recovered = true;
        }
        return clamped;
    }
    ctx.recovered = true;
    if (value.is_boolean()) {
        return value.get<bool>() ? 1.0 : 0.0;
    }
    if (value.is_string()) {
        const auto text = to_lower(trim(value.get<std::string>()));
        if (text == "true" || text == "yes" || text == "positive") {
            return 1.0;
        }
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (!text.empty() && end == text.c_str() + text.size() && std::isfinite(parsed)) {
            return clamp_unit(parsed);
        }
        return 0.0;
    }
    return 0.0;
}

std::string read_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

// Enum-valued and label fields: a null or non-string value falls back.
std::string read_label(const json& object, const char* key, const std::string& fallback, DecodeContext& ctx) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    ctx.recovered = true;
    return fallback;
}

bool read_flag(const json& object, const char* key, bool fallback, DecodeContext& ctx) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    ctx.recovered = true;
    if (it->is_number()) {
        return it->get<double>() != 0.0;
    }
    if (it->is_string()) {
        const auto text = to_lower(trim(it->get<std::string>()));
        if (text == "true" || text == "yes") {
            return true;
        }
        if (text == "false" || text == "no") {
            return false;
        }
    }
    return fallback;
}

std::optional<std::string> read_optional_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

std::vector<std::string> read_string_list(const json& object, const char* key, DecodeContext& ctx) {
    std::vector<std::string> output;
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return output;
    }
    if (!it->is_array()) {
        ctx.recovered = true;
        output.push_back(it->is_string() ? it->get<std::string>() : it->dump());
        return output;
    }
    for (const auto& item : *it) {
        output.push_back(item.is_string() ? item.get<std::string>() : item.dump());
    }
    return output;
}

Evidence decode_evidence(const json& value, DecodeContext& ctx) {
    Evidence evidence;
    if (value.is_string()) {
        ctx.recovered = true;
        evidence.description = value.get<std::string>();
        return evidence;
    }
    evidence.type = evidence_type_from_string(read_string(value, "type"));
    evidence.description = read_string(value, "description");
    evidence.value = read_optional_string(value, "value");
    evidence.normal_range = read_optional_string(value, "normal_range");
    evidence.is_abnormal = read_flag(value, "is_abnormal", false, ctx);
    evidence.strength = evidence_strength_from_string(read_label(value, "strength", "moderate", ctx));
    evidence.source = read_string(value, "source");
    return evidence;
}

std::vector<Evidence> decode_evidence_list(const json& object, const char* key, DecodeContext& ctx) {
    std::vector<Evidence> output;
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return output;
    }
    if (!it->is_array()) {
        ctx.recovered = true;
        return output;
    }
    for (const auto& item : *it) {
        if (decodable_entry(item, ctx)) {
            output.push_back(decode_evidence(item, ctx));
        }
    }
    return output;
}

Finding decode_finding(const json& value, DecodeContext& ctx) {
    Finding finding;
    if (value.is_string()) {
        ctx.recovered = true;
        finding.name = value.get<std::string>();
        return finding;
    }
    finding.name = read_label(value, "name", "Unknown", ctx);
    finding.present = read_flag(value, "present", true, ctx);
    finding.evidence = decode_evidence_list(value, "evidence", ctx);
    finding.severity = severity_from_string(read_label(value, "severity", "moderate", ctx));
    finding.clinical_significance = read_string(value, "clinical_significance");
    return finding;
}

DiagnosticHypothesis decode_hypothesis(const json& value, DecodeContext& ctx) {
    DiagnosticHypothesis hypothesis;
    hypothesis.diagnosis = read_string(value, "diagnosis");
    hypothesis.icd10_code = read_optional_string(value, "icd10_code");
    if (value.contains("probability")) {
        hypothesis.probability = read_unit_value(value.at("probability"), ctx);
    }
    hypothesis.supporting_evidence = decode_evidence_list(value, "supporting_evidence", ctx);
    hypothesis.opposing_evidence = decode_evidence_list(value, "opposing_evidence", ctx);
    hypothesis.required_for_diagnosis = read_string_list(value, "required_for_diagnosis", ctx);
    hypothesis.criteria_met = read_string_list(value, "criteria_met", ctx);
    hypothesis.criteria_not_met = read_string_list(value, "criteria_not_met", ctx);
    hypothesis.differential_diagnoses = read_string_list(value, "differential_diagnoses", ctx);
    hypothesis.recommended_workup = read_string_list(value, "recommended_workup", ctx);
    hypothesis.urgency = severity_from_string(read_label(value, "urgency", "moderate", ctx));
    return hypothesis;
}

AnalyzerReport decode_report(const std::string& analyzer, const json& payload, DecodeContext& ctx) {
    if (!payload.is_object()) {
        throw std::runtime_error("report payload is not an object");
    }
    AnalyzerReport report;
    report.analyzer = analyzer;
    if (report.analyzer.empty()) {
        report.analyzer = payload.contains("analyzer") ? read_string(payload, "analyzer") : read_string(payload, "agent");
    }

    auto diagnoses = payload.find("diagnoses");
    if (diagnoses != payload.end() && !diagnoses->is_null()) {
        if (!diagnoses->is_object()) {
            throw std::runtime_error("diagnoses must be an object");
        }
        for (const auto& [name, probability] : diagnoses->items()) {
            report.diagnoses[name] = read_unit_value(probability, ctx);
        }
    }
    if (payload.contains("confidence")) {
        report.confidence = read_unit_value(payload.at("confidence"), ctx);
    }

    auto findings = payload.find("findings");
    if (findings != payload.end() && findings->is_array()) {
        for (const auto& item : *findings) {
            if (decodable_entry(item, ctx)) {
                report.findings.push_back(decode_finding(item, ctx));
            }
        }
    }
    auto hypotheses = payload.find("hypotheses");
    if (hypotheses != payload.end() && hypotheses->is_array()) {
        for (const auto& item : *hypotheses) {
            if (item.is_object()) {
                report.hypotheses.push_back(decode_hypothesis(item, ctx));
            } else {
                ctx.recovered = true;
                ++ctx.skipped_entries;
            }
        }
    }
    // Analyzers that only emit hypotheses still get a diagnosis map.
    if (report.diagnoses.empty()) {
        for (const auto& hypothesis : report.hypotheses) {
            if (!hypothesis.diagnosis.empty()) {
                report.diagnoses[hypothesis.diagnosis] = hypothesis.probability;
            }
        }
    }

    report.alerts = read_string_list(payload, payload.contains("alerts") ? "alerts" : "flags", ctx);
    const bool definitive_flag = payload.contains("is_definitive") && payload.at("is_definitive").is_boolean() &&
                                 payload.at("is_definitive").get<bool>();
    report.is_definitive = definitive_flag || to_lower(read_string(payload, "diagnostic_certainty")) == "confirmed";
    report.primary_impression = payload.contains("primary_impression") ? read_string(payload, "primary_impression")
                                                                         : read_string(payload, "top_diagnosis");
    report.explanation = read_string(payload, "explanation");
    report.recommendations = read_string_list(payload, "recommendations", ctx);
    report.parse_status = ctx.recovered ? ParseStatus::kRecovered : ParseStatus::kOk;
    return report;
}

// nlohmann's messages quote the offending input, so only the error id and
// position are kept.
std::string describe_json_error(const nlohmann::json::exception& exc) {
    return "malformed analyzer payload (json error " + std::to_string(exc.id) + ")";
}

std::string describe_json_error(const nlohmann::json::parse_error& exc) {
    return "malformed analyzer payload (json error " + std::to_string(exc.id) + " at byte " +
           std::to_string(exc.byte) + ")";
}

}  // namespace

AnalyzerReport default_report(const std::string& analyzer, const std::string& error) {
    AnalyzerReport report;
    report.analyzer = analyzer;
    report.confidence = 0.0;
    report.parse_status = ParseStatus::kParseError;
    report.parse_error = error;
    return report;
}

ReportParser::ReportParser(Logger logger) : logger_(std::move(logger)) {}

AnalyzerReport ReportParser::parse(const std::string& analyzer, const nlohmann::json& payload) const {
    if (payload.is_string()) {
        return parse_text(analyzer, payload.get<std::string>());
    }
    DecodeContext ctx;
    try {
        auto report = decode_report(analyzer, payload, ctx);
        if (report.parse_status == ParseStatus::kRecovered) {
            logger_.debug("report_fields_recovered", {{"analyzer", report.analyzer},
                                                      {"skipped_entries", std::to_string(ctx.skipped_entries)}});
        }
        return report;
    } catch (const nlohmann::json::exception& exc) {
        const auto error = describe_json_error(exc);
        logger_.warn("report_parse_failed", {{"analyzer", analyzer}, {"error", error}});
        return default_report(analyzer, error);
    } catch (const std::runtime_error& exc) {
        logger_.warn("report_parse_failed", {{"analyzer", analyzer}, {"error", exc.what()}});
        return default_report(analyzer, exc.what());
    }
}

AnalyzerReport ReportParser::parse_text(const std::string& analyzer, const std::string& text) const {
    const auto start = text.find('{');
    const auto end = text.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        logger_.warn("report_payload_missing", {{"analyzer", analyzer}});
        return default_report(analyzer, "no structured payload found in analyzer text");
    }
    try {
        const auto payload = nlohmann::json::parse(text.substr(start, end - start + 1));
        return parse(analyzer, payload);
    } catch (const nlohmann::json::parse_error& exc) {
        const auto error = describe_json_error(exc);
        logger_.warn("report_parse_failed", {{"analyzer", analyzer}, {"error", error}});
        return default_report(analyzer, error);
    }
}

ReportSet ReportParser::parse_all(const nlohmann::json& reports) const {
    ReportSet output;
    if (reports.is_object()) {
        for (const auto& [name, payload] : reports.items()) {
            output[name] = parse(name, payload);
        }
    } else if (reports.is_array()) {
        // Anonymous list form: identity comes from each report's "agent" field.
        for (const auto& payload : reports) {
            auto report = parse("", payload);
            if (report.analyzer.empty()) {
                report.analyzer = "analyzer_" + std::to_string(output.size() + 1);
            }
            if (output.count(report.analyzer) != 0) {
                const auto original = report.analyzer;
                for (int suffix = 2; output.count(report.analyzer) != 0; ++suffix) {
                    report.analyzer = original + "#" + std::to_string(suffix);
                }
                logger_.warn("report_analyzer_renamed", {{"analyzer", original}, {"renamed", report.analyzer}});
            }
            output[report.analyzer] = std::move(report);
        }
    } else if (!reports.is_null()) {
        logger_.warn("report_set_malformed", {{"type", reports.type_name()}});
    }
    return output;
}

}  // namespace clinfuse
