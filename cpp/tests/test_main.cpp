#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "clinfuse/audit_ledger.hpp"
#include "clinfuse/config.hpp"
#include "clinfuse/consensus.hpp"
#include "clinfuse/diagnosis_names.hpp"
#include "clinfuse/evidence.hpp"
#include "clinfuse/explainability.hpp"
#include "clinfuse/hashing.hpp"
#include "clinfuse/logging.hpp"
#include "clinfuse/pipeline.hpp"
#include "clinfuse/report_parser.hpp"
#include "clinfuse/safety.hpp"
#include "clinfuse/serialization.hpp"

namespace {

namespace fs = std::filesystem;

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (std::fabs(value - expected) > tolerance) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

bool contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

clinfuse::AnalyzerReport make_report(const std::string& analyzer, std::map<std::string, double> diagnoses,
                                     double confidence, bool definitive = false) {
    clinfuse::AnalyzerReport report;
    report.analyzer = analyzer;
    report.diagnoses = std::move(diagnoses);
    report.confidence = confidence;
    report.is_definitive = definitive;
    return report;
}

clinfuse::Finding make_finding(const std::string& name, clinfuse::Severity severity, bool present = true) {
    clinfuse::Finding finding;
    finding.name = name;
    finding.severity = severity;
    finding.present = present;
    return finding;
}

// 2024-03-01T08:00:00Z
constexpr long long kFixedEpochSeconds = 1709280000;

struct FixedClock {
    std::shared_ptr<std::chrono::system_clock::time_point> now =
        std::make_shared<std::chrono::system_clock::time_point>(std::chrono::seconds(kFixedEpochSeconds));

    clinfuse::AuditLedger::Clock as_clock() const {
        auto shared = now;
        return [shared] { return *shared; };
    }
};

struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& label) {
        static int counter = 0;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("clinfuse_" + label + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

clinfuse::AuditConfig audit_config(const TempDir& dir) {
    clinfuse::AuditConfig config;
    config.directory = dir.path.string();
    return config;
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream file(path, std::ios::trunc);
    for (const auto& line : lines) {
        file << line << "\n";
    }
}

void test_report_helpers() {
    auto report = make_report("alpha", {{"Beta", 0.5}, {"Alpha", 0.5}, {"Gamma", 0.1}}, 0.6);
    report.alerts = {"Incomplete data: no ECG provided"};
    report.findings = {make_finding("Consolidation", clinfuse::Severity::kCritical),
                       make_finding("Cough", clinfuse::Severity::kLow)};
    auto top = report.top_diagnosis();
    expect_true(top.has_value() && top->first == "Alpha", "top diagnosis ties resolve by name");
    expect_true(report.has_incomplete_data_flag(), "incomplete data flag detected");
    expect_true(report.critical_findings().size() == 1, "critical findings filtered");
    expect_true(report.clinical_text().find("consolidation") != std::string::npos, "clinical text lower-cased");
    expect_true(clinfuse::severity_from_string("HIGH") == clinfuse::Severity::kHigh, "severity parse");
    expect_true(clinfuse::severity_from_string("bogus") == clinfuse::Severity::kNormal, "severity default");
    expect_true(clinfuse::evidence_type_from_string("lab") == clinfuse::EvidenceType::kLaboratory, "evidence type");
    expect_true(clinfuse::to_string(clinfuse::EvidenceStrength::kDefinitive) == "definitive", "strength name");
}

void test_report_parser() {
    clinfuse::ReportParser parser;
    const auto payload = nlohmann::json::parse(R"({
        "agent": "radiologist",
        "diagnoses": {"Pneumonia": 0.7, "PE": "yes"},
        "confidence": 1.4,
        "flags": ["INCOMPLETE_DATA"],
        "diagnostic_certainty": "confirmed",
        "findings": [{"name": "Consolidation", "severity": "high",
                      "evidence": [{"type": "imaging", "description": "RLL opacity", "strength": "strong"}]}]
    })");
    auto report = parser.parse("radiologist", payload);
    expect_true(report.parse_status == clinfuse::ParseStatus::kRecovered, "coerced fields tagged recovered");
    expect_near(report.diagnoses["PE"], 1.0, 1e-12, "yes coerces to 1.0");
    expect_near(report.confidence, 1.0, 1e-12, "confidence clamped");
    expect_true(report.is_definitive, "diagnostic_certainty confirmed maps to definitive");
    expect_true(report.alerts.size() == 1, "flags read as alerts");
    expect_true(report.findings.size() == 1 && report.findings[0].severity == clinfuse::Severity::kHigh,
                "finding severity decoded");
    expect_true(report.findings[0].evidence[0].type == clinfuse::EvidenceType::kImaging, "evidence decoded");

    auto text = parser.parse_text("pulmonologist",
                                  "Assessment follows: {\"diagnoses\": {\"COPD\": 0.6}, \"confidence\": 0.7} end.");
    expect_true(text.parse_status == clinfuse::ParseStatus::kOk, "embedded payload parsed");
    expect_near(text.diagnoses["COPD"], 0.6, 1e-12, "embedded diagnosis");

    auto missing = parser.parse_text("cardiologist", "Patient appears stable.");
    expect_true(missing.parse_status == clinfuse::ParseStatus::kParseError, "text without payload is parse error");
    expect_true(missing.diagnoses.empty() && missing.confidence == 0.0, "default report substituted");

    auto broken = parser.parse_text("cardiologist", "{\"diagnoses\": {\"STEMI\": 0.9,}");
    expect_true(broken.parse_status == clinfuse::ParseStatus::kParseError, "malformed JSON is parse error");
    expect_true(!broken.parse_error.empty(), "parse error message kept");

    auto wrong_shape = parser.parse("pathologist", nlohmann::json::parse(R"({"diagnoses": [0.2, 0.3]})"));
    expect_true(wrong_shape.parse_status == clinfuse::ParseStatus::kParseError, "non-object diagnoses rejected");

    const auto listed = nlohmann::json::parse(R"([
        {"agent": "cardiologist", "diagnoses": {"NSTEMI": 0.5}, "confidence": 0.6},
        {"agent": "pathologist", "hypotheses": [{"diagnosis": "Sepsis", "probability": 0.4}], "confidence": 0.5}
    ])");
    auto reports = parser.parse_all(listed);
    expect_true(reports.size() == 2 && reports.count("cardiologist") == 1, "list form keyed by agent");
    expect_near(reports["pathologist"].diagnoses["Sepsis"], 0.4, 1e-12, "hypotheses backfill diagnoses");
}

void test_report_parser_tolerance() {
    clinfuse::ReportParser parser;
    const auto reports = parser.parse_all(nlohmann::json::parse(R"({
        "radiologist": {"is_definitive": true, "diagnoses": {"Pulmonary Embolism": 0.98}, "confidence": 0.95,
                        "findings": [{"name": "Filling defect", "severity": null}, 42,
                                     {"name": null, "present": "no",
                                      "evidence": [{"description": "Saddle embolus", "is_abnormal": null,
                                                    "strength": 3}, [1, 2]]}],
                        "hypotheses": ["not an object", {"diagnosis": "Pulmonary Embolism", "urgency": null}]},
        "cardiologist": {"diagnoses": {"Pneumonia": 0.6}, "confidence": 0.7}
    })"));
    const auto& radiologist = reports.at("radiologist");
    expect_true(radiologist.parse_status == clinfuse::ParseStatus::kRecovered, "null fields recovered locally");
    expect_true(radiologist.is_definitive, "definitive flag survives a null field");
    expect_true(radiologist.diagnoses.size() == 1, "diagnoses survive a null field");
    expect_true(radiologist.findings.size() == 2, "non-object finding skipped");
    expect_true(radiologist.findings[0].severity == clinfuse::Severity::kModerate, "null severity defaults");
    expect_true(radiologist.findings[1].name == "Unknown" && !radiologist.findings[1].present,
                "null name and string flag coerced");
    expect_true(radiologist.findings[1].evidence.size() == 1, "non-object evidence skipped");
    expect_true(!radiologist.findings[1].evidence[0].is_abnormal &&
                    radiologist.findings[1].evidence[0].strength == clinfuse::EvidenceStrength::kModerate,
                "evidence fields default");
    expect_true(radiologist.hypotheses.size() == 1 &&
                    radiologist.hypotheses[0].urgency == clinfuse::Severity::kModerate,
                "non-object hypothesis skipped");

    clinfuse::ConsensusEngine engine{clinfuse::ConsensusConfig{}};
    auto consensus = engine.evaluate(reports);
    expect_true(consensus.diagnosis == "Pulmonary Embolism", "definitive report still drives consensus");
    clinfuse::SafetyEvaluator safety{clinfuse::SafetyConfig{}};
    auto assessment = safety.evaluate(reports);
    const bool pe_alert = std::any_of(assessment.alerts.begin(), assessment.alerts.end(),
                                      [](const clinfuse::CriticalAlert& alert) {
                                          return alert.condition == "Pulmonary Embolism";
                                      });
    expect_true(pe_alert, "critical alert raised from recovered report");

    auto leaky = parser.parse_text(
        "radiologist",
        "{\"explanation\": \"Jane Roe MRN 448812 presents with chest pain\tand dyspnea\", \"confidence\": 0.9}");
    expect_true(leaky.parse_status == clinfuse::ParseStatus::kParseError, "unescaped control character rejected");
    expect_true(leaky.parse_error.find("448812") == std::string::npos &&
                    leaky.parse_error.find("Jane Roe") == std::string::npos,
                "parse error does not quote analyzer text");
    expect_true(leaky.parse_error.find("json error 101") != std::string::npos, "parse error keeps error id");

    const auto listed = parser.parse_all(nlohmann::json::parse(R"([
        {"agent": "radiologist", "diagnoses": {"Pneumonia": 0.6}, "confidence": 0.6},
        {"agent": "radiologist", "diagnoses": {"Pulmonary Embolism": 0.8}, "confidence": 0.8}
    ])"));
    expect_true(listed.size() == 2 && listed.count("radiologist#2") == 1, "duplicate agent renamed");
    expect_near(listed.at("radiologist#2").diagnoses.at("Pulmonary Embolism"), 0.8, 1e-12,
                "duplicate agent diagnoses kept");
    expect_true(listed.at("radiologist#2").analyzer == "radiologist#2", "renamed report carries its key");
}

void test_normalizer() {
    clinfuse::DiagnosisNormalizer normalizer;
    expect_true(normalizer.normalize("NSTEMI") == "Non-ST-Elevation Myocardial Infarction", "nstemi alias");
    expect_true(normalizer.normalize("Acute STEMI") == "ST-Elevation Myocardial Infarction", "stemi alias");
    expect_true(normalizer.normalize("AFib") == "Atrial Fibrillation", "afib alias");
    expect_true(normalizer.normalize("PE") == "Pulmonary Embolism", "pe exact alias");
    expect_true(normalizer.normalize("Peptic ulcer") == "Peptic ulcer", "exact alias does not match prefix");
    expect_true(normalizer.key("  Sepsis ") == "sepsis", "unmatched key lower-cased");
    expect_true(normalizer.same("Sepsis", "SEPSIS"), "case-insensitive merge");
    expect_true(normalizer.same("CHF exacerbation", "Acute Decompensated Heart Failure"), "heart failure alias");
    expect_true(normalizer.normalize("Acute myocardial infarction") == "Myocardial Infarction", "unqualified mi");
    expect_true(normalizer.normalize("ST-elevation myocardial infarction") == "ST-Elevation Myocardial Infarction",
                "st qualified mi stays stemi");
}

void test_definitive_override() {
    clinfuse::ConsensusEngine engine;
    clinfuse::ReportSet reports;
    reports["A"] = make_report("A", {{"PE", 0.98}}, 0.9, true);
    reports["B"] = make_report("B", {{"PE", 0.25}}, 0.5);
    reports["C"] = make_report("C", {{"PE", 0.33}}, 0.6);
    auto result = engine.evaluate(reports);
    expect_true(result.diagnosis == "PE", "definitive label kept");
    expect_true(result.probability >= 0.95, "definitive probability floor");
    expect_true(result.confidence >= 0.95, "definitive confidence floor");
    expect_true(result.certainty == clinfuse::DiagnosticCertainty::kConfirmed, "definitive certainty confirmed");
    expect_near(result.agreement_score, 1.0, 1e-12, "definitive agreement forced");
    expect_true(result.differential.empty(), "definitive has no differential");
    expect_true(result.supporting_analyzers.size() == 2 && contains(result.supporting_analyzers, "C"),
                "agreeing analyzers listed as support");
    expect_true(result.urgency == clinfuse::UrgencyLevel::kCritical, "confirmed embolism is critical");
}

void test_weighted_average() {
    clinfuse::ConsensusEngine engine;
    clinfuse::ReportSet reports;
    reports["alpha"] = make_report("alpha", {{"Pneumonia", 0.6}}, 0.8);
    reports["beta"] = make_report("beta", {{"Pneumonia", 0.5}}, 0.6);
    auto result = engine.evaluate(reports);
    expect_true(result.diagnosis == "Community-Acquired Pneumonia", "pneumonia canonical label");
    expect_true(result.probability > 0.4 && result.probability < 0.7, "merged probability in range");
    expect_near(result.ranking.front().weighted_mean, 0.55, 1e-12, "weighted mean before boost");
    expect_near(result.agreement_score, 0.9, 1e-12, "agreement from population deviation");
    expect_near(result.probability, 0.55 * 1.18, 1e-12, "agreement boost applied");
    expect_near(result.confidence, 0.76, 1e-12, "confidence blends mean confidence and agreement");
    expect_true(result.certainty == clinfuse::DiagnosticCertainty::kPossible, "certainty possible");
}

void test_condition_weights() {
    clinfuse::ConsensusEngine engine;
    expect_near(engine.weight_for("Community-Acquired Pneumonia", "radiologist"), 1.3, 1e-12, "condition weight");
    expect_near(engine.weight_for("Sepsis", "pathologist"), 0.8, 1e-12, "base weight fallback");
    expect_near(engine.weight_for("Sepsis", "dermatologist"), 1.0, 1e-12, "unit weight fallback");

    clinfuse::ReportSet reports;
    reports["radiologist"] = make_report("radiologist", {{"Pneumonia", 0.8}}, 0.7);
    reports["cardiologist"] = make_report("cardiologist", {{"Pneumonia", 0.2}}, 0.7);
    auto result = engine.evaluate(reports);
    expect_near(result.probability, (0.8 * 1.3 + 0.2 * 0.5) / 1.8, 1e-12, "weighted mean without boost");
    expect_near(result.agreement_score, 0.4, 1e-12, "agreement with spread");
    expect_true(result.supporting_analyzers.size() == 1, "only one supporting analyzer");
}

void test_single_source_and_cap() {
    clinfuse::ConsensusEngine engine;
    clinfuse::ReportSet reports;
    reports["alpha"] = make_report("alpha", {{"Sepsis", 0.99}}, 0.9);
    auto result = engine.evaluate(reports);
    expect_near(result.probability, 0.95, 1e-12, "probability capped");
    expect_near(result.agreement_score, 0.5, 1e-12, "single analyzer agreement");
    expect_near(result.confidence, 0.78, 1e-12, "single analyzer confidence");
    expect_true(result.urgency == clinfuse::UrgencyLevel::kModerate, "no urgency keywords");

    clinfuse::ReportSet weak;
    weak["alpha"] = make_report("alpha", {{"Sepsis", 0.2}}, 0.0);
    weak["beta"] = make_report("beta", {{"Sepsis", 0.9}}, 0.0);
    auto floor = engine.evaluate(weak);
    expect_near(floor.confidence, 0.1, 1e-12, "confidence floor");
}

void test_differential_and_benign() {
    clinfuse::ConsensusEngine engine;
    clinfuse::ReportSet reports;
    reports["alpha"] = make_report("alpha",
                                   {{"Normal Sinus Rhythm", 0.9},
                                    {"Sepsis", 0.5},
                                    {"Pneumonia", 0.4},
                                    {"Asthma", 0.2},
                                    {"Flu", 0.16},
                                    {"Cold", 0.1}},
                                   0.5);
    reports["alpha"].alerts = {"Possible pleural effusion"};
    auto result = engine.evaluate(reports);
    expect_true(result.diagnosis == "Sepsis", "benign label never chosen over a finding");
    expect_true(result.differential.size() == 3, "differential capped");
    expect_true(result.differential.front().diagnosis == "Community-Acquired Pneumonia", "differential ranked");
    expect_true(result.differential.back().diagnosis == "Flu", "differential threshold");
    expect_true(result.alerts.size() == 1 && result.alerts[0] == "[alpha] Possible pleural effusion",
                "alerts prefixed with analyzer");
    expect_true(result.urgency == clinfuse::UrgencyLevel::kHigh, "effusion alert raises urgency");
}

void test_determinism() {
    clinfuse::ReportParser parser;
    const auto forward = nlohmann::json::parse(R"([
        {"agent": "radiologist", "diagnoses": {"Pneumonia": 0.7, "PE": 0.2}, "confidence": 0.8},
        {"agent": "cardiologist", "diagnoses": {"Pneumonia": 0.4, "AFib": 0.35}, "confidence": 0.6},
        {"agent": "pathologist", "diagnoses": {"pneumonia": 0.55, "Atrial Fibrillation": 0.3}, "confidence": 0.7}
    ])");
    nlohmann::json reversed = nlohmann::json::array();
    for (auto it = forward.rbegin(); it != forward.rend(); ++it) {
        reversed.push_back(*it);
    }
    clinfuse::ConsensusEngine engine;
    auto first = engine.evaluate(parser.parse_all(forward));
    auto second = engine.evaluate(parser.parse_all(reversed));
    expect_true(first.diagnosis == second.diagnosis, "shuffled input same label");
    expect_true(first.probability == second.probability, "shuffled input identical probability");
    expect_true(first.confidence == second.confidence, "shuffled input identical confidence");
    expect_true(first.ranking.size() == second.ranking.size(), "shuffled input same ranking size");
    bool identical = true;
    for (size_t i = 0; i < first.ranking.size() && i < second.ranking.size(); ++i) {
        identical = identical && first.ranking[i].diagnosis == second.ranking[i].diagnosis &&
                    first.ranking[i].probability == second.ranking[i].probability;
    }
    expect_true(identical, "shuffled input identical ranking");

    auto afib = std::find_if(first.ranking.begin(), first.ranking.end(), [](const clinfuse::RankedDiagnosis& entry) {
        return entry.diagnosis == "Atrial Fibrillation";
    });
    expect_true(afib != first.ranking.end() && afib->analyzer_probabilities.size() == 2, "aliases merged");

    clinfuse::ReportSet spelled;
    spelled["alpha"] = make_report("alpha", {{"sepsis", 0.6}}, 0.5);
    spelled["beta"] = make_report("beta", {{"Sepsis", 0.5}}, 0.5);
    expect_true(engine.evaluate(spelled).diagnosis == "sepsis", "first spelling in analyzer order kept");
}

void test_empty_input() {
    clinfuse::ConsensusEngine engine;
    auto consensus = engine.evaluate({});
    expect_near(consensus.confidence, 0.0, 1e-12, "empty input zero confidence");
    expect_true(consensus.diagnosis == clinfuse::kNoDiagnosisLabel, "empty input no diagnosis label");
    expect_true(consensus.certainty == clinfuse::DiagnosticCertainty::kUncertain, "empty input uncertain");

    clinfuse::SafetyEvaluator safety;
    auto assessment = safety.evaluate({});
    expect_true(assessment.tier == clinfuse::RiskTier::kHigh, "empty input high risk");
    expect_true(assessment.review.required, "empty input needs review");
    expect_true(contains(assessment.flags, "NO_DATA_PROVIDED"), "empty input flag");
    expect_true(assessment.calibration.reliability == "unknown", "empty input reliability unknown");

    clinfuse::ExplainabilityCompiler explainer;
    auto explanation = explainer.compile({}, consensus);
    expect_true(explanation.one_line == clinfuse::kNoDiagnosisLabel, "empty explanation summary");
    expect_true(explanation.reasoning_chain.empty(), "empty reasoning chain");
}

void test_term_matching() {
    expect_true(clinfuse::contains_term("ct shows pe in right lower lobe", "pe"), "short keyword matches word");
    expect_true(!clinfuse::contains_term("pericardial effusion, type 2 diabetes", "pe"), "short keyword in word");
    expect_true(clinfuse::contains_term("no evidence of pulmonary embolism", "pulmonary embolism"),
                "negation ignored when disabled");
    expect_true(!clinfuse::contains_term("no evidence of pulmonary embolism", "pulmonary embolism", 30),
                "negation suppresses within window");
    expect_true(clinfuse::contains_term("lactate >4 despite fluids", "lactate >4"), "keyword with symbols");
}

void test_critical_alerts() {
    clinfuse::SafetyEvaluator safety;
    clinfuse::ReportSet reports;
    reports["cardiologist"] = make_report("cardiologist", {{"STEMI", 0.85}}, 0.8);
    reports["cardiologist"].primary_impression = "Acute inferior STEMI with ST elevation in II, III, aVF";
    reports["radiologist"] = make_report("radiologist", {{"Pneumonia", 0.3}}, 0.7);
    reports["radiologist"].explanation = "Pericardial fat pad, no consolidation. Type of study: portable.";
    auto assessment = safety.evaluate(reports);
    expect_true(assessment.alerts.size() == 1, "one alert per condition");
    expect_true(assessment.alerts[0].condition == "STEMI", "stemi detected");
    expect_true(assessment.alerts[0].analyzers.size() == 1, "alert attributes analyzer");
    expect_true(assessment.tier == clinfuse::RiskTier::kCritical, "time critical alert tier");
    expect_true(assessment.flags.front() == "CRITICAL: Immediate clinical attention required", "critical flag");
    expect_true(contains(assessment.flags,
                         "CRITICAL: STEMI - IMMEDIATE cardiology consult, cath lab activation if confirmed"),
                "condition flag");
    expect_true(contains(assessment.contraindications, "thrombolytics contraindicated if aortic dissection suspected"),
                "contraindication attached");
    expect_true(assessment.review.required, "critical alert needs review");
    expect_true(contains(assessment.review.reasons, "Critical conditions detected: STEMI"), "review reason recorded");
}

void test_contradictions() {
    clinfuse::SafetyEvaluator safety;
    clinfuse::ReportSet reports;
    reports["alpha"] = make_report("alpha", {{"Pneumonia", 0.9}}, 0.8);
    reports["beta"] = make_report("beta", {{"Pneumonia", 0.1}}, 0.8);
    auto single = safety.evaluate(reports);
    expect_true(single.contradictions.size() == 1, "disagreement detected");
    expect_true(single.contradictions[0].diagnosis == "Community-Acquired Pneumonia", "contradiction diagnosis");
    expect_near(single.contradictions[0].spread, 0.8, 1e-9, "contradiction spread");
    expect_true(single.tier == clinfuse::RiskTier::kLow, "single contradiction stays low");

    reports["alpha"].diagnoses["Sepsis"] = 0.8;
    reports["beta"].diagnoses["Sepsis"] = 0.2;
    auto twice = safety.evaluate(reports);
    expect_true(twice.contradictions.size() == 2, "both contradictions");
    expect_true(twice.tier == clinfuse::RiskTier::kModerate, "two contradictions moderate");
    expect_true(twice.review.required &&
                    contains(twice.review.reasons, "Significant disagreement between specialist analyzers"),
                "disagreement review reason");

    clinfuse::ReportSet quiet;
    quiet["alpha"] = make_report("alpha", {{"Asthma", 0.25}}, 0.8);
    quiet["beta"] = make_report("beta", {{"Asthma", 0.05}}, 0.8);
    expect_true(safety.evaluate(quiet).contradictions.empty(), "insignificant diagnoses ignored");
}

void test_calibration_and_missing_data() {
    clinfuse::SafetyEvaluator safety;
    clinfuse::ReportSet reports;
    reports["alpha"] = make_report("alpha", {{"Asthma", 0.5}}, 0.25);
    reports["beta"] = make_report("beta", {{"Asthma", 0.5}}, 0.75);
    reports["alpha"].alerts = {"INCOMPLETE_DATA: spirometry missing"};
    reports["beta"].alerts = {"Incomplete history"};
    auto assessment = safety.evaluate(reports);
    expect_near(assessment.calibration.average_confidence, 0.5, 1e-12, "average confidence");
    expect_true(assessment.calibration.reliability == "moderate", "moderate reliability");
    expect_true(assessment.calibration.low_confidence_analyzers == std::vector<std::string>{"alpha"},
                "low confidence analyzers");
    expect_true(assessment.missing_data_analyzers.size() == 2, "missing data recorded");
    expect_true(contains(assessment.review.reasons, "Insufficient data for multiple analyzers"),
                "missing data review reason");

    clinfuse::ReportSet low;
    low["alpha"] = make_report("alpha", {{"Asthma", 0.5}}, 0.25);
    low["gamma"] = clinfuse::default_report("gamma", "no structured payload");
    auto weak = safety.evaluate(low);
    expect_true(weak.calibration.reliability == "low", "low reliability");
    expect_true(weak.tier == clinfuse::RiskTier::kModerate, "low reliability moderate tier");
    expect_true(contains(weak.flags, "PARSE_ERROR: gamma"), "parse error flagged");
}

void test_explainability_definitive() {
    clinfuse::ReportSet reports;
    reports["radiologist"] = make_report("radiologist", {{"Pulmonary Embolism", 0.97}}, 0.95, true);
    reports["radiologist"].findings = {make_finding("Filling defect", clinfuse::Severity::kCritical)};
    reports["cardiologist"] = make_report("cardiologist", {{"Pulmonary Embolism", 0.4}, {"NSTEMI", 0.3}}, 0.6);
    reports["cardiologist"].findings = {make_finding("Tachycardia", clinfuse::Severity::kHigh),
                                        make_finding("ST elevation", clinfuse::Severity::kHigh, false)};
    clinfuse::DiagnosticHypothesis hypothesis;
    hypothesis.diagnosis = "Pulmonary Embolism";
    clinfuse::Evidence opposing;
    opposing.type = clinfuse::EvidenceType::kLaboratory;
    opposing.description = "Normal troponin";
    hypothesis.opposing_evidence.push_back(opposing);
    reports["cardiologist"].hypotheses.push_back(hypothesis);
    reports["pathologist"] = make_report("pathologist", {{"Pneumonia", 0.2}}, 0.5);
    reports["pathologist"].findings = {make_finding("Mild leukocytosis", clinfuse::Severity::kLow)};

    clinfuse::ConsensusEngine engine;
    clinfuse::ExplainabilityCompiler explainer;
    auto consensus = engine.evaluate(reports);
    auto explanation = explainer.compile(reports, consensus);

    const auto& attributions = explanation.attributions;
    expect_true(attributions.size() == 5, "attribution per finding plus opposing evidence");
    expect_true(attributions.front().contribution == clinfuse::ContributionTier::kDecisive &&
                    attributions.front().finding == "Filling defect",
                "decisive finding first");
    expect_near(attributions[1].weight, 0.6, 1e-12, "high severity weight");
    expect_near(attributions[2].weight, 0.2, 1e-12, "low severity weight");
    expect_true(attributions[3].contribution == clinfuse::ContributionTier::kNeutral, "absent finding neutral");
    expect_true(attributions.back().contribution == clinfuse::ContributionTier::kOpposing, "opposing evidence");

    const auto& chain = explanation.reasoning_chain;
    expect_true(chain.size() == 3, "one step per analyzer with findings");
    expect_true(chain[0].analyzer == "radiologist" && chain[0].action == "confirmed", "workflow order");
    expect_near(chain[0].confidence_delta, 0.98, 1e-12, "confirmed delta");
    expect_true(chain[1].action == "supported", "supporting analyzer");
    expect_near(chain[1].confidence_delta, 0.15, 1e-12, "supported delta capped");
    expect_near(chain[1].running_confidence, 0.98, 1e-12, "running confidence capped");
    expect_true(chain[2].conclusion == "Findings noted: Mild leukocytosis", "evaluated conclusion");
    expect_true(chain[0].description == "Radiologist analyzed 1 finding(s)", "step description");

    expect_near(explanation.decomposition.base_confidence, 0.95, 1e-12, "definitive base");
    expect_true(explanation.one_line == "Pulmonary Embolism CONFIRMED by Filling defect", "one line summary");
    expect_true(explanation.detailed.find("Diagnosis: Pulmonary Embolism (CONFIRMED)") == 0, "detailed header");
}

void test_explainability_fused() {
    clinfuse::ReportSet reports;
    reports["alpha"] = make_report("alpha", {{"Pneumonia", 0.6}}, 0.8);
    reports["beta"] = make_report("beta", {{"Pneumonia", 0.5}}, 0.6);
    clinfuse::ConsensusEngine engine;
    clinfuse::ExplainabilityCompiler explainer;
    auto consensus = engine.evaluate(reports);
    auto decomposition = explainer.decompose(reports, consensus.diagnosis, consensus.confidence, false);
    expect_near(decomposition.base_confidence, 0.7, 1e-9, "base is mean confidence");
    expect_near(decomposition.agreement_boost, 0.05, 1e-9, "agreement boost per extra supporter");
    expect_near(decomposition.evidence_boost, 0.01, 1e-9, "evidence boost is the remainder");
    expect_true(decomposition.penalty_factors.size() == 1, "fewer than three analyzers penalised");

    clinfuse::ReportSet wide;
    wide["alpha"] = make_report("alpha",
                                {{"Sepsis", 0.5}, {"Pneumonia", 0.4}, {"Asthma", 0.2}, {"Flu", 0.16}}, 0.5);
    auto fused = engine.evaluate(wide);
    auto counterfactuals = explainer.counterfactuals(fused.diagnosis, fused.differential);
    expect_true(counterfactuals.size() == 3, "counterfactual per differential");
    expect_true(counterfactuals[0].missing_evidence.front() == "Consolidation on imaging", "table lookup");
    expect_near(counterfactuals[0].probability_if_changed, 0.4, 1e-12, "alternative probability");
    expect_true(counterfactuals[1].missing_evidence == std::vector<std::string>{"Specific diagnostic criteria"},
                "generic placeholder");
}

void test_config() {
    std::istringstream input(R"(
[logging]
level = "ERROR"

[audit]
directory = "/var/lib/clinfuse/audit"
hash_hex_length = 64

[consensus]
support_threshold = 0.25
benign_labels = ["No Finding"]

[consensus.base_weights]
radiologist = 2.0

[condition_weights."Sepsis"]
pathologist = 1.7

[diagnosis_aliases."Sepsis"]
contains = ["sepsis", "septic"]

[critical_condition."Hyperkalemia"]
keywords = ["hyperkalemia", "peaked t waves"]
action = "Calcium gluconate, repeat potassium"
time_critical = false

[safety]
negation_window = 30 # characters
)");
    auto settings = clinfuse::Settings::from_stream(input);
    expect_true(settings.logging.level == "ERROR", "logging level");
    expect_true(settings.audit.hash_hex_length == 64, "hash length");
    expect_true(settings.audit.directory == "/var/lib/clinfuse/audit", "audit directory");
    expect_near(settings.consensus.support_threshold, 0.25, 1e-12, "support threshold");
    expect_true(settings.consensus.base_weights.size() == 1, "base weight table replaced");
    expect_true(settings.consensus.condition_weights.size() == 1, "condition table replaced");
    expect_true(settings.consensus.aliases.size() == 1, "alias table replaced");
    expect_true(settings.safety.critical_conditions.size() == 1, "critical table replaced");
    expect_true(!settings.safety.critical_conditions[0].time_critical, "time critical flag");
    expect_true(settings.safety.negation_window == 30, "negation window");
    expect_true(settings.explain.counterfactuals.size() == 4, "untouched tables keep defaults");

    clinfuse::ConsensusEngine engine(settings.consensus);
    expect_near(engine.weight_for("Sepsis", "pathologist"), 1.7, 1e-12, "configured condition weight");
    expect_near(engine.weight_for("Sepsis", "radiologist"), 2.0, 1e-12, "configured base weight");
    expect_true(engine.normalizer().normalize("Septic shock") == "Sepsis", "configured alias");

    clinfuse::SafetyEvaluator safety(settings.safety);
    clinfuse::ReportSet reports;
    reports["pathologist"] = make_report("pathologist", {{"Hyperkalemia", 0.7}}, 0.8);
    auto assessment = safety.evaluate(reports);
    expect_true(assessment.alerts.size() == 1 && assessment.tier == clinfuse::RiskTier::kHigh,
                "non time critical alert is high");

    bool threw = false;
    try {
        std::istringstream bad("[audit]\nhash_hex_length = 4\n");
        clinfuse::Settings::from_stream(bad);
    } catch (const clinfuse::ConfigError&) {
        threw = true;
    }
    expect_true(threw, "hash length validated");

    threw = false;
    try {
        std::istringstream bad("[logging]\njson = maybe\n");
        clinfuse::Settings::from_stream(bad);
    } catch (const clinfuse::ConfigError&) {
        threw = true;
    }
    expect_true(threw, "boolean validated");
}

void test_example_config_matches_defaults() {
    const clinfuse::Settings defaults;
    const auto example = clinfuse::Settings::from_toml(CLINFUSE_EXAMPLE_CONFIG);
    const auto& lhs = example.consensus;
    const auto& rhs = defaults.consensus;
    expect_true(lhs.base_weights == rhs.base_weights, "example base weights");
    expect_true(lhs.condition_weights == rhs.condition_weights, "example condition weights");
    expect_true(lhs.benign_labels == rhs.benign_labels, "example benign labels");
    expect_true(lhs.critical_urgency_keywords == rhs.critical_urgency_keywords, "example critical keywords");
    expect_true(lhs.high_urgency_keywords == rhs.high_urgency_keywords, "example high keywords");
    bool aliases_match = lhs.aliases.size() == rhs.aliases.size();
    for (size_t i = 0; aliases_match && i < lhs.aliases.size(); ++i) {
        aliases_match = lhs.aliases[i].canonical == rhs.aliases[i].canonical &&
                        lhs.aliases[i].contains == rhs.aliases[i].contains &&
                        lhs.aliases[i].exact == rhs.aliases[i].exact &&
                        lhs.aliases[i].excludes == rhs.aliases[i].excludes;
    }
    expect_true(aliases_match, "example alias rules");

    const auto& conditions = example.safety.critical_conditions;
    bool conditions_match = conditions.size() == defaults.safety.critical_conditions.size();
    for (size_t i = 0; conditions_match && i < conditions.size(); ++i) {
        const auto& expected = defaults.safety.critical_conditions[i];
        conditions_match = conditions[i].name == expected.name && conditions[i].keywords == expected.keywords &&
                           conditions[i].action == expected.action &&
                           conditions[i].time_critical == expected.time_critical;
    }
    expect_true(conditions_match, "example critical conditions");
    expect_true(example.safety.contraindications == defaults.safety.contraindications, "example contraindications");

    expect_true(example.explain.workflow_order == defaults.explain.workflow_order, "example workflow order");
    bool counterfactuals_match = example.explain.counterfactuals.size() == defaults.explain.counterfactuals.size();
    for (const auto& [name, entry] : defaults.explain.counterfactuals) {
        auto it = example.explain.counterfactuals.find(name);
        counterfactuals_match = counterfactuals_match && it != example.explain.counterfactuals.end() &&
                                it->second.required == entry.required &&
                                it->second.contradicts == entry.contradicts;
    }
    expect_true(counterfactuals_match, "example counterfactuals");
}

void test_logging() {
    TempDir dir("logging");
    const auto path = (dir.path / "clinfuse.log").string();
    clinfuse::LoggingConfig config;
    config.level = "info";
    config.log_file = path;
    clinfuse::configure_logging(config);

    auto logger = clinfuse::get_logger("LoggingTest").with({{"case_id", "CASE-LOG"}});
    logger.debug("suppressed_event");
    logger.info("case_logged", {{"note", "quote \" inside"}});

    clinfuse::LoggingConfig quiet;
    quiet.level = "ERROR";
    clinfuse::configure_logging(quiet);

    auto lines = read_lines(path);
    expect_true(lines.size() == 1, "debug event filtered by level");
    if (!lines.empty()) {
        const auto record = nlohmann::json::parse(lines[0]);
        expect_true(record["event"] == "case_logged", "event key logged");
        expect_true(record["logger"] == "LoggingTest", "logger name logged");
        expect_true(record["case_id"] == "CASE-LOG", "bound context logged");
        expect_true(record["note"] == "quote \" inside", "field escaped");
    }

    bool threw = false;
    try {
        clinfuse::log_level_from_string("verbose");
    } catch (const clinfuse::ConfigError&) {
        threw = true;
    }
    expect_true(threw, "unknown log level rejected");
    expect_true(clinfuse::log_level_from_string("warning") == clinfuse::LogLevel::kWarn, "warning alias");
}

void test_hashing() {
    expect_true(clinfuse::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                "sha256 known vector");
    expect_true(clinfuse::sha256_hex("abc", 16) == "ba7816bf8f01cfea", "sha256 truncation");
}

void test_ledger_chain() {
    TempDir dir("chain");
    FixedClock clock;
    clinfuse::AuditLedger ledger(audit_config(dir), clock.as_clock());

    const std::string long_text(150, 'x');
    auto first = ledger.log_diagnosis("CASE-1", {{"clinical_text", long_text}}, {{"diagnosis", "Sepsis"}});
    auto second = ledger.log_diagnosis("CASE-2", {{"clinical_text", "short"}}, {{"diagnosis", "Asthma"}});
    auto third = ledger.log_diagnosis("CASE-1", {{"clinical_text", "again"}}, {{"diagnosis", "Sepsis"}});

    expect_true(!first.previous_hash.has_value(), "first entry has no predecessor");
    expect_true(second.previous_hash == first.entry_hash, "second entry linked");
    expect_true(third.previous_hash == second.entry_hash, "third entry linked");
    expect_true(ledger.head() == third.entry_hash, "head advanced");
    expect_true(first.entry_hash.size() == 16, "entry hash truncated");
    expect_true(first.input_hash.has_value() && first.input_hash->size() == 32, "input hash length");
    expect_true(first.input_preview["clinical_text"].get<std::string>().size() == 103, "preview truncated");
    expect_true(first.audit_id.rfind("AUDIT-", 0) == 0 && first.audit_id.size() == 18, "audit id format");
    expect_true(first.timestamp == "2024-03-01T08:00:00.000000Z", "timestamp format");
    expect_true(second.timestamp == "2024-03-01T08:00:00.000001Z", "timestamps strictly increase");

    auto lines = read_lines(ledger.current_segment());
    expect_true(lines.size() == 3, "one line per entry");
    expect_true(lines[0].find(long_text) == std::string::npos, "raw input never stored");
    expect_true(fs::path(ledger.current_segment()).filename() == "audit_20240301.jsonl", "segment name");

    auto result = ledger.verify();
    expect_true(result.valid && result.entries_checked == 3, "intact chain verifies");

    auto error = ledger.log_error("CASE-2", "report_parse_error", "bad payload", {{"analyzer", "gamma"}});
    expect_true(error.audit_id.rfind("ERROR-", 0) == 0, "error id prefix");
    expect_true(error.event_type == clinfuse::EventType::kError, "error event type");

    auto case_entries = ledger.entries_for_case("CASE-1");
    expect_true(case_entries.size() == 2 && case_entries[0].audit_id == first.audit_id, "entries for case");

    auto everything = ledger.export_range(std::nullopt, std::nullopt);
    expect_true(everything["entries_count"].get<size_t>() == 4, "export all");
    auto same_day = ledger.export_range(std::nullopt, std::string("2024-03-01"));
    expect_true(same_day["entries_count"].get<size_t>() == 4, "date bound covers the day");
    auto later = ledger.export_range(std::string("2024-03-02"), std::nullopt);
    expect_true(later["entries_count"].get<size_t>() == 0, "start bound excludes earlier entries");

    auto path = ledger.export_to_file(std::nullopt, std::nullopt);
    expect_true(fs::exists(path), "export file written");
    expect_true(fs::path(path).filename() == "compliance_export_20240301_080000.json", "export file name");

    clinfuse::AuditLedger reopened(audit_config(dir), clock.as_clock());
    expect_true(reopened.head() == error.entry_hash, "head recovered from segment tail");
    auto next = reopened.log_diagnosis("CASE-3", {{"clinical_text", "more"}}, {{"diagnosis", "Flu"}});
    expect_true(next.previous_hash == error.entry_hash, "chain continues after restart");
    expect_true(reopened.verify().valid, "restarted chain verifies");

    *clock.now += std::chrono::hours(24);
    auto tomorrow = reopened.log_diagnosis("CASE-4", {{"clinical_text", "next day"}}, {{"diagnosis", "Flu"}});
    expect_true(!tomorrow.previous_hash.has_value(), "new segment starts a new chain");
    expect_true(reopened.segments().size() == 2, "segment per day");
    auto all = reopened.verify_all();
    expect_true(all.size() == 2 && all[0].valid && all[1].valid, "all segments verify");
}

void test_ledger_tamper_detection() {
    TempDir dir("tamper");
    FixedClock clock;
    clinfuse::AuditLedger ledger(audit_config(dir), clock.as_clock());
    ledger.log_diagnosis("CASE-1", {{"clinical_text", "a"}}, {{"note", "first-entry"}});
    ledger.log_diagnosis("CASE-2", {{"clinical_text", "b"}}, {{"note", "second-entry"}});
    ledger.log_diagnosis("CASE-3", {{"clinical_text", "c"}}, {{"note", "tamper-target"}});

    const auto segment = ledger.current_segment();
    auto lines = read_lines(segment);
    const auto pos = lines[2].find("tamper-target");
    expect_true(pos != std::string::npos, "payload located");
    lines[2][pos] = 'T';
    write_lines(segment, lines);

    auto result = ledger.verify();
    expect_true(!result.valid, "tampered chain rejected");
    expect_true(result.broken_at_entry.has_value() && *result.broken_at_entry == 2, "tampered entry index");
    expect_true(result.entries_checked == 2, "entries before the break pass");

    lines = read_lines(segment);
    lines[1].replace(lines[1].find("second-entry"), 6, "SECOND");
    write_lines(segment, lines);
    auto earlier = ledger.verify();
    expect_true(earlier.broken_at_entry.has_value() && *earlier.broken_at_entry == 1, "earliest break reported");

    lines = read_lines(segment);
    lines[0] = "{not json";
    write_lines(segment, lines);
    auto garbage = ledger.verify();
    expect_true(garbage.broken_at_entry.has_value() && *garbage.broken_at_entry == 0, "unparseable line is a break");
}

void test_ledger_concurrent_appends() {
    TempDir dir("concurrent");
    clinfuse::AuditLedger ledger(audit_config(dir));
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&ledger, t] {
            for (int i = 0; i < 25; ++i) {
                ledger.log_diagnosis("CASE-T" + std::to_string(t), {{"clinical_text", std::to_string(i)}},
                                     {{"index", i}});
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    size_t total = 0;
    bool valid = true;
    for (const auto& result : ledger.verify_all()) {
        total += result.entries_checked;
        valid = valid && result.valid;
    }
    expect_true(valid, "concurrent appends keep the chain intact");
    expect_true(total == 100, "every concurrent append recorded");
}

clinfuse::Settings quiet_settings(const TempDir& dir) {
    clinfuse::Settings settings;
    settings.logging.level = "ERROR";
    settings.audit.directory = dir.path.string();
    return settings;
}

nlohmann::json sample_case() {
    return nlohmann::json::parse(R"({
        "case_id": "CASE-0001",
        "clinical_text": "58M with crushing chest pain radiating to the left arm for 40 minutes.",
        "reports": {
            "cardiologist": {"diagnoses": {"STEMI": 0.85, "NSTEMI": 0.1}, "confidence": 0.85,
                             "primary_impression": "Inferior ST elevation",
                             "findings": [{"name": "ST elevation II, III, aVF", "severity": "critical"}]},
            "pathologist": "Labs reviewed. {\"diagnoses\": {\"STEMI\": 0.7}, \"confidence\": 0.7, \"findings\": [{\"name\": \"Troponin elevated\", \"severity\": \"high\"}]}",
            "radiologist": "Unable to produce structured output"
        }
    })");
}

void test_pipeline() {
    TempDir dir("pipeline");
    FixedClock clock;
    auto settings = quiet_settings(dir);
    auto pipeline = clinfuse::build_pipeline(settings, clock.as_clock());
    auto bundle = pipeline->diagnose(clinfuse::CaseInput::from_json(sample_case()));

    expect_true(bundle.case_id == "CASE-0001", "case id kept");
    expect_true(bundle.consensus.diagnosis == "ST-Elevation Myocardial Infarction", "pipeline diagnosis");
    expect_true(bundle.safety.tier == clinfuse::RiskTier::kCritical, "pipeline safety tier");
    expect_true(contains(bundle.safety.flags, "PARSE_ERROR: radiologist"), "parse failure surfaced");
    expect_true(bundle.audit_id.has_value() && bundle.audit_id->rfind("AUDIT-", 0) == 0, "decision audited");
    expect_true(bundle.warnings.empty(), "no warnings when ledger healthy");

    auto entries = pipeline->ledger()->entries_for_case("CASE-0001");
    expect_true(entries.size() == 2, "parse error and diagnosis recorded");
    expect_true(entries[0].event_type == clinfuse::EventType::kError, "error entry first");
    expect_true(entries[1].payload["consensus"]["diagnosis"] == "ST-Elevation Myocardial Infarction",
                "decision payload stored");
    expect_true(pipeline->ledger()->verify().valid, "pipeline chain verifies");

    auto serialized = clinfuse::to_json(bundle);
    expect_true(serialized["audit_id"] == *bundle.audit_id, "bundle serializes audit id");
    expect_true(serialized["safety"]["risk_level"] == "critical", "bundle serializes safety");

    auto anonymous = pipeline->diagnose(clinfuse::CaseInput{"", "", nlohmann::json::object()});
    expect_true(anonymous.case_id.rfind("CASE-", 0) == 0 && anonymous.case_id.size() == 13, "generated case id");
    expect_true(anonymous.consensus.diagnosis == clinfuse::kNoDiagnosisLabel, "empty case still decided");

    settings.pipeline.parallel_stages = true;
    auto parallel = clinfuse::build_pipeline(settings, clock.as_clock());
    auto concurrent = parallel->diagnose(clinfuse::CaseInput::from_json(sample_case()));
    expect_true(concurrent.consensus.probability == bundle.consensus.probability, "parallel stages same consensus");
    expect_true(concurrent.safety.tier == bundle.safety.tier, "parallel stages same safety");
    expect_true(concurrent.explanation.one_line == bundle.explanation.one_line, "parallel stages same explanation");
}

void test_pipeline_without_ledger() {
    TempDir dir("blocked");
    const auto blocker = dir.path / "blocker";
    std::ofstream(blocker) << "not a directory";
    auto settings = quiet_settings(dir);
    settings.audit.directory = (blocker / "audit").string();
    auto pipeline = clinfuse::build_pipeline(settings);
    auto bundle = pipeline->diagnose(clinfuse::CaseInput::from_json(sample_case()));
    expect_true(!bundle.audit_id.has_value(), "no audit id without ledger");
    expect_true(!bundle.warnings.empty(), "ledger failure surfaced as warning");
    expect_true(bundle.consensus.diagnosis == "ST-Elevation Myocardial Infarction", "decision still returned");
}

void test_pipeline_ledger_write_failure() {
    TempDir dir("unwritable");
    FixedClock clock;
    auto pipeline = clinfuse::build_pipeline(quiet_settings(dir), clock.as_clock());
    expect_true(pipeline->ledger() != nullptr, "ledger opened");
    fs::create_directories(pipeline->ledger()->current_segment());

    auto bundle = pipeline->diagnose(clinfuse::CaseInput::from_json(sample_case()));
    expect_true(!bundle.audit_id.has_value(), "no audit id when append fails");
    expect_true(bundle.warnings.size() == 1 && bundle.warnings[0].rfind("Audit logging failed", 0) == 0,
                "append failure surfaced as warning");
    expect_true(bundle.consensus.diagnosis == "ST-Elevation Myocardial Infarction", "decision returned");
    expect_true(bundle.safety.tier == clinfuse::RiskTier::kCritical, "safety still assessed");
}

void test_pipeline_error_entry_privacy() {
    TempDir dir("privacy");
    FixedClock clock;
    auto pipeline = clinfuse::build_pipeline(quiet_settings(dir), clock.as_clock());
    nlohmann::json input = {
        {"case_id", "CASE-PRIV"},
        {"reports",
         {{"cardiologist", {{"diagnoses", {{"STEMI", 0.8}}}, {"confidence", 0.8}}},
          {"radiologist",
           "{\"explanation\": \"Jane Roe DOB 1961-04-02 MRN 448812 presents with crushing chest pain\tand "
           "dyspnea\", \"confidence\": 0.9}"}}},
    };
    auto bundle = pipeline->diagnose(clinfuse::CaseInput::from_json(input));
    auto entries = pipeline->ledger()->entries_for_case("CASE-PRIV");
    expect_true(entries.size() == 2 && entries[0].event_type == clinfuse::EventType::kError,
                "parse failure recorded");
    const auto error_entry = entries.empty() ? std::string() : entries[0].payload.dump();
    expect_true(error_entry.find("448812") == std::string::npos && error_entry.find("Jane Roe") == std::string::npos,
                "error entry holds no analyzer text");
    expect_true(bundle.audit_id.has_value(), "decision still audited");
}

}  // namespace

int main() {
    clinfuse::LoggingConfig logging;
    logging.level = "ERROR";
    clinfuse::configure_logging(logging);

    test_report_helpers();
    test_report_parser();
    test_report_parser_tolerance();
    test_normalizer();
    test_definitive_override();
    test_weighted_average();
    test_condition_weights();
    test_single_source_and_cap();
    test_differential_and_benign();
    test_determinism();
    test_empty_input();
    test_term_matching();
    test_critical_alerts();
    test_contradictions();
    test_calibration_and_missing_data();
    test_explainability_definitive();
    test_explainability_fused();
    test_config();
    test_example_config_matches_defaults();
    test_logging();
    test_hashing();
    test_ledger_chain();
    test_ledger_tamper_detection();
    test_ledger_concurrent_appends();
    test_pipeline();
    test_pipeline_without_ledger();
    test_pipeline_ledger_write_failure();
    test_pipeline_error_entry_privacy();

    if (failures > 0) {
        std::cerr << failures << " test(s) failed\n";
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
