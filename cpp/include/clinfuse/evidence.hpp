#ifndef CLINFUSE_EVIDENCE_HPP
#define CLINFUSE_EVIDENCE_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clinfuse {

enum class EvidenceType {
    kImaging,
    kEcg,
    kLaboratory,
    kSymptom,
    kVitalSign,
    kPhysicalExam,
    kHistory,
};

// Ordered from most to least specific.
enum class EvidenceStrength {
    kDefinitive,
    kStrong,
    kModerate,
    kWeak,
    kAbsent,
};

enum class Severity {
    kCritical,
    kHigh,
    kModerate,
    kLow,
    kNormal,
};

// How a report made it through the ingestion boundary.
enum class ParseStatus {
    kOk,
    kRecovered,
    kParseError,
};

std::string to_string(EvidenceType type);
std::string to_string(EvidenceStrength strength);
std::string to_string(Severity severity);
std::string to_string(ParseStatus status);

// Unknown wire strings fall back to kSymptom / kModerate / kNormal.
EvidenceType evidence_type_from_string(const std::string& value);
EvidenceStrength evidence_strength_from_string(const std::string& value);
Severity severity_from_string(const std::string& value);

struct Evidence {
    EvidenceType type = EvidenceType::kSymptom;
    std::string description;
    std::optional<std::string> value;
    std::optional<std::string> normal_range;
    bool is_abnormal = false;
    EvidenceStrength strength = EvidenceStrength::kModerate;
    std::string source;
};

struct Finding {
    std::string name;
    bool present = true;
    std::vector<Evidence> evidence;
    Severity severity = Severity::kNormal;
    std::string clinical_significance;
};

struct DiagnosticHypothesis {
    std::string diagnosis;
    std::optional<std::string> icd10_code;
    double probability = 0.0;
    std::vector<Evidence> supporting_evidence;
    std::vector<Evidence> opposing_evidence;
    std::vector<std::string> required_for_diagnosis;
    std::vector<std::string> criteria_met;
    std::vector<std::string> criteria_not_met;
    std::vector<std::string> differential_diagnoses;
    std::vector<std::string> recommended_workup;
    Severity urgency = Severity::kModerate;
};

struct AnalyzerReport {
    std::string analyzer;
    std::map<std::string, double> diagnoses;
    double confidence = 0.0;
    std::vector<Finding> findings;
    std::vector<DiagnosticHypothesis> hypotheses;
    std::vector<std::string> alerts;
    bool is_definitive = false;
    std::string primary_impression;
    std::string explanation;
    std::vector<std::string> recommendations;
    ParseStatus parse_status = ParseStatus::kOk;
    std::string parse_error;

    // Highest-probability diagnosis; ties resolve to the lexicographically first name.
    std::optional<std::pair<std::string, double>> top_diagnosis() const;
    std::vector<Finding> critical_findings() const;
    bool has_incomplete_data_flag() const;
    // Every free-text field of the report, lower-cased and newline separated.
    std::string clinical_text() const;
};

// Keyed by analyzer name. The ordered map is what keeps downstream
// aggregation independent of the order reports arrived in.
using ReportSet = std::map<std::string, AnalyzerReport>;

}  // namespace clinfuse

#endif  // CLINFUSE_EVIDENCE_HPP
