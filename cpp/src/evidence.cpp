#include "clinfuse/evidence.hpp"

#include "clinfuse/common.hpp"

namespace clinfuse {

std::string to_string(EvidenceType type) {
    switch (type) {
        case EvidenceType::kImaging:
            return "imaging";
        case EvidenceType::kEcg:
            return "ecg";
        case EvidenceType::kLaboratory:
            return "laboratory";
        case EvidenceType::kSymptom:
            return "symptom";
        case EvidenceType::kVitalSign:
            return "vital_sign";
        case EvidenceType::kPhysicalExam:
            return "physical_exam";
        case EvidenceType::kHistory:
            return "history";
    }
    return "symptom";
}

std::string to_string(EvidenceStrength strength) {
    switch (strength) {
        case EvidenceStrength::kDefinitive:
            return "definitive";
        case EvidenceStrength::kStrong:
            return "strong";
        case EvidenceStrength::kModerate:
            return "moderate";
        case EvidenceStrength::kWeak:
            return "weak";
        case EvidenceStrength::kAbsent:
            return "absent";
    }
    return "moderate";
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::kCritical:
            return "critical";
        case Severity::kHigh:
            return "high";
        case Severity::kModerate:
            return "moderate";
        case Severity::kLow:
            return "low";
        case Severity::kNormal:
            return "normal";
    }
    return "normal";
}

std::string to_string(ParseStatus status) {
    switch (status) {
        case ParseStatus::kOk:
            return "ok";
        case ParseStatus::kRecovered:
            return "recovered";
        case ParseStatus::kParseError:
            return "parse_error";
    }
    return "parse_error";
}

EvidenceType evidence_type_from_string(const std::string& value) {
    const auto key = to_lower(trim(value));
    if (key == "imaging") {
        return EvidenceType::kImaging;
    }
    if (key == "ecg") {
        return EvidenceType::kEcg;
    }
    if (key == "laboratory" || key == "lab") {
        return EvidenceType::kLaboratory;
    }
    if (key == "vital_sign" || key == "vital") {
        return EvidenceType::kVitalSign;
    }
    if (key == "physical_exam" || key == "exam") {
        return EvidenceType::kPhysicalExam;
    }
    if (key == "history") {
        return EvidenceType::kHistory;
    }
    return EvidenceType::kSymptom;
}

EvidenceStrength evidence_strength_from_string(const std::string& value) {
    const auto key = to_lower(trim(value));
    if (key == "definitive") {
        return EvidenceStrength::kDefinitive;
    }
    if (key == "strong") {
        return EvidenceStrength::kStrong;
    }
    if (key == "weak") {
        return EvidenceStrength::kWeak;
    }
    if (key == "absent") {
        return EvidenceStrength::kAbsent;
    }
    return EvidenceStrength::kModerate;
}

Severity severity_from_string(const std::string& value) {
    const auto key = to_lower(trim(value));
    if (key == "critical") {
        return Severity::kCritical;
    }
    if (key == "high") {
        return Severity::kHigh;
    }
    if (key == "moderate") {
        return Severity::kModerate;
    }
    if (key == "low") {
        return Severity::kLow;
    }
    return Severity::kNormal;
}

std::optional<std::pair<std::string, double>> AnalyzerReport::top_diagnosis() const {
    std::optional<std::pair<std::string, double>> best;
    // std::map iterates by name, so a strict comparison keeps the first name on ties.
    for (const auto& [name, probability] : diagnoses) {
        if (!best.has_value() || probability > best->second) {
            best = std::make_pair(name, probability);
        }
    }
    return best;
}

std::vector<Finding> AnalyzerReport::critical_findings() const {
    std::vector<Finding> output;
    for (const auto& finding : findings) {
        if (finding.severity == Severity::kCritical) {
            output.push_back(finding);
        }
    }
    return output;
}

bool AnalyzerReport::has_incomplete_data_flag() const {
    for (const auto& alert : alerts) {
        if (to_upper(alert).find("INCOMPLETE") != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string AnalyzerReport::clinical_text() const {
    std::vector<std::string> parts;
    parts.push_back(primary_impression);
    parts.push_back(explanation);
    for (const auto& [name, probability] : diagnoses) {
        parts.push_back(name);
    }
    for (const auto& finding : findings) {
        parts.push_back(finding.name);
        parts.push_back(finding.clinical_significance);
        for (const auto& item : finding.evidence) {
            parts.push_back(item.description);
        }
    }
    for (const auto& hypothesis : hypotheses) {
        parts.push_back(hypothesis.diagnosis);
        for (const auto& item : hypothesis.supporting_evidence) {
            parts.push_back(item.description);
        }
    }
    parts.insert(parts.end(), alerts.begin(), alerts.end());
    parts.insert(parts.end(), recommendations.begin(), recommendations.end());
    return to_lower(join(parts, "\n"));
}

}  // namespace clinfuse
