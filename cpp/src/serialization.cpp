#include "clinfuse/serialization.hpp"

namespace clinfuse {

namespace {

template <typename T>
nlohmann::json array_of(const std::vector<T>& items) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& item : items) {
        output.push_back(to_json(item));
    }
    return output;
}

nlohmann::json optional_string(const std::optional<std::string>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json to_json(const Evidence& evidence) {
    return {
        {"type", to_string(evidence.type)},
        {"description", evidence.description},
        {"value", optional_string(evidence.value)},
        {"normal_range", optional_string(evidence.normal_range)},
        {"is_abnormal", evidence.is_abnormal},
        {"strength", to_string(evidence.strength)},
        {"source", evidence.source},
    };
}

nlohmann::json to_json(const Finding& finding) {
    return {
        {"name", finding.name},
        {"present", finding.present},
        {"evidence", array_of(finding.evidence)},
        {"severity", to_string(finding.severity)},
        {"clinical_significance", finding.clinical_significance},
    };
}

nlohmann::json to_json(const DiagnosticHypothesis& hypothesis) {
    return {
        {"diagnosis", hypothesis.diagnosis},
        {"icd10_code", optional_string(hypothesis.icd10_code)},
        {"probability", hypothesis.probability},
        {"supporting_evidence", array_of(hypothesis.supporting_evidence)},
        {"opposing_evidence", array_of(hypothesis.opposing_evidence)},
        {"required_for_diagnosis", hypothesis.required_for_diagnosis},
        {"criteria_met", hypothesis.criteria_met},
        {"criteria_not_met", hypothesis.criteria_not_met},
        {"differential_diagnoses", hypothesis.differential_diagnoses},
        {"recommended_workup", hypothesis.recommended_workup},
        {"urgency", to_string(hypothesis.urgency)},
    };
}

nlohmann::json to_json(const AnalyzerReport& report) {
    nlohmann::json output{
        {"analyzer", report.analyzer},
        {"diagnoses", report.diagnoses},
        {"confidence", report.confidence},
        {"findings", array_of(report.findings)},
        {"hypotheses", array_of(report.hypotheses)},
        {"alerts", report.alerts},
        {"is_definitive", report.is_definitive},
        {"primary_impression", report.primary_impression},
        {"explanation", report.explanation},
        {"recommendations", report.recommendations},
        {"parse_status", to_string(report.parse_status)},
    };
    if (report.parse_status == ParseStatus::kParseError) {
        output["parse_error"] = report.parse_error;
    }
    return output;
}

nlohmann::json to_json(const ReportSet& reports) {
    nlohmann::json output = nlohmann::json::object();
    for (const auto& [name, report] : reports) {
        output[name] = to_json(report);
    }
    return output;
}

nlohmann::json to_json(const RankedDiagnosis& ranked) {
    return {
        {"diagnosis", ranked.diagnosis},
        {"probability", ranked.probability},
        {"weighted_mean", ranked.weighted_mean},
        {"agreement", ranked.agreement},
        {"analyzer_probabilities", ranked.analyzer_probabilities},
        {"supporting_analyzers", ranked.supporting_analyzers},
    };
}

nlohmann::json to_json(const ConsensusResult& consensus) {
    return {
        {"diagnosis", consensus.diagnosis},
        {"probability", consensus.probability},
        {"confidence", consensus.confidence},
        {"agreement_score", consensus.agreement_score},
        {"supporting_analyzers", consensus.supporting_analyzers},
        {"differential", array_of(consensus.differential)},
        {"ranking", array_of(consensus.ranking)},
        {"diagnostic_certainty", to_string(consensus.certainty)},
        {"urgency", to_string(consensus.urgency)},
        {"is_definitive", consensus.is_definitive},
        {"definitive_source", consensus.definitive_source},
        {"alerts", consensus.alerts},
    };
}

nlohmann::json to_json(const CriticalAlert& alert) {
    return {
        {"condition", alert.condition},
        {"matched_keyword", alert.matched_keyword},
        {"action_required", alert.action_required},
        {"time_critical", alert.time_critical},
        {"analyzers", alert.analyzers},
    };
}

nlohmann::json to_json(const Contradiction& contradiction) {
    return {
        {"diagnosis", contradiction.diagnosis},
        {"disagreement", contradiction.analyzer_probabilities},
        {"spread", contradiction.spread},
        {"recommendation", contradiction.recommendation},
    };
}

nlohmann::json to_json(const SafetyAssessment& safety) {
    return {
        {"risk_level", to_string(safety.tier)},
        {"needs_human_review", safety.review.required},
        {"review_reasons", safety.review.reasons},
        {"critical_alerts", array_of(safety.alerts)},
        {"contradictions", array_of(safety.contradictions)},
        {"confidence_assessment",
         {{"average_confidence", safety.calibration.average_confidence},
          {"reliability", safety.calibration.reliability},
          {"low_confidence_analyzers", safety.calibration.low_confidence_analyzers}}},
        {"missing_data_analyzers", safety.missing_data_analyzers},
        {"contraindications", safety.contraindications},
        {"flags", safety.flags},
        {"disclaimer", safety.disclaimer},
    };
}

nlohmann::json to_json(const EvidenceAttribution& attribution) {
    return {
        {"evidence_type", attribution.evidence_type},
        {"finding", attribution.finding},
        {"contribution", to_string(attribution.contribution)},
        {"weight", attribution.weight},
        {"reasoning", attribution.reasoning},
        {"source_analyzer", attribution.source_analyzer},
    };
}

nlohmann::json to_json(const ReasoningStep& step) {
    return {
        {"step_number", step.step_number},
        {"analyzer", step.analyzer},
        {"action", step.action},
        {"description", step.description},
        {"evidence_used", step.evidence_used},
        {"conclusion", step.conclusion},
        {"confidence_delta", step.confidence_delta},
        {"running_confidence", step.running_confidence},
    };
}

nlohmann::json to_json(const ConfidenceDecomposition& decomposition) {
    return {
        {"base_confidence", decomposition.base_confidence},
        {"evidence_boost", decomposition.evidence_boost},
        {"agreement_boost", decomposition.agreement_boost},
        {"penalty_factors", decomposition.penalty_factors},
        {"final_confidence", decomposition.final_confidence},
        {"calibration_note", decomposition.calibration_note},
    };
}

nlohmann::json to_json(const Counterfactual& counterfactual) {
    return {
        {"current_diagnosis", counterfactual.current_diagnosis},
        {"alternative_diagnosis", counterfactual.alternative_diagnosis},
        {"missing_evidence", counterfactual.missing_evidence},
        {"contradicting_evidence", counterfactual.contradicting_evidence},
        {"probability_if_changed", counterfactual.probability_if_changed},
    };
}

nlohmann::json to_json(const ExplanationBundle& explanation) {
    return {
        {"diagnosis", explanation.diagnosis},
        {"confidence", explanation.confidence},
        {"diagnostic_certainty", to_string(explanation.certainty)},
        {"evidence_attributions", array_of(explanation.attributions)},
        {"reasoning_chain", array_of(explanation.reasoning_chain)},
        {"confidence_decomposition", to_json(explanation.decomposition)},
        {"counterfactuals", array_of(explanation.counterfactuals)},
        {"one_line_explanation", explanation.one_line},
        {"detailed_explanation", explanation.detailed},
    };
}

nlohmann::json to_json(const VerificationResult& result) {
    nlohmann::json output{
        {"segment", result.segment},
        {"valid", result.valid},
        {"entries_checked", result.entries_checked},
        {"message", result.message},
        {"broken_at_entry", nullptr},
    };
    if (result.broken_at_entry.has_value()) {
        output["broken_at_entry"] = *result.broken_at_entry;
    }
    return output;
}

}  // namespace clinfuse
