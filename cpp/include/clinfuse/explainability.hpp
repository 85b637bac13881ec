#ifndef CLINFUSE_EXPLAINABILITY_HPP
#define CLINFUSE_EXPLAINABILITY_HPP

#include <string>
#include <vector>

#include "clinfuse/config.hpp"
#include "clinfuse/consensus.hpp"
#include "clinfuse/diagnosis_names.hpp"
#include "clinfuse/evidence.hpp"

namespace clinfuse {

enum class ContributionTier {
    kDecisive,
    kStrong,
    kModerate,
    kWeak,
    kNeutral,
    kOpposing,
};

std::string to_string(ContributionTier tier);

struct EvidenceAttribution {
    std::string evidence_type;
    std::string finding;
    ContributionTier contribution = ContributionTier::kNeutral;
    double weight = 0.0;
    std::string reasoning;
    std::string source_analyzer;
};

struct ReasoningStep {
    int step_number = 0;
    std::string analyzer;
    std::string action;
    std::string description;
    std::vector<std::string> evidence_used;
    std::string conclusion;
    double confidence_delta = 0.0;
    double running_confidence = 0.0;
};

struct ConfidenceDecomposition {
    double base_confidence = 0.0;
    double evidence_boost = 0.0;
    double agreement_boost = 0.0;
    std::vector<std::string> penalty_factors;
    double final_confidence = 0.0;
    std::string calibration_note;
};

struct Counterfactual {
    std::string current_diagnosis;
    std::string alternative_diagnosis;
    std::vector<std::string> missing_evidence;
    std::vector<std::string> contradicting_evidence;
    double probability_if_changed = 0.0;
};

struct ExplanationBundle {
    std::string diagnosis;
    double confidence = 0.0;
    DiagnosticCertainty certainty = DiagnosticCertainty::kUncertain;
    std::vector<EvidenceAttribution> attributions;
    std::vector<ReasoningStep> reasoning_chain;
    ConfidenceDecomposition decomposition;
    std::vector<Counterfactual> counterfactuals;
    std::string one_line;
    std::string detailed;
};

// Describes a decision that has already been made. Nothing here feeds back
// into the consensus result.
class ExplainabilityCompiler {
public:
    explicit ExplainabilityCompiler(ExplainConfig config = {}, DiagnosisNormalizer normalizer = DiagnosisNormalizer());

    ExplanationBundle compile(const ReportSet& reports, const ConsensusResult& consensus) const;

    std::vector<EvidenceAttribution> attribute(const ReportSet& reports, const std::string& diagnosis) const;
    std::vector<ReasoningStep> reasoning_chain(const ReportSet& reports, const std::string& diagnosis) const;
    ConfidenceDecomposition decompose(const ReportSet& reports, const std::string& diagnosis, double final_confidence,
                                      bool definitive) const;
    std::vector<Counterfactual> counterfactuals(const std::string& diagnosis,
                                                const std::vector<RankedDiagnosis>& differential) const;

private:
    bool supports(const AnalyzerReport& report, const std::string& diagnosis) const;
    std::vector<std::string> workflow(const ReportSet& reports) const;

    ExplainConfig config_;
    DiagnosisNormalizer normalizer_;
};

}  // namespace clinfuse

#endif  // CLINFUSE_EXPLAINABILITY_HPP
