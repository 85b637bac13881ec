#include "clinfuse/explainability.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>

#include "clinfuse/common.hpp"

namespace clinfuse {

std::string to_string(ContributionTier tier) {
    switch (tier) {
        case ContributionTier::kDecisive:
            return "decisive";
        case ContributionTier::kStrong:
            return "strong";
        case ContributionTier::kModerate:
            return "moderate";
        case ContributionTier::kWeak:
            return "weak";
        case ContributionTier::kNeutral:
            return "neutral";
        case ContributionTier::kOpposing:
            return "opposing";
    }
    return "neutral";
}

namespace {

constexpr double kSupportThreshold = 0.3;
constexpr double kSpreadPenalty = 0.4;
constexpr int kMinimumAnalyzers = 3;

std::string title_case(std::string value) {
    if (!value.empty()) {
        value.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(value.front())));
    }
    return value;
}

std::pair<ContributionTier, double> tier_for(Severity severity) {
    switch (severity) {
        case Severity::kCritical:
            return {ContributionTier::kStrong, 0.8};
        case Severity::kHigh:
            return {ContributionTier::kStrong, 0.6};
        case Severity::kModerate:
            return {ContributionTier::kModerate, 0.4};
        case Severity::kLow:
        case Severity::kNormal:
            return {ContributionTier::kWeak, 0.2};
    }
    return {ContributionTier::kWeak, 0.2};
}

std::string percent(double value) {
    return std::to_string(static_cast<long long>(std::lround(value * 100.0))) + "%";
}

}  // namespace

ExplainabilityCompiler::ExplainabilityCompiler(ExplainConfig config, DiagnosisNormalizer normalizer)
    : config_(std::move(config)), normalizer_(std::move(normalizer)) {}

bool ExplainabilityCompiler::supports(const AnalyzerReport& report, const std::string& diagnosis) const {
    return std::any_of(report.diagnoses.begin(), report.diagnoses.end(), [&](const auto& entry) {
        return normalizer_.same(entry.first, diagnosis);
    });
}

std::vector<std::string> ExplainabilityCompiler::workflow(const ReportSet& reports) const {
    std::vector<std::string> order;
    std::set<std::string> placed;
    for (const auto& analyzer : config_.workflow_order) {
        if (reports.count(analyzer) != 0 && placed.insert(analyzer).second) {
            order.push_back(analyzer);
        }
    }
    for (const auto& [analyzer, report] : reports) {
        if (placed.insert(analyzer).second) {
            order.push_back(analyzer);
        }
    }
    return order;
}

std::vector<EvidenceAttribution> ExplainabilityCompiler::attribute(const ReportSet& reports,
                                                                   const std::string& diagnosis) const {
    std::vector<EvidenceAttribution> attributions;
    for (const auto& [analyzer, report] : reports) {
        const bool decisive = report.is_definitive && supports(report, diagnosis);
        for (const auto& finding : report.findings) {
            EvidenceAttribution attribution;
            attribution.evidence_type = finding.evidence.empty() ? analyzer : to_string(finding.evidence.front().type);
            attribution.finding = finding.name;
            attribution.reasoning = finding.clinical_significance;
            attribution.source_analyzer = analyzer;
            if (!finding.present) {
                attribution.contribution = ContributionTier::kNeutral;
                attribution.weight = 0.0;
            } else if (decisive) {
                attribution.contribution = ContributionTier::kDecisive;
                attribution.weight = 1.0;
            } else {
                std::tie(attribution.contribution, attribution.weight) = tier_for(finding.severity);
            }
            attributions.push_back(std::move(attribution));
        }
        for (const auto& hypothesis : report.hypotheses) {
            if (!normalizer_.same(hypothesis.diagnosis, diagnosis)) {
                continue;
            }
            for (const auto& evidence : hypothesis.opposing_evidence) {
                EvidenceAttribution attribution;
                attribution.evidence_type = to_string(evidence.type);
                attribution.finding = evidence.description;
                attribution.contribution = ContributionTier::kOpposing;
                attribution.weight = 0.0;
                attribution.reasoning = "Argues against " + diagnosis;
                attribution.source_analyzer = analyzer;
                attributions.push_back(std::move(attribution));
            }
        }
    }
    std::stable_sort(attributions.begin(), attributions.end(),
                     [](const EvidenceAttribution& lhs, const EvidenceAttribution& rhs) {
                         return lhs.weight > rhs.weight;
                     });
    return attributions;
}

std::vector<ReasoningStep> ExplainabilityCompiler::reasoning_chain(const ReportSet& reports,
                                                                   const std::string& diagnosis) const {
    std::vector<ReasoningStep> steps;
    double cumulative = 0.0;
    for (const auto& analyzer : workflow(reports)) {
        const auto& report = reports.at(analyzer);
        if (report.findings.empty()) {
            continue;
        }
        ReasoningStep step;
        step.step_number = static_cast<int>(steps.size()) + 1;
        step.analyzer = analyzer;
        step.description = title_case(analyzer) + " analyzed " + std::to_string(report.findings.size()) +
                           " finding(s)";
        for (size_t i = 0; i < report.findings.size() && i < 3; ++i) {
            step.evidence_used.push_back(report.findings[i].name);
        }

        const auto top = report.top_diagnosis();
        double delta = 0.0;
        if (report.is_definitive) {
            step.action = "confirmed";
            step.conclusion = "DEFINITIVE: " + diagnosis + " confirmed by gold-standard test";
            delta = config_.reasoning_cap - cumulative;
        } else if (top.has_value() && normalizer_.same(top->first, diagnosis)) {
            step.action = "supported";
            step.conclusion = "Evidence supports " + diagnosis;
            delta = std::min(0.15, report.confidence * 0.3);
        } else {
            step.action = "evaluated";
            step.conclusion = "Findings noted: " + join(step.evidence_used, ", ");
            delta = 0.05;
        }
        cumulative = std::min(config_.reasoning_cap, cumulative + delta);
        step.confidence_delta = round_to(delta, 3);
        step.running_confidence = round_to(cumulative, 3);
        steps.push_back(std::move(step));
    }
    return steps;
}

ConfidenceDecomposition ExplainabilityCompiler::decompose(const ReportSet& reports, const std::string& diagnosis,
                                                          double final_confidence, bool definitive) const {
    ConfidenceDecomposition decomposition;
    decomposition.final_confidence = final_confidence;
    if (definitive) {
        decomposition.base_confidence = 0.95;
        decomposition.evidence_boost = round_to(std::max(0.0, final_confidence - 0.95), 3);
        decomposition.calibration_note = "Confidence based on definitive diagnostic finding (gold-standard test)";
        return decomposition;
    }
    if (reports.empty()) {
        decomposition.penalty_factors.push_back("No analyzer input");
        decomposition.calibration_note = "No analyzer reports were available";
        return decomposition;
    }

    double total = 0.0;
    double low = 1.0;
    double high = 0.0;
    int supporting = 0;
    for (const auto& [analyzer, report] : reports) {
        total += report.confidence;
        low = std::min(low, report.confidence);
        high = std::max(high, report.confidence);
        const bool backs_diagnosis =
            std::any_of(report.diagnoses.begin(), report.diagnoses.end(), [&](const auto& entry) {
                return entry.second >= kSupportThreshold && normalizer_.same(entry.first, diagnosis);
            });
        if (backs_diagnosis) {
            ++supporting;
        }
    }
    const double base = total / static_cast<double>(reports.size());
    const double agreement_boost = 0.05 * std::max(0, supporting - 1);

    decomposition.base_confidence = round_to(base, 3);
    decomposition.agreement_boost = round_to(agreement_boost, 3);
    decomposition.evidence_boost = round_to(final_confidence - base - agreement_boost, 3);
    if (static_cast<int>(reports.size()) < kMinimumAnalyzers) {
        decomposition.penalty_factors.push_back("Incomplete data (not all analyzers provided input)");
    }
    if (high - low > kSpreadPenalty) {
        decomposition.penalty_factors.push_back("Analyzer disagreement detected");
    }
    decomposition.calibration_note = "Confidence based on weighted analyzer consensus";
    return decomposition;
}

std::vector<Counterfactual> ExplainabilityCompiler::counterfactuals(
    const std::string& diagnosis, const std::vector<RankedDiagnosis>& differential) const {
    std::vector<Counterfactual> output;
    for (const auto& alternative : differential) {
        if (static_cast<int>(output.size()) >= config_.max_counterfactuals) {
            break;
        }
        if (normalizer_.same(alternative.diagnosis, diagnosis)) {
            continue;
        }
        Counterfactual counterfactual;
        counterfactual.current_diagnosis = diagnosis;
        counterfactual.alternative_diagnosis = alternative.diagnosis;
        counterfactual.probability_if_changed = round_to(alternative.probability, 3);
        auto entry = std::find_if(config_.counterfactuals.begin(), config_.counterfactuals.end(),
                                  [&](const auto& item) { return normalizer_.same(item.first, alternative.diagnosis); });
        if (entry != config_.counterfactuals.end()) {
            counterfactual.missing_evidence = entry->second.required;
            counterfactual.contradicting_evidence = entry->second.contradicts;
        } else {
            counterfactual.missing_evidence = {"Specific diagnostic criteria"};
        }
        output.push_back(std::move(counterfactual));
    }
    return output;
}

ExplanationBundle ExplainabilityCompiler::compile(const ReportSet& reports, const ConsensusResult& consensus) const {
    ExplanationBundle bundle;
    bundle.diagnosis = consensus.diagnosis;
    bundle.confidence = consensus.confidence;
    bundle.certainty = consensus.certainty;
    bundle.attributions = attribute(reports, consensus.diagnosis);
    bundle.reasoning_chain = reasoning_chain(reports, consensus.diagnosis);
    bundle.decomposition = decompose(reports, consensus.diagnosis, consensus.confidence, consensus.is_definitive);
    bundle.counterfactuals = counterfactuals(consensus.diagnosis, consensus.differential);

    const auto decisive = std::find_if(bundle.attributions.begin(), bundle.attributions.end(),
                                       [](const EvidenceAttribution& item) {
                                           return item.contribution == ContributionTier::kDecisive;
                                       });
    const auto strong = std::count_if(bundle.attributions.begin(), bundle.attributions.end(),
                                      [](const EvidenceAttribution& item) {
                                          return item.contribution == ContributionTier::kStrong;
                                      });
    if (consensus.ranking.empty() && !consensus.is_definitive) {
        bundle.one_line = consensus.diagnosis;
    } else if (decisive != bundle.attributions.end()) {
        bundle.one_line = consensus.diagnosis + " CONFIRMED by " + decisive->finding;
    } else if (strong > 0) {
        bundle.one_line = consensus.diagnosis + " supported by " + std::to_string(strong) + " strong finding(s)";
    } else {
        bundle.one_line = consensus.diagnosis + " suggested based on clinical presentation";
    }

    std::vector<std::string> lines;
    lines.push_back("Diagnosis: " + consensus.diagnosis + " (" + to_upper(to_string(consensus.certainty)) + ")");
    lines.push_back("Confidence: " + percent(consensus.confidence));
    lines.push_back("Key Evidence:");
    for (size_t i = 0; i < bundle.attributions.size() && i < 5; ++i) {
        const auto& item = bundle.attributions[i];
        lines.push_back("  - [" + to_upper(to_string(item.contribution)) + "] " + item.finding + " (" +
                        item.source_analyzer + ")");
    }
    if (!bundle.counterfactuals.empty()) {
        lines.push_back("Differential Considerations:");
        for (size_t i = 0; i < bundle.counterfactuals.size() && i < 2; ++i) {
            const auto& item = bundle.counterfactuals[i];
            const auto needed = item.missing_evidence.empty() ? std::string("additional evidence")
                                                              : item.missing_evidence.front();
            lines.push_back("  - " + item.alternative_diagnosis + ": Would require " + needed);
        }
    }
    bundle.detailed = join(lines, "\n");
    return bundle;
}

}  // namespace clinfuse
