#ifndef CLINFUSE_CONSENSUS_HPP
#define CLINFUSE_CONSENSUS_HPP

#include <map>
#include <string>
#include <vector>

#include "clinfuse/config.hpp"
#include "clinfuse/diagnosis_names.hpp"
#include "clinfuse/evidence.hpp"

namespace clinfuse {

enum class DiagnosticCertainty {
    kConfirmed,
    kProbable,
    kPossible,
    kUncertain,
};

enum class UrgencyLevel {
    kCritical,
    kHigh,
    kModerate,
    kUnknown,
};

std::string to_string(DiagnosticCertainty certainty);
std::string to_string(UrgencyLevel urgency);

inline constexpr const char* kNoDiagnosisLabel = "No diagnosis - insufficient data";

// One merged diagnosis bucket.
struct RankedDiagnosis {
    std::string diagnosis;
    double probability = 0.0;
    double weighted_mean = 0.0;
    double agreement = 0.0;
    std::map<std::string, double> analyzer_probabilities;
    std::vector<std::string> supporting_analyzers;
};

struct ConsensusResult {
    std::string diagnosis = kNoDiagnosisLabel;
    double probability = 0.0;
    double confidence = 0.0;
    double agreement_score = 0.0;
    std::vector<std::string> supporting_analyzers;
    std::vector<RankedDiagnosis> differential;
    std::vector<RankedDiagnosis> ranking;
    DiagnosticCertainty certainty = DiagnosticCertainty::kUncertain;
    UrgencyLevel urgency = UrgencyLevel::kUnknown;
    bool is_definitive = false;
    std::string definitive_source;
    std::vector<std::string> alerts;

    std::vector<std::string> differential_names() const;
};

class ConsensusEngine {
public:
    explicit ConsensusEngine(ConsensusConfig config = {});

    ConsensusResult evaluate(const ReportSet& reports) const;

    // Multiplier for one analyzer's opinion on one condition:
    // condition table, then the analyzer's base weight, then 1.0.
    double weight_for(const std::string& condition, const std::string& analyzer) const;

    // Merged ranking ordered by probability, ties broken by label.
    std::vector<RankedDiagnosis> rank(const ReportSet& reports) const;

    const DiagnosisNormalizer& normalizer() const { return normalizer_; }
    const ConsensusConfig& config() const { return config_; }

private:
    double agreement(const std::vector<double>& probabilities) const;
    bool is_benign(const std::string& label) const;
    UrgencyLevel classify_urgency(const ConsensusResult& result) const;
    DiagnosticCertainty certainty_for(double confidence) const;
    ConsensusResult definitive_result(const AnalyzerReport& source, const ReportSet& reports) const;

    ConsensusConfig config_;
    DiagnosisNormalizer normalizer_;
};

}  // namespace clinfuse

#endif  // CLINFUSE_CONSENSUS_HPP
