#ifndef CLINFUSE_SAFETY_HPP
#define CLINFUSE_SAFETY_HPP

#include <map>
#include <string>
#include <vector>

#include "clinfuse/config.hpp"
#include "clinfuse/diagnosis_names.hpp"
#include "clinfuse/evidence.hpp"

namespace clinfuse {

enum class RiskTier {
    kCritical,
    kHigh,
    kModerate,
    kLow,
};

std::string to_string(RiskTier tier);

inline constexpr const char* kSafetyDisclaimer =
    "This is an AI-assisted diagnostic tool. All outputs must be reviewed by qualified healthcare "
    "professionals. Do not make clinical decisions based solely on this output.";

struct CriticalAlert {
    std::string condition;
    std::string matched_keyword;
    std::string action_required;
    bool time_critical = true;
    std::vector<std::string> analyzers;
};

struct Contradiction {
    std::string diagnosis;
    std::map<std::string, double> analyzer_probabilities;
    double spread = 0.0;
    std::string recommendation = "Requires additional clinical correlation";
};

struct CalibrationSummary {
    double average_confidence = 0.0;
    std::string reliability = "unknown";
    std::vector<std::string> low_confidence_analyzers;
};

struct HumanReview {
    bool required = false;
    std::vector<std::string> reasons;
};

struct SafetyAssessment {
    RiskTier tier = RiskTier::kLow;
    std::vector<CriticalAlert> alerts;
    std::vector<Contradiction> contradictions;
    CalibrationSummary calibration;
    std::vector<std::string> missing_data_analyzers;
    HumanReview review;
    std::vector<std::string> contraindications;
    std::vector<std::string> flags;
    std::string disclaimer = kSafetyDisclaimer;
};

// Finds `keyword` in `text` as a whole word. With a positive
// `negation_window`, occurrences preceded by a negation word within that
// many characters are ignored.
bool contains_term(const std::string& text, const std::string& keyword, int negation_window = 0);

class SafetyEvaluator {
public:
    explicit SafetyEvaluator(SafetyConfig config = {}, DiagnosisNormalizer normalizer = DiagnosisNormalizer());

    SafetyAssessment evaluate(const ReportSet& reports) const;

    std::vector<CriticalAlert> scan_critical_conditions(const ReportSet& reports) const;
    std::vector<Contradiction> scan_contradictions(const ReportSet& reports) const;
    CalibrationSummary calibrate(const ReportSet& reports) const;
    std::vector<std::string> scan_missing_data(const ReportSet& reports) const;

    RiskTier risk_tier(const std::vector<CriticalAlert>& alerts, const std::vector<Contradiction>& contradictions,
                       const CalibrationSummary& calibration) const;
    HumanReview review_decision(RiskTier tier, const std::vector<CriticalAlert>& alerts,
                                const std::vector<Contradiction>& contradictions,
                                const std::vector<std::string>& missing) const;

private:
    SafetyConfig config_;
    DiagnosisNormalizer normalizer_;
};

}  // namespace clinfuse

#endif  // CLINFUSE_SAFETY_HPP
