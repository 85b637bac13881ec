#include "clinfuse/safety.hpp"

#include <algorithm>
#include <cctype>

#include "clinfuse/common.hpp"

namespace clinfuse {

std::string to_string(RiskTier tier) {
    switch (tier) {
        case RiskTier::kCritical:
            return "critical";
        case RiskTier::kHigh:
            return "high";
        case RiskTier::kModerate:
            return "moderate";
        case RiskTier::kLow:
            return "low";
    }
    return "high";
}

namespace {

const std::vector<std::string> kNegationWords = {"no", "not", "without", "negative for", "denies", "ruled out",
                                                 "absent", "free of"};

bool is_word_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

size_t find_word(const std::string& text, const std::string& word, size_t from, size_t limit) {
    if (word.empty()) {
        return std::string::npos;
    }
    auto pos = text.find(word, from);
    while (pos != std::string::npos && pos + word.size() <= limit) {
        const bool left_ok = pos == 0 || !is_word_char(text[pos - 1]) || !is_word_char(word.front());
        const size_t end = pos + word.size();
        const bool right_ok = end >= text.size() || !is_word_char(text[end]) || !is_word_char(word.back());
        if (left_ok && right_ok) {
            return pos;
        }
        pos = text.find(word, pos + 1);
    }
    return std::string::npos;
}

bool negated(const std::string& text, size_t pos, int window) {
    const size_t start = pos > static_cast<size_t>(window) ? pos - static_cast<size_t>(window) : 0;
    return std::any_of(kNegationWords.begin(), kNegationWords.end(), [&](const std::string& negation) {
        return find_word(text, negation, start, pos) != std::string::npos;
    });
}

}  // namespace

bool contains_term(const std::string& text, const std::string& keyword, int negation_window) {
    const auto needle = to_lower(keyword);
    size_t pos = find_word(text, needle, 0, text.size());
    while (pos != std::string::npos) {
        if (negation_window <= 0 || !negated(text, pos, negation_window)) {
            return true;
        }
        pos = find_word(text, needle, pos + 1, text.size());
    }
    return false;
}

SafetyEvaluator::SafetyEvaluator(SafetyConfig config, DiagnosisNormalizer normalizer)
    : config_(std::move(config)), normalizer_(std::move(normalizer)) {}

std::vector<CriticalAlert> SafetyEvaluator::scan_critical_conditions(const ReportSet& reports) const {
    std::map<std::string, std::string> texts;
    for (const auto& [analyzer, report] : reports) {
        texts[analyzer] = report.clinical_text();
    }

    std::vector<CriticalAlert> alerts;
    for (const auto& condition : config_.critical_conditions) {
        CriticalAlert alert;
        for (const auto& keyword : condition.keywords) {
            for (const auto& [analyzer, text] : texts) {
                if (contains_term(text, keyword, config_.negation_window)) {
                    if (alert.matched_keyword.empty()) {
                        alert.matched_keyword = keyword;
                    }
                    if (std::find(alert.analyzers.begin(), alert.analyzers.end(), analyzer) == alert.analyzers.end()) {
                        alert.analyzers.push_back(analyzer);
                    }
                }
            }
            if (!alert.matched_keyword.empty()) {
                break;
            }
        }
        if (alert.matched_keyword.empty()) {
            continue;
        }
        std::sort(alert.analyzers.begin(), alert.analyzers.end());
        alert.condition = condition.name;
        alert.action_required = condition.action;
        alert.time_critical = condition.time_critical;
        alerts.push_back(std::move(alert));
    }
    return alerts;
}

std::vector<Contradiction> SafetyEvaluator::scan_contradictions(const ReportSet& reports) const {
    std::map<std::string, Contradiction> by_diagnosis;
    for (const auto& [analyzer, report] : reports) {
        for (const auto& [name, probability] : report.diagnoses) {
            auto& entry = by_diagnosis[normalizer_.key(name)];
            if (entry.diagnosis.empty()) {
                entry.diagnosis = normalizer_.normalize(name);
            }
            auto& slot = entry.analyzer_probabilities[analyzer];
            slot = std::max(slot, probability);
        }
    }

    std::vector<Contradiction> contradictions;
    for (auto& [key, entry] : by_diagnosis) {
        if (entry.analyzer_probabilities.size() < 2) {
            continue;
        }
        double low = 1.0;
        double high = 0.0;
        for (const auto& [analyzer, probability] : entry.analyzer_probabilities) {
            low = std::min(low, probability);
            high = std::max(high, probability);
        }
        // Only a diagnosis someone considers significant can be contradicted.
        if (high <= config_.contradiction_floor) {
            continue;
        }
        entry.spread = round_to(high - low, 3);
        if (high - low > config_.contradiction_spread) {
            contradictions.push_back(std::move(entry));
        }
    }
    return contradictions;
}

CalibrationSummary SafetyEvaluator::calibrate(const ReportSet& reports) const {
    CalibrationSummary summary;
    if (reports.empty()) {
        return summary;
    }
    double total = 0.0;
    for (const auto& [analyzer, report] : reports) {
        total += report.confidence;
        if (report.confidence < config_.low_confidence_threshold) {
            summary.low_confidence_analyzers.push_back(analyzer);
        }
    }
    const double average = total / static_cast<double>(reports.size());
    summary.average_confidence = round_to(average, 3);
    if (average >= config_.high_reliability_threshold) {
        summary.reliability = "high";
    } else if (average >= config_.low_confidence_threshold) {
        summary.reliability = "moderate";
    } else {
        summary.reliability = "low";
    }
    return summary;
}

std::vector<std::string> SafetyEvaluator::scan_missing_data(const ReportSet& reports) const {
    std::vector<std::string> missing;
    for (const auto& [analyzer, report] : reports) {
        if (report.has_incomplete_data_flag()) {
            missing.push_back(analyzer);
        }
    }
    return missing;
}

RiskTier SafetyEvaluator::risk_tier(const std::vector<CriticalAlert>& alerts,
                                    const std::vector<Contradiction>& contradictions,
                                    const CalibrationSummary& calibration) const {
    const bool time_critical = std::any_of(alerts.begin(), alerts.end(),
                                           [](const CriticalAlert& alert) { return alert.time_critical; });
    if (time_critical) {
        return RiskTier::kCritical;
    }
    if (!alerts.empty()) {
        return RiskTier::kHigh;
    }
    if (contradictions.size() > 1 || calibration.reliability == "low") {
        return RiskTier::kModerate;
    }
    return RiskTier::kLow;
}

HumanReview SafetyEvaluator::review_decision(RiskTier tier, const std::vector<CriticalAlert>& alerts,
                                             const std::vector<Contradiction>& contradictions,
                                             const std::vector<std::string>& missing) const {
    HumanReview review;
    switch (tier) {
        case RiskTier::kCritical:
        case RiskTier::kHigh:
            review.reasons.push_back("Critical or high-risk findings present");
            break;
        case RiskTier::kModerate:
        case RiskTier::kLow:
            break;
    }
    if (!alerts.empty()) {
        std::vector<std::string> names;
        for (const auto& alert : alerts) {
            names.push_back(alert.condition);
        }
        review.reasons.push_back("Critical conditions detected: " + join(names, ", "));
    }
    if (contradictions.size() > 1) {
        review.reasons.push_back("Significant disagreement between specialist analyzers");
    }
    if (missing.size() > 1) {
        review.reasons.push_back("Insufficient data for multiple analyzers");
    }
    review.required = !review.reasons.empty();
    return review;
}

SafetyAssessment SafetyEvaluator::evaluate(const ReportSet& reports) const {
    SafetyAssessment assessment;
    if (reports.empty()) {
        assessment.tier = RiskTier::kHigh;
        assessment.review.required = true;
        assessment.review.reasons.push_back("No analyzer outputs provided for safety evaluation");
        assessment.flags.push_back("NO_DATA_PROVIDED");
        return assessment;
    }

    assessment.alerts = scan_critical_conditions(reports);
    assessment.contradictions = scan_contradictions(reports);
    assessment.calibration = calibrate(reports);
    assessment.missing_data_analyzers = scan_missing_data(reports);
    assessment.tier = risk_tier(assessment.alerts, assessment.contradictions, assessment.calibration);
    assessment.review = review_decision(assessment.tier, assessment.alerts, assessment.contradictions,
                                        assessment.missing_data_analyzers);

    if (assessment.tier == RiskTier::kCritical) {
        assessment.flags.push_back("CRITICAL: Immediate clinical attention required");
    }
    for (const auto& alert : assessment.alerts) {
        assessment.flags.push_back("CRITICAL: " + alert.condition + " - " + alert.action_required);
        auto notes = config_.contraindications.find(alert.condition);
        if (notes != config_.contraindications.end()) {
            assessment.contraindications.insert(assessment.contraindications.end(), notes->second.begin(),
                                                notes->second.end());
        }
    }
    for (const auto& [analyzer, report] : reports) {
        if (report.parse_status == ParseStatus::kParseError) {
            assessment.flags.push_back("PARSE_ERROR: " + analyzer);
        }
    }
    return assessment;
}

}  // namespace clinfuse
