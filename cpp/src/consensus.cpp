#include "clinfuse/consensus.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "clinfuse/common.hpp"

namespace clinfuse {

std::string to_string(DiagnosticCertainty certainty) {
    switch (certainty) {
        case DiagnosticCertainty::kConfirmed:
            return "confirmed";
        case DiagnosticCertainty::kProbable:
            return "probable";
        case DiagnosticCertainty::kPossible:
            return "possible";
        case DiagnosticCertainty::kUncertain:
            return "uncertain";
    }
    return "uncertain";
}

std::string to_string(UrgencyLevel urgency) {
    switch (urgency) {
        case UrgencyLevel::kCritical:
            return "critical";
        case UrgencyLevel::kHigh:
            return "high";
        case UrgencyLevel::kModerate:
            return "moderate";
        case UrgencyLevel::kUnknown:
            return "unknown";
    }
    return "unknown";
}

std::vector<std::string> ConsensusResult::differential_names() const {
    std::vector<std::string> names;
    for (const auto& entry : differential) {
        names.push_back(entry.diagnosis);
    }
    return names;
}

namespace {

struct Bucket {
    std::string label;
    std::map<std::string, double> probabilities;
};

bool ranks_before(const RankedDiagnosis& lhs, const RankedDiagnosis& rhs) {
    if (lhs.probability != rhs.probability) {
        return lhs.probability > rhs.probability;
    }
    return lhs.diagnosis < rhs.diagnosis;
}

double mean_confidence(const ReportSet& reports) {
    if (reports.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& [name, report] : reports) {
        total += report.confidence;
    }
    return total / static_cast<double>(reports.size());
}

std::vector<std::string> collect_alerts(const ReportSet& reports) {
    std::vector<std::string> alerts;
    for (const auto& [name, report] : reports) {
        for (const auto& alert : report.alerts) {
            alerts.push_back("[" + name + "] " + alert);
        }
    }
    return alerts;
}

}  // namespace

ConsensusEngine::ConsensusEngine(ConsensusConfig config)
    : config_(std::move(config)), normalizer_(config_.aliases) {}

double ConsensusEngine::weight_for(const std::string& condition, const std::string& analyzer) const {
    auto table = config_.condition_weights.find(condition);
    if (table != config_.condition_weights.end()) {
        auto weight = table->second.find(analyzer);
        if (weight != table->second.end()) {
            return weight->second;
        }
    }
    auto base = config_.base_weights.find(analyzer);
    if (base != config_.base_weights.end()) {
        return base->second;
    }
    return 1.0;
}

double ConsensusEngine::agreement(const std::vector<double>& probabilities) const {
    if (probabilities.size() < 2) {
        return config_.single_source_agreement;
    }
    const double n = static_cast<double>(probabilities.size());
    const double mean = std::accumulate(probabilities.begin(), probabilities.end(), 0.0) / n;
    double variance = 0.0;
    for (double value : probabilities) {
        variance += (value - mean) * (value - mean);
    }
    const double sigma = std::sqrt(variance / n);
    return std::max(0.0, 1.0 - 2.0 * sigma);
}

bool ConsensusEngine::is_benign(const std::string& label) const {
    return std::any_of(config_.benign_labels.begin(), config_.benign_labels.end(),
                       [&](const std::string& benign) { return normalizer_.same(benign, label); });
}

DiagnosticCertainty ConsensusEngine::certainty_for(double confidence) const {
    if (confidence >= 0.8) {
        return DiagnosticCertainty::kProbable;
    }
    if (confidence >= 0.5) {
        return DiagnosticCertainty::kPossible;
    }
    return DiagnosticCertainty::kUncertain;
}

UrgencyLevel ConsensusEngine::classify_urgency(const ConsensusResult& result) const {
    auto text = to_lower(normalizer_.normalize(result.diagnosis));
    auto contains_any = [&text](const std::vector<std::string>& keywords) {
        return std::any_of(keywords.begin(), keywords.end(),
                           [&text](const std::string& keyword) { return text.find(keyword) != std::string::npos; });
    };
    if (result.is_definitive) {
        return contains_any(config_.critical_urgency_keywords) ? UrgencyLevel::kCritical : UrgencyLevel::kHigh;
    }
    for (const auto& alert : result.alerts) {
        text += "\n" + to_lower(alert);
    }
    if (contains_any(config_.critical_urgency_keywords)) {
        return UrgencyLevel::kCritical;
    }
    if (contains_any(config_.high_urgency_keywords)) {
        return UrgencyLevel::kHigh;
    }
    return UrgencyLevel::kModerate;
}

std::vector<RankedDiagnosis> ConsensusEngine::rank(const ReportSet& reports) const {
    std::map<std::string, Bucket> buckets;
    for (const auto& [analyzer, report] : reports) {
        for (const auto& [name, probability] : report.diagnoses) {
            if (trim(name).empty()) {
                continue;
            }
            auto& bucket = buckets[normalizer_.key(name)];
            if (bucket.label.empty()) {
                bucket.label = normalizer_.normalize(name);
            }
            // Two spellings from one analyzer count once, at the higher value.
            auto& slot = bucket.probabilities[analyzer];
            slot = std::max(slot, clamp_unit(probability));
        }
    }

    std::vector<RankedDiagnosis> ranking;
    for (const auto& [key, bucket] : buckets) {
        RankedDiagnosis entry;
        entry.diagnosis = bucket.label;
        entry.analyzer_probabilities = bucket.probabilities;

        double weighted_sum = 0.0;
        double weight_total = 0.0;
        std::vector<double> probabilities;
        for (const auto& [analyzer, probability] : bucket.probabilities) {
            const double weight = weight_for(bucket.label, analyzer);
            weighted_sum += probability * weight;
            weight_total += weight;
            probabilities.push_back(probability);
            if (probability >= config_.support_threshold) {
                entry.supporting_analyzers.push_back(analyzer);
            }
        }
        entry.weighted_mean = weight_total > 0.0
                                  ? weighted_sum / weight_total
                                  : std::accumulate(probabilities.begin(), probabilities.end(), 0.0) /
                                        static_cast<double>(probabilities.size());
        entry.agreement = agreement(probabilities);
        double fused = entry.weighted_mean;
        if (entry.supporting_analyzers.size() >= 2) {
            fused = entry.weighted_mean * (1.0 + config_.agreement_boost * entry.agreement);
        }
        entry.probability = std::min(config_.probability_cap, fused);
        ranking.push_back(std::move(entry));
    }
    std::sort(ranking.begin(), ranking.end(), ranks_before);
    return ranking;
}

ConsensusResult ConsensusEngine::definitive_result(const AnalyzerReport& source, const ReportSet& reports) const {
    const auto top = source.top_diagnosis();
    ConsensusResult result;
    result.is_definitive = true;
    result.definitive_source = source.analyzer;
    result.diagnosis = top->first;
    result.probability = std::max(top->second, config_.definitive_floor);
    result.confidence = std::max(source.confidence, config_.definitive_floor);
    result.agreement_score = 1.0;
    result.certainty = DiagnosticCertainty::kConfirmed;
    result.supporting_analyzers.push_back(source.analyzer);
    for (const auto& [analyzer, report] : reports) {
        if (analyzer == source.analyzer) {
            continue;
        }
        for (const auto& [name, probability] : report.diagnoses) {
            if (probability >= config_.support_threshold && normalizer_.same(name, result.diagnosis)) {
                result.supporting_analyzers.push_back(analyzer);
                break;
            }
        }
    }
    result.ranking = rank(reports);
    result.alerts = collect_alerts(reports);
    result.urgency = classify_urgency(result);
    return result;
}

ConsensusResult ConsensusEngine::evaluate(const ReportSet& reports) const {
    for (const auto& [analyzer, report] : reports) {
        if (report.is_definitive && report.top_diagnosis().has_value()) {
            return definitive_result(report, reports);
        }
    }

    ConsensusResult result;
    result.alerts = collect_alerts(reports);
    result.ranking = rank(reports);
    if (result.ranking.empty()) {
        return result;
    }

    auto top = std::find_if(result.ranking.begin(), result.ranking.end(),
                            [this](const RankedDiagnosis& entry) { return !is_benign(entry.diagnosis); });
    if (top == result.ranking.end()) {
        top = result.ranking.begin();
    }

    result.diagnosis = top->diagnosis;
    result.probability = top->probability;
    result.agreement_score = top->agreement;
    result.supporting_analyzers = top->supporting_analyzers;
    const double mean_weight = config_.mean_confidence_weight;
    result.confidence = std::clamp(mean_weight * mean_confidence(reports) + (1.0 - mean_weight) * top->agreement,
                                   config_.confidence_floor, config_.confidence_cap);
    result.certainty = certainty_for(result.confidence);

    for (auto it = result.ranking.begin(); it != result.ranking.end(); ++it) {
        if (static_cast<int>(result.differential.size()) >= config_.max_differentials) {
            break;
        }
        if (it != top && it->probability > config_.differential_threshold && !is_benign(it->diagnosis)) {
            result.differential.push_back(*it);
        }
    }
    result.urgency = classify_urgency(result);
    return result;
}

}  // namespace clinfuse
