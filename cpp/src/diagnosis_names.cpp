#include "clinfuse/diagnosis_names.hpp"

#include <algorithm>

#include "clinfuse/common.hpp"

namespace clinfuse {

DiagnosisNormalizer::DiagnosisNormalizer(std::vector<AliasRule> rules) : rules_(std::move(rules)) {
    for (auto& rule : rules_) {
        for (auto& pattern : rule.contains) {
            pattern = to_lower(trim(pattern));
        }
        for (auto& pattern : rule.exact) {
            pattern = to_lower(trim(pattern));
        }
        for (auto& pattern : rule.excludes) {
            pattern = to_lower(trim(pattern));
        }
    }
}

const AliasRule* DiagnosisNormalizer::match(const std::string& lowered) const {
    for (const auto& rule : rules_) {
        if (to_lower(rule.canonical) == lowered) {
            return &rule;
        }
        for (const auto& pattern : rule.exact) {
            if (lowered == pattern) {
                return &rule;
            }
        }
        const bool excluded = std::any_of(rule.excludes.begin(), rule.excludes.end(), [&](const std::string& word) {
            return !word.empty() && lowered.find(word) != std::string::npos;
        });
        if (excluded) {
            continue;
        }
        for (const auto& pattern : rule.contains) {
            if (!pattern.empty() && lowered.find(pattern) != std::string::npos) {
                return &rule;
            }
        }
    }
    return nullptr;
}

std::string DiagnosisNormalizer::normalize(const std::string& name) const {
    auto trimmed = trim(name);
    const auto* rule = match(to_lower(trimmed));
    return rule != nullptr ? rule->canonical : trimmed;
}

std::string DiagnosisNormalizer::key(const std::string& name) const {
    const auto lowered = to_lower(trim(name));
    const auto* rule = match(lowered);
    return rule != nullptr ? rule->canonical : lowered;
}

bool DiagnosisNormalizer::same(const std::string& lhs, const std::string& rhs) const {
    return key(lhs) == key(rhs);
}

}  // namespace clinfuse
