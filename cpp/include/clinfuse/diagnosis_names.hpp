#ifndef CLINFUSE_DIAGNOSIS_NAMES_HPP
#define CLINFUSE_DIAGNOSIS_NAMES_HPP

#include <string>
#include <vector>

#include "clinfuse/config.hpp"

namespace clinfuse {

// Maps analyzer spellings onto canonical diagnosis names. Rules are tried in
// order and the first match wins.
class DiagnosisNormalizer {
public:
    explicit DiagnosisNormalizer(std::vector<AliasRule> rules = ConsensusConfig().aliases);

    // Canonical name for a matching rule, otherwise the trimmed input.
    std::string normalize(const std::string& name) const;

    // Bucket key used for merging: the canonical name, or the lower-cased
    // trimmed input when no rule matches.
    std::string key(const std::string& name) const;

    bool same(const std::string& lhs, const std::string& rhs) const;

private:
    const AliasRule* match(const std::string& lowered) const;

    std::vector<AliasRule> rules_;
};

}  // namespace clinfuse

#endif  // CLINFUSE_DIAGNOSIS_NAMES_HPP
