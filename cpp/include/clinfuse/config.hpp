#ifndef CLINFUSE_CONFIG_HPP
#define CLINFUSE_CONFIG_HPP

#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace clinfuse {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct AuditConfig {
    bool enabled = true;
    std::string directory = "audit_logs";
    // Hex length of the chained entry hash, 8..64. One directory must use one
    // length throughout; 64 is the full SHA-256 digest.
    int hash_hex_length = 16;
    int input_hash_hex_length = 32;
    int preview_chars = 100;
};

struct PipelineConfig {
    bool parallel_stages = false;
};

// Maps spelling variants onto one canonical diagnosis name. `contains`
// patterns match anywhere in the lower-cased name, `exact` patterns must
// equal it.
struct AliasRule {
    std::string canonical;
    std::vector<std::string> contains;
    std::vector<std::string> exact;
    // The rule is skipped when the name contains any of these.
    std::vector<std::string> excludes;
};

struct ConsensusConfig {
    double definitive_floor = 0.95;
    double probability_cap = 0.95;
    double support_threshold = 0.3;
    double agreement_boost = 0.2;
    double differential_threshold = 0.15;
    int max_differentials = 3;
    double single_source_agreement = 0.5;
    double confidence_floor = 0.1;
    double confidence_cap = 0.95;
    double mean_confidence_weight = 0.7;

    std::map<std::string, double> base_weights;
    std::map<std::string, std::map<std::string, double>> condition_weights;
    std::vector<AliasRule> aliases;
    std::vector<std::string> benign_labels;
    std::vector<std::string> critical_urgency_keywords;
    std::vector<std::string> high_urgency_keywords;

    ConsensusConfig();
};

struct CriticalCondition {
    std::string name;
    std::vector<std::string> keywords;
    std::string action;
    bool time_critical = true;
};

struct SafetyConfig {
    double contradiction_floor = 0.3;
    double contradiction_spread = 0.4;
    double low_confidence_threshold = 0.4;
    double high_reliability_threshold = 0.6;
    // Characters scanned before a keyword for negation words; 0 disables.
    int negation_window = 0;

    std::vector<CriticalCondition> critical_conditions;
    std::map<std::string, std::vector<std::string>> contraindications;

    SafetyConfig();
};

struct CounterfactualEvidence {
    std::vector<std::string> required;
    std::vector<std::string> contradicts;
};

struct ExplainConfig {
    double reasoning_cap = 0.98;
    int max_counterfactuals = 3;
    std::vector<std::string> workflow_order;
    std::map<std::string, CounterfactualEvidence> counterfactuals;

    ExplainConfig();
};

struct Settings {
    LoggingConfig logging{};
    AuditConfig audit{};
    PipelineConfig pipeline{};
    ConsensusConfig consensus{};
    SafetyConfig safety{};
    ExplainConfig explain{};

    static Settings from_toml(const std::string& path);
    static Settings from_stream(std::istream& input);
};

// Returns the value of a quoted-string array such as ["a", "b"].
std::vector<std::string> parse_string_list(const std::string& value);

}  // namespace clinfuse

#endif  // CLINFUSE_CONFIG_HPP
