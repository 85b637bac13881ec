#include "clinfuse/config.hpp"

#include <fstream>
#include <set>
#include <string>

#include "clinfuse/common.hpp"

namespace clinfuse {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw ConfigError("invalid boolean: " + value);
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw ConfigError("invalid number for " + key + ": " + value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigError("invalid integer for " + key + ": " + value);
    }
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

std::string strip_comment(const std::string& line) {
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            quoted = !quoted;
        } else if (line[i] == '#' && !quoted) {
            return line.substr(0, i);
        }
    }
    return line;
}

// Finds '=' outside a quoted key.
size_t find_assignment(const std::string& line) {
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            quoted = !quoted;
        } else if (line[i] == '=' && !quoted) {
            return i;
        }
    }
    return std::string::npos;
}

// Splits `prefix."Quoted Name"` into its two halves.
std::pair<std::string, std::string> split_section(const std::string& section) {
    auto dot = section.find('.');
    if (dot == std::string::npos) {
        return {section, ""};
    }
    return {section.substr(0, dot), strip_quotes(trim(section.substr(dot + 1)))};
}

std::map<std::string, double> default_base_weights() {
    return {
        {"radiologist", 1.0},
        {"cardiologist", 1.0},
        {"pulmonologist", 1.0},
        {"pathologist", 0.8},
    };
}

std::map<std::string, std::map<std::string, double>> default_condition_weights() {
    return {
        {"Community-Acquired Pneumonia",
         {{"radiologist", 1.3}, {"pulmonologist", 1.2}, {"pathologist", 1.0}, {"cardiologist", 0.5}}},
        {"ST-Elevation Myocardial Infarction",
         {{"cardiologist", 1.5}, {"pathologist", 1.3}, {"radiologist", 0.6}, {"pulmonologist", 0.4}}},
        {"Non-ST-Elevation Myocardial Infarction",
         {{"cardiologist", 1.4}, {"pathologist", 1.3}, {"radiologist", 0.6}, {"pulmonologist", 0.5}}},
        {"Pulmonary Embolism",
         {{"radiologist", 1.4}, {"cardiologist", 1.0}, {"pathologist", 1.0}, {"pulmonologist", 0.8}}},
        {"Acute Decompensated Heart Failure",
         {{"radiologist", 1.2}, {"cardiologist", 1.2}, {"pathologist", 1.1}, {"pulmonologist", 0.9}}},
        {"COPD Exacerbation",
         {{"pulmonologist", 1.4}, {"radiologist", 1.0}, {"pathologist", 0.8}, {"cardiologist", 0.6}}},
    };
}

// NSTEMI has to be tested before STEMI: "nstemi" contains "stemi".
std::vector<AliasRule> default_aliases() {
    return {
        {"Community-Acquired Pneumonia", {"pneumonia"}, {}},
        {"Non-ST-Elevation Myocardial Infarction", {"nstemi", "non-st-elevation", "non st elevation"}, {}},
        {"ST-Elevation Myocardial Infarction", {"stemi", "st-elevation myocardial", "st elevation myocardial"}, {}},
        {"Myocardial Infarction", {"myocardial infarction"}, {}, {"st"}},
        {"Atrial Fibrillation", {"atrial fibrillation", "afib", "a fib"}, {}},
        {"Pulmonary Embolism", {"pulmonary embolism"}, {"pe"}},
        {"COPD Exacerbation", {"copd"}, {}},
        {"Acute Decompensated Heart Failure", {"heart failure", "chf"}, {}},
    };
}

std::vector<CriticalCondition> default_critical_conditions() {
    return {
        {"STEMI",
         {"st elevation", "stemi", "st-elevation", "acute mi", "transmural"},
         "IMMEDIATE cardiology consult, cath lab activation if confirmed",
         true},
        {"Pulmonary Embolism",
         {"pulmonary embolism", "pe", "filling defect", "saddle embolus"},
         "Anticoagulation consideration, hemodynamic assessment",
         true},
        {"Tension Pneumothorax", {"tension pneumothorax", "mediastinal shift"}, "Immediate needle decompression", true},
        {"Cardiac Tamponade",
         {"tamponade", "beck's triad", "pulsus paradoxus"},
         "Emergent pericardiocentesis consideration",
         true},
        {"Septic Shock",
         {"septic shock", "lactate >4", "vasopressor", "refractory hypotension"},
         "Sepsis bundle, ICU care",
         true},
        {"Respiratory Failure",
         {"respiratory failure", "intubation", "ards", "spo2 <88"},
         "Ventilatory support consideration",
         true},
        {"Ventricular Arrhythmia",
         {"ventricular tachycardia", "vt", "ventricular fibrillation", "vf"},
         "ACLS protocol, defibrillation if indicated",
         true},
        {"Aortic Dissection",
         {"aortic dissection", "intimal flap", "tearing chest pain"},
         "Urgent surgical/vascular consult, BP control",
         true},
    };
}

std::map<std::string, std::vector<std::string>> default_contraindications() {
    return {
        {"STEMI", {"thrombolytics contraindicated if aortic dissection suspected"}},
        {"Pulmonary Embolism", {"anticoagulation contraindicated if active bleeding"}},
        {"Atrial Fibrillation", {"rate control caution in WPW syndrome"}},
    };
}

std::map<std::string, CounterfactualEvidence> default_counterfactuals() {
    return {
        {"Community-Acquired Pneumonia",
         {{"Consolidation on imaging", "Fever", "Productive cough", "Elevated WBC"},
          {"Filling defect on CTPA", "D-dimer normal"}}},
        {"ST-Elevation Myocardial Infarction",
         {{"ST elevation on ECG", "Elevated troponin", "Chest pain"}, {"Normal ECG", "Normal troponin"}}},
        {"Pulmonary Embolism",
         {{"Filling defect on CTPA", "Elevated D-dimer", "DVT risk factors"},
          {"Normal CTPA", "Normal D-dimer with low clinical suspicion"}}},
        {"Acute Decompensated Heart Failure",
         {{"Pulmonary edema on CXR", "Elevated BNP", "Cardiomegaly"}, {"Normal BNP", "Clear lungs"}}},
    };
}

}  // namespace

ConsensusConfig::ConsensusConfig()
    : base_weights(default_base_weights()),
      condition_weights(default_condition_weights()),
      aliases(default_aliases()),
      benign_labels({"Normal Sinus Rhythm", "No Finding", "No significant lab abnormality",
                     "No specific pulmonary abnormality identified"}),
      critical_urgency_keywords({"stemi", "embolism", "tamponade", "shock", "arrest", "critical"}),
      high_urgency_keywords({"nstemi", "failure", "effusion", "tuberculosis"}) {}

SafetyConfig::SafetyConfig()
    : critical_conditions(default_critical_conditions()), contraindications(default_contraindications()) {}

ExplainConfig::ExplainConfig()
    : workflow_order({"pulmonologist", "radiologist", "cardiologist", "pathologist"}),
      counterfactuals(default_counterfactuals()) {}

std::vector<std::string> parse_string_list(const std::string& value) {
    const auto text = trim(value);
    if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
        throw ConfigError("expected a string array: " + value);
    }
    std::vector<std::string> items;
    const std::string body = text.substr(1, text.size() - 2);
    size_t pos = 0;
    while (pos < body.size()) {
        const char ch = body[pos];
        if (std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == ',') {
            ++pos;
            continue;
        }
        if (ch != '"') {
            throw ConfigError("array items must be quoted strings: " + value);
        }
        const auto close = body.find('"', pos + 1);
        if (close == std::string::npos) {
            throw ConfigError("unterminated string in array: " + value);
        }
        items.push_back(body.substr(pos + 1, close - pos - 1));
        pos = close + 1;
    }
    return items;
}

Settings Settings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("unable to open config file: " + path);
    }
    return from_stream(file);
}

Settings Settings::from_stream(std::istream& input) {
    Settings settings;
    std::string current_section;
    std::string line;
    // A table named in the file replaces the built-in table wholesale.
    std::set<std::string> replaced;
    auto replace_once = [&replaced](const std::string& table, auto& container) {
        if (replaced.insert(table).second) {
            container.clear();
        }
    };

    while (std::getline(input, line)) {
        line = trim(strip_comment(line));
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            const auto [prefix, name] = split_section(current_section);
            if (prefix == "condition_weights") {
                replace_once(prefix, settings.consensus.condition_weights);
                settings.consensus.condition_weights[name];
            } else if (prefix == "diagnosis_aliases") {
                replace_once(prefix, settings.consensus.aliases);
                settings.consensus.aliases.push_back(AliasRule{name, {}, {}});
            } else if (prefix == "critical_condition") {
                replace_once(prefix, settings.safety.critical_conditions);
                settings.safety.critical_conditions.push_back(CriticalCondition{name, {}, "", true});
            } else if (prefix == "counterfactual") {
                replace_once(prefix, settings.explain.counterfactuals);
                settings.explain.counterfactuals[name];
            } else if (current_section == "consensus.base_weights") {
                replace_once(current_section, settings.consensus.base_weights);
            } else if (current_section == "contraindications") {
                replace_once(current_section, settings.safety.contraindications);
            }
            continue;
        }
        auto eq_pos = find_assignment(line);
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = strip_quotes(trim(line.substr(0, eq_pos)));
        auto value = trim(line.substr(eq_pos + 1));
        const auto [prefix, name] = split_section(current_section);

        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(key, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(key, value);
            }
        } else if (current_section == "audit") {
            if (key == "enabled") {
                settings.audit.enabled = parse_bool(value);
            } else if (key == "directory") {
                settings.audit.directory = strip_quotes(value);
            } else if (key == "hash_hex_length") {
                settings.audit.hash_hex_length = parse_int(key, value);
            } else if (key == "input_hash_hex_length") {
                settings.audit.input_hash_hex_length = parse_int(key, value);
            } else if (key == "preview_chars") {
                settings.audit.preview_chars = parse_int(key, value);
            }
        } else if (current_section == "pipeline") {
            if (key == "parallel_stages") {
                settings.pipeline.parallel_stages = parse_bool(value);
            }
        } else if (current_section == "consensus") {
            auto& consensus = settings.consensus;
            if (key == "definitive_floor") {
                consensus.definitive_floor = parse_double(key, value);
            } else if (key == "probability_cap") {
                consensus.probability_cap = parse_double(key, value);
            } else if (key == "support_threshold") {
                consensus.support_threshold = parse_double(key, value);
            } else if (key == "agreement_boost") {
                consensus.agreement_boost = parse_double(key, value);
            } else if (key == "differential_threshold") {
                consensus.differential_threshold = parse_double(key, value);
            } else if (key == "max_differentials") {
                consensus.max_differentials = parse_int(key, value);
            } else if (key == "single_source_agreement") {
                consensus.single_source_agreement = parse_double(key, value);
            } else if (key == "confidence_floor") {
                consensus.confidence_floor = parse_double(key, value);
            } else if (key == "confidence_cap") {
                consensus.confidence_cap = parse_double(key, value);
            } else if (key == "mean_confidence_weight") {
                consensus.mean_confidence_weight = parse_double(key, value);
            } else if (key == "benign_labels") {
                consensus.benign_labels = parse_string_list(value);
            } else if (key == "critical_urgency_keywords") {
                consensus.critical_urgency_keywords = parse_string_list(value);
            } else if (key == "high_urgency_keywords") {
                consensus.high_urgency_keywords = parse_string_list(value);
            }
        } else if (current_section == "consensus.base_weights") {
            settings.consensus.base_weights[key] = parse_double(key, value);
        } else if (prefix == "condition_weights") {
            settings.consensus.condition_weights[name][key] = parse_double(key, value);
        } else if (prefix == "diagnosis_aliases") {
            auto& rule = settings.consensus.aliases.back();
            if (key == "contains") {
                rule.contains = parse_string_list(value);
            } else if (key == "exact") {
                rule.exact = parse_string_list(value);
            } else if (key == "excludes") {
                rule.excludes = parse_string_list(value);
            }
        } else if (current_section == "safety") {
            auto& safety = settings.safety;
            if (key == "contradiction_floor") {
                safety.contradiction_floor = parse_double(key, value);
            } else if (key == "contradiction_spread") {
                safety.contradiction_spread = parse_double(key, value);
            } else if (key == "low_confidence_threshold") {
                safety.low_confidence_threshold = parse_double(key, value);
            } else if (key == "high_reliability_threshold") {
                safety.high_reliability_threshold = parse_double(key, value);
            } else if (key == "negation_window") {
                safety.negation_window = parse_int(key, value);
            }
        } else if (prefix == "critical_condition") {
            auto& condition = settings.safety.critical_conditions.back();
            if (key == "keywords") {
                condition.keywords = parse_string_list(value);
            } else if (key == "action") {
                condition.action = strip_quotes(value);
            } else if (key == "time_critical") {
                condition.time_critical = parse_bool(value);
            }
        } else if (current_section == "contraindications") {
            settings.safety.contraindications[key] = parse_string_list(value);
        } else if (current_section == "explain") {
            if (key == "reasoning_cap") {
                settings.explain.reasoning_cap = parse_double(key, value);
            } else if (key == "max_counterfactuals") {
                settings.explain.max_counterfactuals = parse_int(key, value);
            } else if (key == "workflow_order") {
                settings.explain.workflow_order = parse_string_list(value);
            }
        } else if (prefix == "counterfactual") {
            auto& entry = settings.explain.counterfactuals[name];
            if (key == "required") {
                entry.required = parse_string_list(value);
            } else if (key == "contradicts") {
                entry.contradicts = parse_string_list(value);
            }
        }
    }

    if (settings.audit.hash_hex_length < 8 || settings.audit.hash_hex_length > 64) {
        throw ConfigError("audit.hash_hex_length must be within 8..64");
    }
    if (settings.audit.input_hash_hex_length < 8 || settings.audit.input_hash_hex_length > 64) {
        throw ConfigError("audit.input_hash_hex_length must be within 8..64");
    }
    if (settings.safety.negation_window < 0) {
        throw ConfigError("safety.negation_window must not be negative");
    }
    return settings;
}

}  // namespace clinfuse
