#ifndef CLINFUSE_PIPELINE_HPP
#define CLINFUSE_PIPELINE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clinfuse/audit_ledger.hpp"
#include "clinfuse/config.hpp"
#include "clinfuse/consensus.hpp"
#include "clinfuse/explainability.hpp"
#include "clinfuse/logging.hpp"
#include "clinfuse/report_parser.hpp"
#include "clinfuse/safety.hpp"

namespace clinfuse {

struct CaseInput {
    std::string case_id;
    // Raw clinical text. Only its hash and a preview reach the ledger.
    std::string clinical_text;
    // Analyzer name to report object or report text.
    nlohmann::json reports = nlohmann::json::object();

    static CaseInput from_json(const nlohmann::json& value);
};

struct DecisionBundle {
    std::string case_id;
    ReportSet reports;
    ConsensusResult consensus;
    SafetyAssessment safety;
    ExplanationBundle explanation;
    std::optional<std::string> audit_id;
    std::vector<std::string> warnings;
};

nlohmann::json to_json(const DecisionBundle& bundle);

class DiagnosticPipeline {
public:
    DiagnosticPipeline(const Settings& settings, std::shared_ptr<AuditLedger> ledger,
                       Logger logger = get_logger("DiagnosticPipeline"));

    DecisionBundle diagnose(const CaseInput& input) const;
    DecisionBundle diagnose(const std::string& case_id, const ReportSet& reports) const;

    const std::shared_ptr<AuditLedger>& ledger() const { return ledger_; }

private:
    void evaluate(DecisionBundle& bundle) const;
    void record(const nlohmann::json& ledger_input, DecisionBundle& bundle) const;

    PipelineConfig config_;
    ReportParser parser_;
    ConsensusEngine consensus_;
    SafetyEvaluator safety_;
    ExplainabilityCompiler explainer_;
    std::shared_ptr<AuditLedger> ledger_;
    Logger logger_;
};

std::string generate_case_id();

// Configures logging and opens the ledger. A ledger that cannot be opened
// leaves the pipeline running without audit.
std::unique_ptr<DiagnosticPipeline> build_pipeline(const Settings& settings,
                                                   AuditLedger::Clock clock = std::chrono::system_clock::now);

}  // namespace clinfuse

#endif  // CLINFUSE_PIPELINE_HPP
