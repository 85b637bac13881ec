#ifndef CLINFUSE_SERIALIZATION_HPP
#define CLINFUSE_SERIALIZATION_HPP

#include <nlohmann/json.hpp>

#include "clinfuse/audit_ledger.hpp"
#include "clinfuse/consensus.hpp"
#include "clinfuse/evidence.hpp"
#include "clinfuse/explainability.hpp"
#include "clinfuse/safety.hpp"

namespace clinfuse {

nlohmann::json to_json(const Evidence& evidence);
nlohmann::json to_json(const Finding& finding);
nlohmann::json to_json(const DiagnosticHypothesis& hypothesis);
nlohmann::json to_json(const AnalyzerReport& report);
nlohmann::json to_json(const ReportSet& reports);

nlohmann::json to_json(const RankedDiagnosis& ranked);
nlohmann::json to_json(const ConsensusResult& consensus);

nlohmann::json to_json(const CriticalAlert& alert);
nlohmann::json to_json(const Contradiction& contradiction);
nlohmann::json to_json(const SafetyAssessment& safety);

nlohmann::json to_json(const EvidenceAttribution& attribution);
nlohmann::json to_json(const ReasoningStep& step);
nlohmann::json to_json(const ConfidenceDecomposition& decomposition);
nlohmann::json to_json(const Counterfactual& counterfactual);
nlohmann::json to_json(const ExplanationBundle& explanation);

nlohmann::json to_json(const VerificationResult& result);

}  // namespace clinfuse

#endif  // CLINFUSE_SERIALIZATION_HPP
