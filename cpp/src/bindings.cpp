#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "clinfuse/audit_ledger.hpp"
#include "clinfuse/config.hpp"
#include "clinfuse/consensus.hpp"
#include "clinfuse/pipeline.hpp"
#include "clinfuse/safety.hpp"
#include "clinfuse/serialization.hpp"

namespace py = pybind11;

namespace {

clinfuse::Settings load_settings(const std::string& config_path) {
    return config_path.empty() ? clinfuse::Settings() : clinfuse::Settings::from_toml(config_path);
}

}  // namespace

PYBIND11_MODULE(clinfuse_python, m) {
    m.doc() = "Pybind11 bindings for the clinfuse decision core.";

    py::enum_<clinfuse::DiagnosticCertainty>(m, "DiagnosticCertainty")
        .value("CONFIRMED", clinfuse::DiagnosticCertainty::kConfirmed)
        .value("PROBABLE", clinfuse::DiagnosticCertainty::kProbable)
        .value("POSSIBLE", clinfuse::DiagnosticCertainty::kPossible)
        .value("UNCERTAIN", clinfuse::DiagnosticCertainty::kUncertain);

    py::enum_<clinfuse::RiskTier>(m, "RiskTier")
        .value("CRITICAL", clinfuse::RiskTier::kCritical)
        .value("HIGH", clinfuse::RiskTier::kHigh)
        .value("MODERATE", clinfuse::RiskTier::kModerate)
        .value("LOW", clinfuse::RiskTier::kLow);

    py::class_<clinfuse::RankedDiagnosis>(m, "RankedDiagnosis")
        .def_readonly("diagnosis", &clinfuse::RankedDiagnosis::diagnosis)
        .def_readonly("probability", &clinfuse::RankedDiagnosis::probability)
        .def_readonly("agreement", &clinfuse::RankedDiagnosis::agreement)
        .def_readonly("analyzer_probabilities", &clinfuse::RankedDiagnosis::analyzer_probabilities)
        .def_readonly("supporting_analyzers", &clinfuse::RankedDiagnosis::supporting_analyzers);

    py::class_<clinfuse::ConsensusResult>(m, "ConsensusResult")
        .def_readonly("diagnosis", &clinfuse::ConsensusResult::diagnosis)
        .def_readonly("probability", &clinfuse::ConsensusResult::probability)
        .def_readonly("confidence", &clinfuse::ConsensusResult::confidence)
        .def_readonly("agreement_score", &clinfuse::ConsensusResult::agreement_score)
        .def_readonly("supporting_analyzers", &clinfuse::ConsensusResult::supporting_analyzers)
        .def_readonly("differential", &clinfuse::ConsensusResult::differential)
        .def_readonly("certainty", &clinfuse::ConsensusResult::certainty)
        .def_readonly("is_definitive", &clinfuse::ConsensusResult::is_definitive);

    py::class_<clinfuse::CriticalAlert>(m, "CriticalAlert")
        .def_readonly("condition", &clinfuse::CriticalAlert::condition)
        .def_readonly("action_required", &clinfuse::CriticalAlert::action_required)
        .def_readonly("time_critical", &clinfuse::CriticalAlert::time_critical);

    py::class_<clinfuse::SafetyAssessment>(m, "SafetyAssessment")
        .def_readonly("tier", &clinfuse::SafetyAssessment::tier)
        .def_readonly("alerts", &clinfuse::SafetyAssessment::alerts)
        .def_readonly("flags", &clinfuse::SafetyAssessment::flags)
        .def_property_readonly("needs_human_review",
                               [](const clinfuse::SafetyAssessment& self) { return self.review.required; });

    py::class_<clinfuse::ExplanationBundle>(m, "ExplanationBundle")
        .def_readonly("one_line", &clinfuse::ExplanationBundle::one_line)
        .def_readonly("detailed", &clinfuse::ExplanationBundle::detailed);

    py::class_<clinfuse::DecisionBundle>(m, "DecisionBundle")
        .def_readonly("case_id", &clinfuse::DecisionBundle::case_id)
        .def_readonly("consensus", &clinfuse::DecisionBundle::consensus)
        .def_readonly("safety", &clinfuse::DecisionBundle::safety)
        .def_readonly("explanation", &clinfuse::DecisionBundle::explanation)
        .def_readonly("audit_id", &clinfuse::DecisionBundle::audit_id)
        .def_readonly("warnings", &clinfuse::DecisionBundle::warnings)
        .def("to_json", [](const clinfuse::DecisionBundle& self) { return clinfuse::to_json(self).dump(); });

    py::class_<clinfuse::DiagnosticPipeline>(m, "DiagnosticPipeline")
        .def(py::init([](const std::string& config_path) {
                 return clinfuse::build_pipeline(load_settings(config_path));
             }),
             py::arg("config_path") = "")
        .def("diagnose", [](const clinfuse::DiagnosticPipeline& self, const std::string& case_json) {
            return self.diagnose(clinfuse::CaseInput::from_json(nlohmann::json::parse(case_json)));
        });

    m.def("diagnose_json",
          [](const std::string& case_json, const std::string& config_path) {
              auto pipeline = clinfuse::build_pipeline(load_settings(config_path));
              const auto input = clinfuse::CaseInput::from_json(nlohmann::json::parse(case_json));
              return clinfuse::to_json(pipeline->diagnose(input)).dump();
          },
          py::arg("case_json"), py::arg("config_path") = "");

    m.def("verify_ledger",
          [](const std::string& directory, bool all, const std::string& config_path) {
              auto config = load_settings(config_path).audit;
              config.directory = directory;
              clinfuse::AuditLedger ledger(config);
              nlohmann::json output = nlohmann::json::array();
              if (all) {
                  for (const auto& result : ledger.verify_all()) {
                      output.push_back(clinfuse::to_json(result));
                  }
              } else {
                  output.push_back(clinfuse::to_json(ledger.verify()));
              }
              return output.dump();
          },
          py::arg("directory"), py::arg("all") = true, py::arg("config_path") = "");
}
