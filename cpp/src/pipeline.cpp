#include "clinfuse/pipeline.hpp"

#include <cstdio>
#include <future>
#include <random>
#include <stdexcept>

#include "clinfuse/serialization.hpp"

namespace clinfuse {

CaseInput CaseInput::from_json(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw std::invalid_argument("case input must be a JSON object");
    }
    CaseInput input;
    input.case_id = value.value("case_id", std::string());
    if (value.contains("clinical_text")) {
        input.clinical_text = value.at("clinical_text").get<std::string>();
    } else if (value.contains("patient_text")) {
        input.clinical_text = value.at("patient_text").get<std::string>();
    }
    if (value.contains("reports")) {
        input.reports = value.at("reports");
    } else if (value.contains("analyzer_outputs")) {
        input.reports = value.at("analyzer_outputs");
    }
    return input;
}

nlohmann::json to_json(const DecisionBundle& bundle) {
    nlohmann::json output{
        {"case_id", bundle.case_id},
        {"consensus", to_json(bundle.consensus)},
        {"safety", to_json(bundle.safety)},
        {"explanation", to_json(bundle.explanation)},
        {"audit_id", nullptr},
        {"warnings", bundle.warnings},
    };
    if (bundle.audit_id.has_value()) {
        output["audit_id"] = *bundle.audit_id;
    }
    return output;
}

std::string generate_case_id() {
    thread_local std::mt19937 rng(std::random_device{}());
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%08X", static_cast<unsigned int>(rng()));
    return std::string("CASE-") + buffer;
}

DiagnosticPipeline::DiagnosticPipeline(const Settings& settings, std::shared_ptr<AuditLedger> ledger, Logger logger)
    : config_(settings.pipeline),
      consensus_(settings.consensus),
      safety_(settings.safety, DiagnosisNormalizer(settings.consensus.aliases)),
      explainer_(settings.explain, DiagnosisNormalizer(settings.consensus.aliases)),
      ledger_(std::move(ledger)),
      logger_(std::move(logger)) {}

void DiagnosticPipeline::evaluate(DecisionBundle& bundle) const {
    bundle.consensus = consensus_.evaluate(bundle.reports);
    if (config_.parallel_stages) {
        auto safety = std::async(std::launch::async, [this, &bundle] { return safety_.evaluate(bundle.reports); });
        auto explanation = std::async(std::launch::async, [this, &bundle] {
            return explainer_.compile(bundle.reports, bundle.consensus);
        });
        bundle.safety = safety.get();
        bundle.explanation = explanation.get();
    } else {
        bundle.safety = safety_.evaluate(bundle.reports);
        bundle.explanation = explainer_.compile(bundle.reports, bundle.consensus);
    }
    logger_.with({{"case_id", bundle.case_id}})
        .info("case_evaluated", {{"diagnosis", bundle.consensus.diagnosis},
                                 {"certainty", to_string(bundle.consensus.certainty)},
                                 {"risk_level", to_string(bundle.safety.tier)},
                                 {"analyzers", std::to_string(bundle.reports.size())}});
}

void DiagnosticPipeline::record(const nlohmann::json& ledger_input, DecisionBundle& bundle) const {
    const auto log = logger_.with({{"case_id", bundle.case_id}});
    if (!ledger_) {
        bundle.warnings.push_back("Audit ledger unavailable; decision was not recorded");
        log.warn("audit_append_skipped");
        return;
    }
    try {
        for (const auto& [analyzer, report] : bundle.reports) {
            if (report.parse_status == ParseStatus::kParseError) {
                ledger_->log_error(bundle.case_id, "report_parse_error", report.parse_error,
                                   {{"analyzer", analyzer}});
            }
        }
        const nlohmann::json decision{
            {"consensus", to_json(bundle.consensus)},
            {"safety", to_json(bundle.safety)},
            {"explanation", to_json(bundle.explanation)},
        };
        bundle.audit_id = ledger_->log_diagnosis(bundle.case_id, ledger_input, decision).audit_id;
    } catch (const LedgerError& exc) {
        bundle.warnings.push_back(std::string("Audit logging failed: ") + exc.what());
        log.error("audit_append_failed", {{"error", exc.what()}});
    } catch (const nlohmann::json::exception& exc) {
        bundle.warnings.push_back(std::string("Audit logging failed: ") + exc.what());
        log.error("audit_append_failed", {{"error", exc.what()}});
    }
}

DecisionBundle DiagnosticPipeline::diagnose(const CaseInput& input) const {
    DecisionBundle bundle;
    bundle.case_id = input.case_id.empty() ? generate_case_id() : input.case_id;
    bundle.reports = parser_.parse_all(input.reports);
    evaluate(bundle);
    record({{"clinical_text", input.clinical_text}, {"reports", input.reports}}, bundle);
    return bundle;
}

DecisionBundle DiagnosticPipeline::diagnose(const std::string& case_id, const ReportSet& reports) const {
    DecisionBundle bundle;
    bundle.case_id = case_id.empty() ? generate_case_id() : case_id;
    bundle.reports = reports;
    evaluate(bundle);
    record({{"reports", to_json(reports)}}, bundle);
    return bundle;
}

std::unique_ptr<DiagnosticPipeline> build_pipeline(const Settings& settings, AuditLedger::Clock clock) {
    configure_logging(settings.logging);
    auto logger = get_logger("clinfuse");
    std::shared_ptr<AuditLedger> ledger;
    if (settings.audit.enabled) {
        try {
            ledger = std::make_shared<AuditLedger>(settings.audit, std::move(clock));
        } catch (const LedgerError& exc) {
            logger.error("audit_ledger_unavailable", {{"directory", settings.audit.directory}, {"error", exc.what()}});
        }
    }
    return std::make_unique<DiagnosticPipeline>(settings, std::move(ledger));
}

}  // namespace clinfuse
