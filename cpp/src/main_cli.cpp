#include "clinfuse/audit_ledger.hpp"
#include "clinfuse/config.hpp"
#include "clinfuse/logging.hpp"
#include "clinfuse/pipeline.hpp"
#include "clinfuse/serialization.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <command> [--config <path>]\n"
              << "  diagnose --case <file|->   fuse analyzer reports and record the decision\n"
              << "  verify [--all]             check the audit hash chain\n"
              << "  case <case_id>             list audit entries for a case\n"
              << "  export [--start <ts>] [--end <ts>] [--file]\n";
}

struct Options {
    std::string command;
    std::string config_path;
    std::string case_path;
    std::string case_id;
    std::optional<std::string> start;
    std::optional<std::string> end;
    bool all = false;
    bool to_file = false;
};

std::optional<Options> parse_args(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }
    Options options;
    options.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                return false;
            }
            target = argv[++i];
            return true;
        };
        std::string value;
        if (arg == "--config") {
            if (!next(options.config_path)) {
                return std::nullopt;
            }
        } else if (arg == "--case") {
            if (!next(options.case_path)) {
                return std::nullopt;
            }
        } else if (arg == "--start") {
            if (!next(value)) {
                return std::nullopt;
            }
            options.start = value;
        } else if (arg == "--end") {
            if (!next(value)) {
                return std::nullopt;
            }
            options.end = value;
        } else if (arg == "--all") {
            options.all = true;
        } else if (arg == "--file") {
            options.to_file = true;
        } else if (options.command == "case" && options.case_id.empty() && arg.rfind("--", 0) != 0) {
            options.case_id = arg;
        } else {
            return std::nullopt;
        }
    }
    return options;
}

nlohmann::json read_case(const std::string& path) {
    if (path == "-") {
        return nlohmann::json::parse(std::cin);
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open case file: " + path);
    }
    return nlohmann::json::parse(file);
}

int run_diagnose(const clinfuse::Settings& settings, const Options& options) {
    auto pipeline = clinfuse::build_pipeline(settings);
    const auto input = clinfuse::CaseInput::from_json(read_case(options.case_path));
    const auto bundle = pipeline->diagnose(input);
    std::cout << clinfuse::to_json(bundle).dump(2) << "\n";
    return 0;
}

int run_verify(clinfuse::AuditLedger& ledger, const Options& options) {
    std::vector<clinfuse::VerificationResult> results;
    if (options.all) {
        results = ledger.verify_all();
    } else {
        results.push_back(ledger.verify());
    }
    nlohmann::json output = nlohmann::json::array();
    bool valid = true;
    for (const auto& result : results) {
        output.push_back(clinfuse::to_json(result));
        valid = valid && result.valid;
    }
    std::cout << output.dump(2) << "\n";
    return valid ? 0 : 2;
}

int run_case(clinfuse::AuditLedger& ledger, const Options& options) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& entry : ledger.entries_for_case(options.case_id)) {
        output.push_back(clinfuse::to_json(entry));
    }
    std::cout << output.dump(2) << "\n";
    return 0;
}

int run_export(clinfuse::AuditLedger& ledger, const Options& options) {
    if (options.to_file) {
        std::cout << ledger.export_to_file(options.start, options.end) << "\n";
    } else {
        std::cout << ledger.export_range(options.start, options.end).dump(2) << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = parse_args(argc, argv);
    if (!options.has_value()) {
        print_usage(argv[0]);
        return 1;
    }
    const bool known = options->command == "diagnose" || options->command == "verify" ||
                       options->command == "case" || options->command == "export";
    if (!known || (options->command == "diagnose" && options->case_path.empty()) ||
        (options->command == "case" && options->case_id.empty())) {
        print_usage(argv[0]);
        return 1;
    }

    clinfuse::Settings settings;
    try {
        if (!options->config_path.empty()) {
            settings = clinfuse::Settings::from_toml(options->config_path);
        }
    } catch (const clinfuse::ConfigError& exc) {
        std::cerr << "clinfuse config error: " << exc.what() << "\n";
        return 1;
    }

    try {
        if (options->command == "diagnose") {
            return run_diagnose(settings, *options);
        }
        clinfuse::configure_logging(settings.logging);
        clinfuse::AuditLedger ledger(settings.audit);
        if (options->command == "verify") {
            return run_verify(ledger, *options);
        }
        if (options->command == "case") {
            return run_case(ledger, *options);
        }
        return run_export(ledger, *options);
    } catch (const std::exception& exc) {
        std::cerr << "clinfuse error: " << exc.what() << "\n";
        return 1;
    }
}
