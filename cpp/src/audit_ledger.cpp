#include "clinfuse/audit_ledger.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include "clinfuse/common.hpp"
#include "clinfuse/hashing.hpp"

namespace clinfuse {

namespace {

constexpr std::int64_t kMicrosPerSecond = 1'000'000;

std::tm utc_time(std::int64_t micros) {
    std::time_t seconds = static_cast<std::time_t>(micros / kMicrosPerSecond);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    return tm;
}

std::string format_utc(std::int64_t micros, const char* pattern) {
    const std::tm tm = utc_time(micros);
    char buffer[64];
    const auto written = std::strftime(buffer, sizeof(buffer), pattern, &tm);
    return std::string(buffer, written);
}

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> optional_from_json(const nlohmann::json& value, const char* key) {
    auto it = value.find(key);
    if (it == value.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool within_bound(const std::string& timestamp, const std::optional<std::string>& start,
                  const std::optional<std::string>& end) {
    if (start.has_value() && timestamp < *start) {
        return false;
    }
    // A bound given as a bare date covers that whole day.
    if (end.has_value() && timestamp.substr(0, end->size()) > *end) {
        return false;
    }
    return true;
}

}  // namespace

std::string to_string(EventType type) {
    switch (type) {
        case EventType::kDiagnosis:
            return "diagnosis";
        case EventType::kError:
            return "error";
    }
    return "error";
}

EventType event_type_from_string(const std::string& value) {
    if (value == "diagnosis") {
        return EventType::kDiagnosis;
    }
    if (value == "error") {
        return EventType::kError;
    }
    throw std::invalid_argument("unknown audit event type: " + value);
}

std::string format_timestamp(std::int64_t micros_since_epoch) {
    char fraction[16];
    std::snprintf(fraction, sizeof(fraction), ".%06lldZ",
                  static_cast<long long>(micros_since_epoch % kMicrosPerSecond));
    return format_utc(micros_since_epoch, "%Y-%m-%dT%H:%M:%S") + fraction;
}

std::string canonical_dump(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string compute_entry_hash(const nlohmann::json& entry, int hex_length) {
    auto content = entry;
    content.erase("entry_hash");
    return sha256_hex(canonical_dump(content), hex_length);
}

nlohmann::json to_json(const AuditEntry& entry) {
    return nlohmann::json{
        {"audit_id", entry.audit_id},
        {"timestamp", entry.timestamp},
        {"event_type", to_string(entry.event_type)},
        {"case_id", entry.case_id},
        {"input_hash", optional_to_json(entry.input_hash)},
        {"input_preview", entry.input_preview},
        {"payload", entry.payload},
        {"previous_hash", optional_to_json(entry.previous_hash)},
        {"entry_hash", entry.entry_hash},
    };
}

AuditEntry audit_entry_from_json(const nlohmann::json& value) {
    AuditEntry entry;
    entry.audit_id = value.at("audit_id").get<std::string>();
    entry.timestamp = value.at("timestamp").get<std::string>();
    entry.event_type = event_type_from_string(value.at("event_type").get<std::string>());
    entry.case_id = value.at("case_id").get<std::string>();
    entry.input_hash = optional_from_json(value, "input_hash");
    entry.input_preview = value.value("input_preview", nlohmann::json());
    entry.payload = value.value("payload", nlohmann::json());
    entry.previous_hash = optional_from_json(value, "previous_hash");
    entry.entry_hash = value.at("entry_hash").get<std::string>();
    return entry;
}

AuditLedger::AuditLedger(AuditConfig config, Clock clock, Logger logger)
    : config_(std::move(config)), clock_(std::move(clock)), logger_(std::move(logger)), rng_(std::random_device{}()) {
    std::error_code ec;
    std::filesystem::create_directories(config_.directory, ec);
    if (ec) {
        throw LedgerError("unable to create audit directory " + config_.directory + ": " + ec.message());
    }
    segment_ = segment_for(now_micros());
    head_ = load_tail(segment_);
    logger_.info("audit_ledger_opened", {{"segment", segment_}, {"head", head_.value_or("null")}});
}

std::int64_t AuditLedger::now_micros() const {
    return std::chrono::duration_cast<std::chrono::microseconds>(clock_().time_since_epoch()).count();
}

std::string AuditLedger::segment_for(std::int64_t micros) const {
    return (std::filesystem::path(config_.directory) / format_utc(micros, "audit_%Y%m%d.jsonl")).string();
}

std::optional<std::string> AuditLedger::load_tail(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::string line;
    std::string last;
    while (std::getline(file, line)) {
        if (!trim(line).empty()) {
            last = line;
        }
    }
    if (last.empty()) {
        return std::nullopt;
    }
    try {
        const auto record = nlohmann::json::parse(last);
        return record.at("entry_hash").get<std::string>();
    } catch (const nlohmann::json::exception& exc) {
        // The next entry will start a fresh chain; verify() reports the break.
        logger_.error("audit_tail_unreadable", {{"segment", path}, {"error", exc.what()}});
        return std::nullopt;
    }
}

AuditEntry AuditLedger::append(AuditEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::int64_t micros = std::max(now_micros(), last_micros_ + 1);
    const auto segment = segment_for(micros);
    if (segment != segment_) {
        segment_ = segment;
        head_ = load_tail(segment_);
    }

    entry.timestamp = format_timestamp(micros);
    entry.previous_hash = head_;
    auto record = to_json(entry);
    entry.entry_hash = compute_entry_hash(record, config_.hash_hex_length);
    record["entry_hash"] = entry.entry_hash;

    std::ofstream out(segment_, std::ios::app | std::ios::binary);
    if (!out) {
        throw LedgerError("unable to open audit segment " + segment_);
    }
    out << canonical_dump(record) << '\n';
    out.flush();
    if (!out) {
        throw LedgerError("failed to write audit segment " + segment_);
    }

    last_micros_ = micros;
    head_ = entry.entry_hash;
    logger_.debug("audit_entry_appended",
                  {{"audit_id", entry.audit_id}, {"case_id", entry.case_id}, {"entry_hash", entry.entry_hash}});
    return entry;
}

std::string AuditLedger::next_id(const std::string& prefix) {
    std::uint64_t value = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        value = rng_() & 0xFFFFFFFFFFFFULL;
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%012llX", static_cast<unsigned long long>(value));
    return prefix + buffer;
}

std::string AuditLedger::input_hash(const nlohmann::json& input) const {
    return sha256_hex(canonical_dump(input), config_.input_hash_hex_length);
}

nlohmann::json AuditLedger::input_preview(const nlohmann::json& input) const {
    const auto limit = static_cast<size_t>(std::max(config_.preview_chars, 0));
    auto truncate = [limit](const std::string& text) {
        return text.size() > limit ? text.substr(0, limit) + "..." : text;
    };
    nlohmann::json preview = nlohmann::json::object();
    if (!input.is_object()) {
        preview["input"] = truncate(canonical_dump(input));
        return preview;
    }
    for (const auto& [key, value] : input.items()) {
        preview[key] = truncate(value.is_string() ? value.get<std::string>() : canonical_dump(value));
    }
    return preview;
}

AuditEntry AuditLedger::log_diagnosis(const std::string& case_id, const nlohmann::json& input,
                                      const nlohmann::json& decision) {
    AuditEntry entry;
    entry.audit_id = next_id("AUDIT-");
    entry.event_type = EventType::kDiagnosis;
    entry.case_id = case_id;
    entry.input_hash = input_hash(input);
    entry.input_preview = input_preview(input);
    entry.payload = decision;
    return append(std::move(entry));
}

AuditEntry AuditLedger::log_error(const std::string& case_id, const std::string& error_type,
                                  const std::string& message, const nlohmann::json& context) {
    AuditEntry entry;
    entry.audit_id = next_id("ERROR-");
    entry.event_type = EventType::kError;
    entry.case_id = case_id;
    entry.payload = {{"error_type", error_type}, {"error_message", message}, {"context", context}};
    return append(std::move(entry));
}

std::string AuditLedger::snapshot(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return "";
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LedgerError("unable to read audit segment " + path);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

VerificationResult AuditLedger::verify_segment(const std::string& path) {
    VerificationResult result;
    result.segment = path;
    std::istringstream lines(snapshot(path));

    auto broken = [&result](std::size_t index, const std::string& reason) {
        result.valid = false;
        result.broken_at_entry = index;
        result.message = "entry " + std::to_string(index) + ": " + reason;
        return result;
    };

    std::optional<std::string> previous;
    std::size_t index = 0;
    std::string line;
    while (std::getline(lines, line)) {
        if (trim(line).empty()) {
            continue;
        }
        nlohmann::json record;
        try {
            record = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error&) {
            logger_.warn("audit_chain_broken", {{"segment", path}, {"entry", std::to_string(index)}});
            return broken(index, "entry is not valid JSON");
        }
        const auto stored = record.is_object() ? record.find("entry_hash") : record.end();
        if (!record.is_object() || stored == record.end() || !stored->is_string()) {
            logger_.warn("audit_chain_broken", {{"segment", path}, {"entry", std::to_string(index)}});
            return broken(index, "entry_hash missing");
        }
        const auto link = record.value("previous_hash", nlohmann::json());
        const bool linked = index == 0 ? link.is_null() : (link.is_string() && link.get<std::string>() == *previous);
        if (!linked) {
            logger_.warn("audit_chain_broken", {{"segment", path}, {"entry", std::to_string(index)}});
            return broken(index, "previous_hash does not match the preceding entry");
        }
        if (compute_entry_hash(record, config_.hash_hex_length) != stored->get<std::string>()) {
            logger_.warn("audit_chain_broken", {{"segment", path}, {"entry", std::to_string(index)}});
            return broken(index, "entry_hash does not match entry content");
        }
        previous = stored->get<std::string>();
        ++index;
        result.entries_checked = index;
    }
    result.message = index == 0 ? "segment is empty" : "chain intact";
    return result;
}

VerificationResult AuditLedger::verify() {
    return verify_segment(current_segment());
}

std::vector<VerificationResult> AuditLedger::verify_all() {
    std::vector<VerificationResult> results;
    for (const auto& path : segments()) {
        results.push_back(verify_segment(path));
    }
    return results;
}

std::vector<std::string> AuditLedger::segments() {
    std::vector<std::string> paths;
    std::error_code ec;
    std::filesystem::directory_iterator it(config_.directory, ec);
    if (ec) {
        return paths;
    }
    for (const auto& item : it) {
        const auto name = item.path().filename().string();
        if (name.rfind("audit_", 0) == 0 && item.path().extension() == ".jsonl") {
            paths.push_back(item.path().string());
        }
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

std::vector<AuditEntry> AuditLedger::read_entries(const std::string& path) {
    std::vector<AuditEntry> entries;
    std::istringstream lines(snapshot(path));
    std::string line;
    while (std::getline(lines, line)) {
        if (trim(line).empty()) {
            continue;
        }
        try {
            entries.push_back(audit_entry_from_json(nlohmann::json::parse(line)));
        } catch (const std::exception& exc) {
            logger_.warn("audit_entry_unreadable", {{"segment", path}, {"error", exc.what()}});
        }
    }
    return entries;
}

std::vector<AuditEntry> AuditLedger::entries_for_case(const std::string& case_id) {
    std::vector<AuditEntry> matches;
    for (const auto& path : segments()) {
        for (auto& entry : read_entries(path)) {
            if (entry.case_id == case_id) {
                matches.push_back(std::move(entry));
            }
        }
    }
    std::stable_sort(matches.begin(), matches.end(), [](const AuditEntry& lhs, const AuditEntry& rhs) {
        return lhs.timestamp < rhs.timestamp;
    });
    return matches;
}

nlohmann::json AuditLedger::export_range(const std::optional<std::string>& start,
                                         const std::optional<std::string>& end) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& path : segments()) {
        for (const auto& entry : read_entries(path)) {
            if (within_bound(entry.timestamp, start, end)) {
                entries.push_back(to_json(entry));
            }
        }
    }
    return {
        {"export_timestamp", format_timestamp(now_micros())},
        {"entries_count", entries.size()},
        {"date_range", {{"start", optional_to_json(start)}, {"end", optional_to_json(end)}}},
        {"entries", entries},
    };
}

std::string AuditLedger::export_to_file(const std::optional<std::string>& start,
                                        const std::optional<std::string>& end) {
    const auto report = export_range(start, end);
    const auto name = format_utc(now_micros(), "compliance_export_%Y%m%d_%H%M%S.json");
    const auto path = (std::filesystem::path(config_.directory) / name).string();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw LedgerError("unable to write compliance export " + path);
    }
    out << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!out) {
        throw LedgerError("failed to write compliance export " + path);
    }
    logger_.info("audit_exported",
                 {{"path", path}, {"entries", std::to_string(report.at("entries_count").get<size_t>())}});
    return path;
}

std::optional<std::string> AuditLedger::head() {
    std::lock_guard<std::mutex> lock(mutex_);
    return head_;
}

std::string AuditLedger::current_segment() {
    return segment_for(now_micros());
}

}  // namespace clinfuse
