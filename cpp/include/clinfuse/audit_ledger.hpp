#ifndef CLINFUSE_AUDIT_LEDGER_HPP
#define CLINFUSE_AUDIT_LEDGER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clinfuse/config.hpp"
#include "clinfuse/logging.hpp"

namespace clinfuse {

class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class EventType {
    kDiagnosis,
    kError,
};

std::string to_string(EventType type);
EventType event_type_from_string(const std::string& value);

struct AuditEntry {
    std::string audit_id;
    std::string timestamp;
    EventType event_type = EventType::kDiagnosis;
    std::string case_id;
    std::optional<std::string> input_hash;
    nlohmann::json input_preview;
    nlohmann::json payload;
    std::optional<std::string> previous_hash;
    std::string entry_hash;
};

nlohmann::json to_json(const AuditEntry& entry);
AuditEntry audit_entry_from_json(const nlohmann::json& value);

// Compact dump with sorted keys; invalid UTF-8 is replaced so that any
// payload can be hashed.
std::string canonical_dump(const nlohmann::json& value);

// Hash over every field except entry_hash.
std::string compute_entry_hash(const nlohmann::json& entry, int hex_length);

struct VerificationResult {
    std::string segment;
    bool valid = true;
    std::size_t entries_checked = 0;
    std::optional<std::size_t> broken_at_entry;
    std::string message;
};

// Append-only, hash-chained decision log. One JSON line per entry, one file
// per UTC day. The chain head belongs to the current day's segment.
class AuditLedger {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit AuditLedger(AuditConfig config, Clock clock = std::chrono::system_clock::now,
                         Logger logger = get_logger("AuditLedger"));

    // Stamps timestamp, previous_hash and entry_hash, writes the line and
    // advances the head. Throws LedgerError when the segment cannot be written.
    AuditEntry append(AuditEntry entry);

    AuditEntry log_diagnosis(const std::string& case_id, const nlohmann::json& input, const nlohmann::json& decision);
    AuditEntry log_error(const std::string& case_id, const std::string& error_type, const std::string& message,
                         const nlohmann::json& context = nlohmann::json::object());

    VerificationResult verify();
    VerificationResult verify_segment(const std::string& path);
    std::vector<VerificationResult> verify_all();

    std::vector<AuditEntry> entries_for_case(const std::string& case_id);
    nlohmann::json export_range(const std::optional<std::string>& start, const std::optional<std::string>& end);
    std::string export_to_file(const std::optional<std::string>& start, const std::optional<std::string>& end);

    std::optional<std::string> head();
    std::string current_segment();
    std::vector<std::string> segments();
    const std::string& directory() const { return config_.directory; }

private:
    std::string segment_for(std::int64_t micros) const;
    std::int64_t now_micros() const;
    std::optional<std::string> load_tail(const std::string& path) const;
    std::string snapshot(const std::string& path);
    std::string next_id(const std::string& prefix);
    std::string input_hash(const nlohmann::json& input) const;
    nlohmann::json input_preview(const nlohmann::json& input) const;
    std::vector<AuditEntry> read_entries(const std::string& path);

    AuditConfig config_;
    Clock clock_;
    Logger logger_;
    std::mutex mutex_;
    std::string segment_;
    std::optional<std::string> head_;
    std::int64_t last_micros_ = 0;
    std::mt19937_64 rng_;
};

// ISO-8601 UTC with microseconds, e.g. 2024-03-01T08:15:02.000001Z.
std::string format_timestamp(std::int64_t micros_since_epoch);

}  // namespace clinfuse

#endif  // CLINFUSE_AUDIT_LEDGER_HPP
