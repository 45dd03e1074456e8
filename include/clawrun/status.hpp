#pragma once

/**
 * @file status.hpp
 * @brief Status normalization for the managed CLI
 *
 * The CLI's status output has changed shape several times. Parsing is a
 * chain of independent strategies, each tagged by the shape it expects and
 * producing a PartialStatus. Partials are merged in order and a later
 * strategy may only fill what earlier ones left unresolved.
 *
 * Layering, most structured first:
 * 1. `status --json`, then `status --format json`
 * 2. `status` as `Label: value` lines
 * 3. box-drawing table rows, for channels still unresolved
 */

#include "clawrun/process.hpp"
#include "clawrun/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clawrun {

// ============================================================================
// Timeouts
// ============================================================================

inline constexpr std::chrono::milliseconds kStructuredStatusTimeout{8000};
inline constexpr std::chrono::milliseconds kPlainStatusTimeout{4000};
inline constexpr std::chrono::milliseconds kVerboseProbeTimeout{1500};

// ============================================================================
// Tracked Channels
// ============================================================================

struct TrackedChannel {
    std::string name;                     // canonical lowercase key
    std::string short_label;              // label in the rendered summary
    std::vector<std::string> text_labels; // labels accepted in plain text, by priority
    std::string table_label;              // label cell in table output
};

// Channels shown in the summary, in render order
const std::vector<TrackedChannel>& tracked_channels();

// ============================================================================
// Normalization
// ============================================================================

/**
 * Reduce a raw state string to OK, DOWN, "?" or the uppercased first word.
 *
 * Only the first word counts: "linked (personal)" is OK, "not linked" is NOT.
 */
std::string normalize_channel_state(const std::string& raw);

// ok/up/reachable/running/true, whole value, case-insensitive
bool is_healthy_gateway_token(const std::string& raw);

// ============================================================================
// Partial Records
// ============================================================================

struct PartialStatus {
    std::optional<bool> gateway_ok;
    std::map<std::string, std::string> channels;
    std::optional<int> session_count;
};

// Fill fields of into that are unset or "?" from from; resolved fields stay
void merge_partial(PartialStatus& into, const PartialStatus& from);

// Final record: gateway defaults to DOWN, tracked channels default to "?"
StatusRecord finalize_status(const PartialStatus& partial);

// ============================================================================
// Parsers
// ============================================================================

// Structured output. nullopt when text is not a JSON object.
std::optional<StatusRecord> parse_status_json(const std::string& text);

// Plain `Label: value` output, with the table fallback for channels
StatusRecord parse_status_text(const std::string& text);

// Value of the first `label: value` line (label case-insensitive)
std::optional<std::string> find_labeled_value(const std::string& text, const std::string& label);

// First all-uppercase cell after the label cell of a `│ label │ ... │` row
std::optional<std::string> find_table_state(const std::string& text, const std::string& label);

// "Gateway OK · TG OK · WA DOWN · Sessions 3"
std::string render_status(const StatusRecord& record);

// ============================================================================
// Status Protocol
// ============================================================================

// Argument sets asking for structured output, in preference order
std::vector<std::vector<std::string>> structured_status_forms();

std::string cli_not_found_message(const ResolvedExecutable& executable);

/**
 * One-line status summary for the resolved CLI. Never throws: every failure
 * degrades to a readable explanation.
 */
std::string summarize_status(const ResolvedExecutable& executable,
                             const CommandRunner& run = run_process);

/**
 * Command for a verbose status terminal: `status --all` when a quick probe
 * accepts it, plain `status` otherwise. Empty when the CLI was not found.
 */
std::vector<std::string> verbose_status_argv(const ResolvedExecutable& executable,
                                             const CommandRunner& run = run_process);

} // namespace clawrun
