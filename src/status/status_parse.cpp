#include "clawrun/status.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <sstream>

namespace clawrun {

namespace {

// Box-drawing vertical bar, U+2502
constexpr const char* kTableBar = "\xE2\x94\x82";
constexpr size_t kTableBarLen = 3;

// Separator between summary parts, " · "
constexpr const char* kSummarySeparator = " \xC2\xB7 ";

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

bool is_unresolved(const std::map<std::string, std::string>& channels, const std::string& name) {
    auto it = channels.find(name);
    return it == channels.end() || it->second == kStateUnknown;
}

// Later values never replace a resolved one, including within one strategy
void offer_channel(PartialStatus& partial, const std::string& name, const std::string& state) {
    if (name.empty()) return;
    if (is_unresolved(partial.channels, name)) {
        partial.channels[name] = state;
    }
}

// ============================================================================
// JSON Strategies
// ============================================================================

std::string json_scalar_to_state(const nlohmann::json& value) {
    if (value.is_null()) return kStateUnknown;
    if (value.is_boolean()) return value.get<bool>() ? kStateOk : kStateDown;
    if (value.is_string()) return normalize_channel_state(value.get<std::string>());
    if (value.is_number()) return normalize_channel_state(value.dump());
    return kStateUnknown;
}

const nlohmann::json* first_present(const nlohmann::json& obj,
                                    std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

// Like first_present, but an empty list, object or string also falls through
const nlohmann::json* first_non_empty(const nlohmann::json& obj,
                                      std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null() || it->empty()) continue;
        if (it->is_string() && it->get_ref<const std::string&>().empty()) continue;
        return &*it;
    }
    return nullptr;
}

// "gateway": {"state": ...} | {"reachable": ...} | bool | string
PartialStatus parse_gateway(const nlohmann::json& root) {
    PartialStatus partial;
    auto it = root.find("gateway");
    if (it == root.end() || it->is_null()) return partial;

    const nlohmann::json* value = &*it;
    if (it->is_object()) {
        value = first_present(*it, {"state", "reachable"});
        if (!value) return partial;
    }

    if (value->is_boolean()) {
        partial.gateway_ok = value->get<bool>();
    } else if (value->is_string()) {
        partial.gateway_ok = is_healthy_gateway_token(value->get<std::string>());
    }
    return partial;
}

// "channels" | "channelStatus": [{"channel"|"name": ..., "state"|"status": ...}]
PartialStatus parse_channel_list(const nlohmann::json& root) {
    PartialStatus partial;
    const nlohmann::json* list = first_non_empty(root, {"channels", "channelStatus"});
    if (!list || !list->is_array()) return partial;

    for (const auto& entry : *list) {
        if (!entry.is_object()) continue;
        const nlohmann::json* name = first_present(entry, {"channel", "name"});
        if (!name || !name->is_string()) continue;
        const nlohmann::json* state = first_present(entry, {"state", "status"});
        offer_channel(partial, to_lower(trim(name->get<std::string>())),
                      state ? json_scalar_to_state(*state) : std::string(kStateUnknown));
    }
    return partial;
}

// "channelSummary": ["Telegram: configured", "WhatsApp: linked (personal)"]
PartialStatus parse_channel_summary(const nlohmann::json& root) {
    PartialStatus partial;
    auto it = root.find("channelSummary");
    if (it == root.end() || !it->is_array()) return partial;

    for (const auto& line : *it) {
        if (!line.is_string()) continue;
        const std::string& s = line.get_ref<const std::string&>();
        auto colon = s.find(':');
        if (colon == std::string::npos) continue;
        offer_channel(partial, to_lower(trim(s.substr(0, colon))),
                      normalize_channel_state(s.substr(colon + 1)));
    }
    return partial;
}

// "linkChannel": {"id": "whatsapp", "linked": true}
PartialStatus parse_link_channel(const nlohmann::json& root) {
    PartialStatus partial;
    auto it = root.find("linkChannel");
    if (it == root.end() || !it->is_object()) return partial;

    auto id = it->find("id");
    auto linked = it->find("linked");
    if (id == it->end() || !id->is_string()) return partial;
    if (linked == it->end() || !linked->is_boolean()) return partial;

    offer_channel(partial, to_lower(trim(id->get<std::string>())),
                  linked->get<bool>() ? kStateOk : kStateDown);
    return partial;
}

// Counts outside [0, INT_MAX] are not counts
std::optional<int> json_count(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto n = value.get<std::uint64_t>();
        if (n > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(n);
    }
    if (value.is_number_integer()) {
        auto n = value.get<std::int64_t>();
        if (n < 0 || n > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(n);
    }
    return std::nullopt;
}

// "sessions": {"active"|"count": N} | N, or "sessionCount": N
PartialStatus parse_session_count(const nlohmann::json& root) {
    PartialStatus partial;
    auto sessions = root.find("sessions");
    if (sessions != root.end()) {
        if (sessions->is_object()) {
            if (const auto* count = first_present(*sessions, {"active", "count"})) {
                partial.session_count = json_count(*count);
            }
        } else {
            partial.session_count = json_count(*sessions);
        }
    }
    if (!partial.session_count) {
        auto count = root.find("sessionCount");
        if (count != root.end()) partial.session_count = json_count(*count);
    }
    return partial;
}

struct JsonStrategy {
    const char* shape;
    PartialStatus (*parse)(const nlohmann::json&);
};

// Order is precedence: earlier strategies win resolved fields
const JsonStrategy kJsonStrategies[] = {
    {"gateway", parse_gateway},
    {"channels", parse_channel_list},
    {"channelSummary", parse_channel_summary},
    {"linkChannel", parse_link_channel},
    {"sessions", parse_session_count},
};

// ============================================================================
// Text Strategies
// ============================================================================

// Leading digits of value followed by a word boundary
std::optional<int> leading_count(const std::string& value) {
    size_t i = 0;
    while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) ++i;
    if (i == 0 || i > 9) return std::nullopt;
    if (i < value.size()) {
        unsigned char next = static_cast<unsigned char>(value[i]);
        if (std::isalnum(next) || next == '_') return std::nullopt;
    }
    return std::stoi(value.substr(0, i));
}

PartialStatus parse_labeled_lines(const std::string& text) {
    PartialStatus partial;

    if (auto gateway = find_labeled_value(text, "Gateway")) {
        partial.gateway_ok = is_healthy_gateway_token(*gateway);
    }

    for (const auto& channel : tracked_channels()) {
        for (const auto& label : channel.text_labels) {
            if (auto value = find_labeled_value(text, label)) {
                offer_channel(partial, channel.name, normalize_channel_state(*value));
                break;
            }
        }
    }

    if (auto sessions = find_labeled_value(text, "Sessions")) {
        partial.session_count = leading_count(*sessions);
    }
    return partial;
}

PartialStatus parse_table_rows(const std::string& text) {
    PartialStatus partial;
    for (const auto& channel : tracked_channels()) {
        if (auto state = find_table_state(text, channel.table_label)) {
            offer_channel(partial, channel.name, *state);
        }
    }
    return partial;
}

bool is_state_token(const std::string& cell) {
    if (cell.empty()) return false;
    return std::all_of(cell.begin(), cell.end(),
                       [](char c) { return c >= 'A' && c <= 'Z'; });
}

std::vector<std::string> split_table_cells(const std::string& row) {
    std::vector<std::string> cells;
    size_t pos = 0;
    while (true) {
        size_t next = row.find(kTableBar, pos);
        if (next == std::string::npos) {
            cells.push_back(row.substr(pos));
            break;
        }
        cells.push_back(row.substr(pos, next - pos));
        pos = next + kTableBarLen;
    }
    return cells;
}

} // namespace

// ============================================================================
// Tracked Channels
// ============================================================================

const std::vector<TrackedChannel>& tracked_channels() {
    static const std::vector<TrackedChannel> channels = {
        {"telegram", "TG", {"Telegram", "TG"}, "Telegram"},
        {"whatsapp", "WA", {"WhatsApp", "WA"}, "WhatsApp"},
    };
    return channels;
}

std::string StatusRecord::channel_state(const std::string& name) const {
    auto it = channels.find(name);
    if (it == channels.end() || it->second.empty()) return kStateUnknown;
    return it->second;
}

// ============================================================================
// Normalization
// ============================================================================

std::string normalize_channel_state(const std::string& raw) {
    std::string value = trim(raw);
    if (value.empty()) return kStateUnknown;

    size_t end = 0;
    while (end < value.size() && !std::isspace(static_cast<unsigned char>(value[end]))) ++end;
    std::string word = to_lower(value.substr(0, end));

    static const char* const ok_words[] = {
        "ok", "up", "reachable", "running", "connected", "configured", "linked"};
    static const char* const down_words[] = {
        "down", "error", "missing", "unlinked", "disconnected"};

    for (const char* w : ok_words) {
        if (word == w) return kStateOk;
    }
    for (const char* w : down_words) {
        if (word == w) return kStateDown;
    }
    return to_upper(word);
}

bool is_healthy_gateway_token(const std::string& raw) {
    std::string value = to_lower(trim(raw));
    return value == "ok" || value == "up" || value == "reachable" ||
           value == "running" || value == "true";
}

// ============================================================================
// Partial Records
// ============================================================================

void merge_partial(PartialStatus& into, const PartialStatus& from) {
    if (!into.gateway_ok && from.gateway_ok) {
        into.gateway_ok = from.gateway_ok;
    }
    for (const auto& [name, state] : from.channels) {
        offer_channel(into, name, state);
    }
    if (!into.session_count && from.session_count) {
        into.session_count = from.session_count;
    }
}

StatusRecord finalize_status(const PartialStatus& partial) {
    StatusRecord record;
    record.gateway_ok = partial.gateway_ok.value_or(false);
    record.channels = partial.channels;
    for (const auto& channel : tracked_channels()) {
        if (record.channels.find(channel.name) == record.channels.end()) {
            record.channels[channel.name] = kStateUnknown;
        }
    }
    record.session_count = partial.session_count;
    return record;
}

// ============================================================================
// Parsers
// ============================================================================

std::optional<StatusRecord> parse_status_json(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("status: output is not JSON ({})", e.what());
        return std::nullopt;
    }

    if (!root.is_object()) {
        spdlog::debug("status: JSON output is not an object");
        return std::nullopt;
    }

    PartialStatus merged;
    for (const auto& strategy : kJsonStrategies) {
        try {
            merge_partial(merged, strategy.parse(root));
        } catch (const nlohmann::json::exception& e) {
            spdlog::debug("status: skipping '{}' shape: {}", strategy.shape, e.what());
        }
    }
    return finalize_status(merged);
}

StatusRecord parse_status_text(const std::string& text) {
    PartialStatus merged = parse_labeled_lines(text);
    merge_partial(merged, parse_table_rows(text));
    return finalize_status(merged);
}

std::optional<std::string> find_labeled_value(const std::string& text, const std::string& label) {
    std::string wanted = to_lower(label);
    for (const auto& line : split_lines(text)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (to_lower(trim(line.substr(0, colon))) != wanted) continue;

        std::string value = trim(line.substr(colon + 1));
        if (value.empty()) continue;
        return value;
    }
    return std::nullopt;
}

std::optional<std::string> find_table_state(const std::string& text, const std::string& label) {
    for (const auto& line : split_lines(text)) {
        if (line.compare(0, kTableBarLen, kTableBar) != 0) continue;

        auto cells = split_table_cells(line.substr(kTableBarLen));
        if (cells.size() < 2 || trim(cells[0]) != label) continue;

        // cells[1] is the Enabled column; the final piece follows the
        // closing bar and is never a cell
        for (size_t i = 2; i + 1 < cells.size(); ++i) {
            std::string cell = trim(cells[i]);
            if (is_state_token(cell)) return cell;
        }
    }
    return std::nullopt;
}

std::string render_status(const StatusRecord& record) {
    std::string out = std::string("Gateway ") + (record.gateway_ok ? kStateOk : kStateDown);
    for (const auto& channel : tracked_channels()) {
        out += kSummarySeparator;
        out += channel.short_label + " " + record.channel_state(channel.name);
    }
    if (record.session_count) {
        out += kSummarySeparator;
        out += "Sessions " + std::to_string(*record.session_count);
    }
    return out;
}

} // namespace clawrun
