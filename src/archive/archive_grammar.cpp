/**
 * @file archive_grammar.cpp
 * @brief Rendering and parsing of every archive file format
 */

#include <vigil/archive/archive_grammar.hpp>

#include <vigil/archive/archive_layout.hpp>
#include <vigil/compat/format.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace vigil::archive {

using core::entity_type;
using kcenon::common::make_error;

namespace {

constexpr std::string_view kFieldSeparator = " - ";

constexpr std::string_view kGeneratedMarker = "Generated Prayer:";
constexpr std::string_view kActivityMarker = "Activity:";
constexpr char kBlockEscape = '\\';

constexpr std::initializer_list<time_format> kHumanFallbacks = {
    time_format::human, time_format::human_abbreviated, time_format::iso_8601,
    time_format::sql_datetime};

constexpr std::initializer_list<time_format> kPipeFallbacks = {
    time_format::iso_8601, time_format::sql_datetime, time_format::human};

// =============================================================================
// Pipe-delimited layouts
// =============================================================================

enum class column { time, subject, actor, subject_actor, action, extra };

struct pipe_layout {
    std::string_view title;
    std::string_view format;
    std::vector<column> columns;
    std::string_view fixed_action;  ///< set when the file has no action column
};

auto layout_of(entity_type type) -> const pipe_layout* {
    using enum column;
    static const pipe_layout marks{"Prayer Marks", "timestamp|prayer_id|user_id",
                                   {time, subject, actor}, "prayed"};
    static const pipe_layout attributes{
        "Prayer Attributes", "timestamp|prayer_id|attribute_name|attribute_value|user_id",
        {time, subject, action, extra, actor}, ""};
    static const pipe_layout auth_requests{
        "Authentication Requests",
        "timestamp|user_id|device_info|ip_address|status|details",
        {time, subject_actor, extra, extra, action, extra}, ""};
    static const pipe_layout auth_approvals{
        "Authentication Approvals", "timestamp|auth_request_id|approver_user_id|action|details",
        {time, subject, actor, action, extra}, ""};
    static const pipe_layout security_events{
        "Security Events", "timestamp|event_type|user_id|ip_address|user_agent|details",
        {time, action, subject_actor, extra, extra, extra}, ""};
    static const pipe_layout notifications{
        "Notification Events",
        "timestamp|user_id|auth_request_id|notification_type|action|details",
        {time, actor, subject, extra, action, extra}, ""};
    static const pipe_layout invite_usage{
        "Invite Token Usage", "timestamp|token|used_by_user|created_by_user|action",
        {time, subject, actor, extra, action}, ""};
    static const pipe_layout sessions{
        "Session Snapshot",
        "session_id|user_id|created_at|expires_at|device_info|ip_address|is_fully_authenticated",
        {subject, actor, time, extra, extra, extra, extra}, "active"};
    static const pipe_layout role_assignments{
        "Role Assignments", "timestamp|user_id|role_name|action|granted_by|expires_at|details",
        {time, subject, extra, action, actor, extra, extra}, ""};

    switch (type) {
        case entity_type::interaction_mark:
            return &marks;
        case entity_type::interaction_attribute:
            return &attributes;
        case entity_type::auth_request:
            return &auth_requests;
        case entity_type::auth_approval:
            return &auth_approvals;
        case entity_type::security_event:
            return &security_events;
        case entity_type::notification:
            return &notifications;
        case entity_type::invite_usage:
            return &invite_usage;
        case entity_type::session:
            return &sessions;
        case entity_type::role_assignment:
            return &role_assignments;
        case entity_type::user:
        case entity_type::prayer:
        case entity_type::activity_log:
        case entity_type::invite_token:
        case entity_type::role:
            return nullptr;
    }
    return nullptr;
}

constexpr std::string_view kInviteTokenFormat =
    "token|created_by_user|expires_at|used|used_by_user_id|created_at";

constexpr std::string_view kRoleDefinitionFormat =
    "role_name|description|permissions_json|is_system_role|created_by";

/// Split on '|' into at most @p max_fields; the last field keeps the remainder
auto split_fields(std::string_view text, std::size_t max_fields)
    -> std::vector<std::string> {
    std::vector<std::string> fields;
    while (fields.size() + 1 < max_fields) {
        auto pos = text.find('|');
        if (pos == std::string_view::npos) {
            break;
        }
        fields.emplace_back(text.substr(0, pos));
        text.remove_prefix(pos + 1);
    }
    fields.emplace_back(text);
    return fields;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto unparsed(std::size_t line_number, std::string_view line, std::string reason)
    -> parsed_event {
    return parsed_event{line_number, unparsed_line{std::string{line}, std::move(reason)}};
}

auto month_title(entity_type type, std::string_view key) -> std::string {
    auto ym = partition_month(type, key);
    if (!ym) {
        return std::string{key};
    }
    return format_month_title(*ym);
}

auto render_pipe_row(const pipe_layout& layout, const ledger_entry& entry) -> std::string {
    auto extra_count = static_cast<std::size_t>(
        std::count(layout.columns.begin(), layout.columns.end(), column::extra));
    std::vector<std::string> extras;
    if (extra_count > 0) {
        extras = split_fields(entry.detail, extra_count);
        extras.resize(extra_count);
    }

    std::string row;
    std::size_t next_extra = 0;
    for (std::size_t i = 0; i < layout.columns.size(); ++i) {
        if (i > 0) {
            row += '|';
        }
        bool last = i + 1 == layout.columns.size();
        switch (layout.columns[i]) {
            case column::time:
                // A minute reading stays a minute reading: no invented ":00"
                row += precision_of(entry.occurred_at) == time_precision::minute
                           ? format_iso(entry.occurred_at).substr(0, 16)
                           : format_iso(entry.occurred_at);
                break;
            case column::subject:
                row += sanitize_field(entry.subject_id);
                break;
            case column::actor:
                row += sanitize_field(entry.actor);
                break;
            case column::subject_actor:
                row += sanitize_field(entry.subject_id.empty() ? entry.actor
                                                               : entry.subject_id);
                break;
            case column::action:
                row += sanitize_field(entry.action);
                break;
            case column::extra: {
                auto& value = extras[next_extra++];
                row += last ? value : sanitize_field(value);
                break;
            }
        }
    }
    return row;
}

auto parse_pipe_row(const pipe_layout& layout, entity_type type, std::string_view line,
                    std::size_t line_number) -> parsed_event {
    auto fields = split_fields(line, layout.columns.size());
    if (fields.size() != layout.columns.size()) {
        return unparsed(line_number, line,
                        vigil::compat::format("expected {} fields, found {}",
                                              layout.columns.size(), fields.size()));
    }

    ledger_entry entry;
    entry.type = type;
    entry.action = std::string{layout.fixed_action};
    std::string detail;
    std::size_t extras_seen = 0;
    bool have_time = false;

    for (std::size_t i = 0; i < fields.size(); ++i) {
        auto& value = fields[i];
        switch (layout.columns[i]) {
            case column::time: {
                auto parsed = parse_with_fallbacks(value, kPipeFallbacks);
                if (!parsed) {
                    return unparsed(line_number, line,
                                    vigil::compat::format("unrecognized timestamp '{}'", value));
                }
                entry.occurred_at = *parsed;
                have_time = true;
                break;
            }
            case column::subject:
                entry.subject_id = value;
                break;
            case column::actor:
                entry.actor = value;
                break;
            case column::subject_actor:
                entry.subject_id = value;
                entry.actor = value;
                break;
            case column::action:
                entry.action = value;
                break;
            case column::extra:
                if (extras_seen++ > 0) {
                    detail += '|';
                }
                detail += value;
                break;
        }
    }

    // Padding written for absent trailing extras is not part of the detail
    while (!detail.empty() && detail.back() == '|') {
        detail.pop_back();
    }
    entry.detail = std::move(detail);

    if (!have_time || entry.action.empty()) {
        return unparsed(line_number, line, "missing timestamp or action");
    }
    return parsed_event{line_number, std::move(entry)};
}

// =============================================================================
// Prayer file blocks
// =============================================================================

/// Body lines that would read as a section marker, or as an escape, get a leading '\\'
auto needs_block_escape(std::string_view line) -> bool {
    return line == kGeneratedMarker || line == kActivityMarker ||
           (!line.empty() && line.front() == kBlockEscape);
}

auto escape_block(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    while (true) {
        auto end = text.find('\n');
        auto line = text.substr(0, end);
        if (needs_block_escape(line)) {
            out += kBlockEscape;
        }
        out += line;
        if (end == std::string_view::npos) {
            break;
        }
        out += '\n';
        text.remove_prefix(end + 1);
    }
    return out;
}

/// Inverse of escape_block for one line; unescaped legacy lines pass through
auto unescape_block_line(std::string_view line) -> std::string {
    if (!line.empty() && line.front() == kBlockEscape &&
        needs_block_escape(line.substr(1))) {
        line.remove_prefix(1);
    }
    return std::string{line};
}

// =============================================================================
// Human-readable lines
// =============================================================================

/// Actions are single words so a display name may contain spaces
auto action_token(std::string_view action) -> std::string {
    auto out = sanitize_field(action);
    for (auto& c : out) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }
    return out;
}

/// Splits "<actor> <action>" at the last space; false when either side is empty
auto split_actor_action(std::string_view head, std::string& actor, std::string& action)
    -> bool {
    auto space = head.rfind(' ');
    if (space == std::string_view::npos || space == 0 || space + 1 == head.size()) {
        return false;
    }
    actor = std::string{head.substr(0, space)};
    action = std::string{head.substr(space + 1)};
    return true;
}

auto render_user_line(const user_registered& user) -> std::string {
    if (user.invited_by.empty()) {
        return vigil::compat::format("{} - {} joined directly", format_human(user.joined_at),
                                     sanitize_field(user.display_name));
    }
    return vigil::compat::format("{} - {} joined on invitation from {}",
                                 format_human(user.joined_at),
                                 sanitize_field(user.display_name),
                                 sanitize_field(user.invited_by));
}

auto render_activity_log_line(const ledger_entry& entry) -> std::string {
    auto line = vigil::compat::format("{} - {} {}", format_clock(entry.occurred_at),
                                      sanitize_field(entry.actor), action_token(entry.action));
    if (!entry.detail.empty()) {
        line += vigil::compat::format(" ({})", sanitize_field(entry.detail));
    }
    return line;
}

struct activity_phrase {
    std::string_view action;
    std::string_view suffix;
};

constexpr std::array<activity_phrase, 5> kFixedPhrases = {{
    {"prayed", " prayed this prayer"},
    {"answered", " marked this prayer as answered"},
    {"archived", " archived this prayer"},
    {"restored", " restored this prayer"},
    {"flagged", " flagged this prayer"},
}};

constexpr std::string_view kTestimonyPhrase = " added testimony: ";

/// Actor and verb phrase of a prayer Activity line, after the timestamp
auto parse_activity_phrase(std::string_view rest, prayer_activity& activity) -> bool {
    for (const auto& phrase : kFixedPhrases) {
        if (rest.size() > phrase.suffix.size() && rest.ends_with(phrase.suffix)) {
            activity.actor = std::string{rest.substr(0, rest.size() - phrase.suffix.size())};
            activity.action = std::string{phrase.action};
            return true;
        }
    }

    if (auto pos = rest.find(kTestimonyPhrase); pos != std::string_view::npos && pos > 0) {
        activity.actor = std::string{rest.substr(0, pos)};
        activity.action = "testimony";
        activity.detail = std::string{rest.substr(pos + kTestimonyPhrase.size())};
        return true;
    }

    auto head = rest;
    if (auto colon = rest.find(": "); colon != std::string_view::npos) {
        activity.detail = std::string{rest.substr(colon + 2)};
        head = rest.substr(0, colon);
    }
    return split_actor_action(head, activity.actor, activity.action);
}

// =============================================================================
// Parsers
// =============================================================================

class user_parser final : public line_parser {
public:
    auto feed(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> override {
        if (trim(line).empty()) {
            return std::nullopt;
        }
        if (line_number == 1 && line.starts_with("User Registrations for ")) {
            return std::nullopt;
        }

        auto sep = line.find(kFieldSeparator);
        if (sep == std::string_view::npos) {
            return unparsed(line_number, line, "missing ' - ' separator");
        }
        auto when = parse_with_fallbacks(line.substr(0, sep), kHumanFallbacks);
        if (!when) {
            return unparsed(line_number, line, "unrecognized timestamp");
        }

        auto rest = line.substr(sep + kFieldSeparator.size());
        user_registered user;
        user.joined_at = *when;

        constexpr std::string_view direct = " joined directly";
        constexpr std::string_view invited = " joined on invitation from ";
        if (rest.ends_with(direct)) {
            user.display_name = std::string{rest.substr(0, rest.size() - direct.size())};
        } else if (auto pos = rest.find(invited); pos != std::string_view::npos) {
            user.display_name = std::string{rest.substr(0, pos)};
            user.invited_by = std::string{rest.substr(pos + invited.size())};
        } else {
            return unparsed(line_number, line, "unrecognized registration line");
        }

        if (user.display_name.empty()) {
            return unparsed(line_number, line, "empty display name");
        }
        return parsed_event{line_number, std::move(user)};
    }

    auto finish() -> std::optional<parsed_event> override { return std::nullopt; }
};

class prayer_parser final : public line_parser {
public:
    auto feed(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> override {
        last_line_ = line_number;
        switch (section_) {
            case section::header:
                return feed_header(line, line_number);
            case section::body:
                if (line == kGeneratedMarker) {
                    section_ = section::generated;
                    return std::nullopt;
                }
                if (line == kActivityMarker) {
                    return enter_activity(line_number);
                }
                body_.push_back(unescape_block_line(line));
                return std::nullopt;
            case section::generated:
                if (line == kActivityMarker) {
                    return enter_activity(line_number);
                }
                generated_.push_back(unescape_block_line(line));
                return std::nullopt;
            case section::activity:
                return feed_activity(line, line_number);
        }
        return std::nullopt;
    }

    auto finish() -> std::optional<parsed_event> override {
        if (section_ == section::activity || last_line_ == 0) {
            return std::nullopt;
        }
        // File truncated before its Activity section
        section_ = section::activity;
        return take_submission(last_line_);
    }

private:
    enum class section { header, body, generated, activity };

    auto feed_header(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> {
        if (line_number == 1) {
            constexpr std::string_view prefix = "Prayer ";
            auto by = line.find(" by ");
            if (!line.starts_with(prefix) || by == std::string_view::npos ||
                by <= prefix.size()) {
                header_valid_ = false;
                return unparsed(line_number, line, "malformed prayer header");
            }
            prayer_.prayer_id = std::string{line.substr(prefix.size(), by - prefix.size())};
            prayer_.author = std::string{line.substr(by + 4)};
            return std::nullopt;
        }

        if (trim(line).empty()) {
            section_ = section::body;
            return std::nullopt;
        }
        if (line.starts_with("Submitted ")) {
            auto when = parse_with_fallbacks(line.substr(10), kHumanFallbacks);
            if (!when) {
                header_valid_ = false;
                return unparsed(line_number, line, "unrecognized submission timestamp");
            }
            prayer_.submitted_at = *when;
            have_submitted_ = true;
            return std::nullopt;
        }
        if (line.starts_with("Project: ")) {
            prayer_.project_tag = std::string{line.substr(9)};
            return std::nullopt;
        }
        if (line.starts_with("Audience: ")) {
            prayer_.target_audience = std::string{line.substr(10)};
            return std::nullopt;
        }
        return unparsed(line_number, line, "unexpected line in prayer header");
    }

    auto enter_activity(std::size_t line_number) -> std::optional<parsed_event> {
        section_ = section::activity;
        return take_submission(line_number);
    }

    auto take_submission(std::size_t line_number) -> std::optional<parsed_event> {
        if (!header_valid_) {
            return std::nullopt;
        }
        if (!have_submitted_) {
            header_valid_ = false;
            return unparsed(line_number, "", "prayer header without submission time");
        }
        prayer_.text = join_block(body_);
        prayer_.generated_prayer = join_block(generated_);
        return parsed_event{line_number, prayer_};
    }

    auto feed_activity(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> {
        if (trim(line).empty()) {
            return std::nullopt;
        }
        if (prayer_.prayer_id.empty()) {
            return unparsed(line_number, line, "activity without a prayer header");
        }

        auto sep = line.find(kFieldSeparator);
        if (sep == std::string_view::npos) {
            return unparsed(line_number, line, "missing ' - ' separator");
        }
        auto when = parse_with_fallbacks(line.substr(0, sep), kHumanFallbacks);
        if (!when) {
            return unparsed(line_number, line, "unrecognized timestamp");
        }

        prayer_activity activity;
        activity.prayer_id = prayer_.prayer_id;
        activity.occurred_at = *when;
        if (!parse_activity_phrase(line.substr(sep + kFieldSeparator.size()), activity)) {
            return unparsed(line_number, line, "unrecognized activity phrase");
        }
        return parsed_event{line_number, std::move(activity)};
    }

    /// Joins a block, dropping the one blank line that separates it from the next section
    static auto join_block(std::vector<std::string>& lines) -> std::string {
        if (!lines.empty() && lines.back().empty()) {
            lines.pop_back();
        }
        std::string text;
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                text += '\n';
            }
            text += lines[i];
        }
        return text;
    }

    section section_{section::header};
    prayer_submitted prayer_;
    bool header_valid_{true};
    bool have_submitted_{false};
    std::vector<std::string> body_;
    std::vector<std::string> generated_;
    std::size_t last_line_{0};
};

class activity_log_parser final : public line_parser {
public:
    auto feed(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> override {
        if (trim(line).empty()) {
            return std::nullopt;
        }
        if (line_number == 1 && line.starts_with("Activity for ")) {
            return std::nullopt;
        }
        if (auto day = parse_human_date(line)) {
            current_day_ = *day;
            return std::nullopt;
        }

        auto sep = line.find(kFieldSeparator);
        if (sep == std::string_view::npos) {
            return unparsed(line_number, line, "missing ' - ' separator");
        }
        auto clock = parse_clock(trim(line.substr(0, sep)));
        if (!clock) {
            return unparsed(line_number, line, "unrecognized time of day");
        }
        if (!current_day_) {
            return unparsed(line_number, line, "entry before any date header");
        }

        auto rest = line.substr(sep + kFieldSeparator.size());
        ledger_entry entry;
        entry.type = entity_type::activity_log;
        if (rest.ends_with(')')) {
            if (auto open = rest.find(" ("); open != std::string_view::npos) {
                entry.detail = std::string{rest.substr(open + 2, rest.size() - open - 3)};
                rest = rest.substr(0, open);
            }
        }
        if (!split_actor_action(rest, entry.actor, entry.action)) {
            return unparsed(line_number, line, "missing actor or action");
        }
        entry.occurred_at = minute_time{*current_day_ + *clock};
        return parsed_event{line_number, std::move(entry)};
    }

    auto finish() -> std::optional<parsed_event> override { return std::nullopt; }

private:
    std::optional<std::chrono::sys_days> current_day_;
};

class pipe_log_parser final : public line_parser {
public:
    pipe_log_parser(entity_type type, const pipe_layout& layout)
        : type_(type), layout_(layout) {}

    auto feed(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> override {
        auto content = trim(line);
        if (content.empty() || content.starts_with('#') || content.starts_with("Format:")) {
            return std::nullopt;
        }
        if (line_number == 1 && content.find('|') == std::string_view::npos) {
            return std::nullopt;
        }
        return parse_pipe_row(layout_, type_, content, line_number);
    }

    auto finish() -> std::optional<parsed_event> override { return std::nullopt; }

private:
    entity_type type_;
    const pipe_layout& layout_;
};

class session_snapshot_parser final : public line_parser {
public:
    explicit session_snapshot_parser(const pipe_layout& layout) : layout_(layout) {}

    auto feed(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> override {
        auto content = trim(line);
        if (content.empty() || content.starts_with("Format:") ||
            content.starts_with("Session Snapshot for ") ||
            content.starts_with("Total active sessions:")) {
            return std::nullopt;
        }
        return parse_pipe_row(layout_, entity_type::session, content, line_number);
    }

    auto finish() -> std::optional<parsed_event> override { return std::nullopt; }

private:
    const pipe_layout& layout_;
};

class invite_token_parser final : public line_parser {
public:
    auto feed(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> override {
        auto content = trim(line);
        if (content.empty() || content.starts_with("Format:") ||
            content.starts_with("Active Invite Tokens") || content == "ACTIVE TOKENS:" ||
            content == "RECENTLY EXPIRED TOKENS:" || content.starts_with("Active tokens:") ||
            content.starts_with("Total tokens:")) {
            return std::nullopt;
        }

        auto fields = split_fields(content, 6);
        if (fields.size() != 6) {
            return unparsed(line_number, line, "expected 6 fields");
        }

        invite_token_state token;
        token.token = fields[0];
        token.created_by = fields[1];
        token.expires_at = fields[2];
        token.used_by = fields[4];
        token.created_at = fields[5];

        const auto& used = fields[3];
        if (used == "True" || used == "true" || used == "1") {
            token.used = true;
        } else if (used == "False" || used == "false" || used == "0") {
            token.used = false;
        } else {
            return unparsed(line_number, line,
                            vigil::compat::format("unrecognized used flag '{}'", used));
        }

        if (token.token.empty()) {
            return unparsed(line_number, line, "empty token");
        }
        return parsed_event{line_number, std::move(token)};
    }

    auto finish() -> std::optional<parsed_event> override { return std::nullopt; }
};

/// Reads the first two and last two columns from the ends; permissions keep any '|'
class role_definition_parser final : public line_parser {
public:
    auto feed(std::string_view line, std::size_t line_number)
        -> std::optional<parsed_event> override {
        auto content = trim(line);
        if (content.empty() || content.starts_with('#') || content.starts_with("Format:") ||
            content.starts_with("Role Definitions") || content.starts_with("Total roles:")) {
            return std::nullopt;
        }

        auto first = content.find('|');
        auto second = first == std::string_view::npos ? first : content.find('|', first + 1);
        auto last = content.rfind('|');
        auto before_last = last == std::string_view::npos || last == 0
                               ? std::string_view::npos
                               : content.rfind('|', last - 1);
        if (second == std::string_view::npos || before_last == std::string_view::npos ||
            before_last <= second) {
            return unparsed(line_number, line, "expected 5 fields");
        }

        role_definition role;
        role.name = trim(content.substr(0, first));
        role.description = content.substr(first + 1, second - first - 1);
        role.permissions = content.substr(second + 1, before_last - second - 1);
        role.created_by = trim(content.substr(last + 1));

        std::string flag{trim(content.substr(before_last + 1, last - before_last - 1))};
        std::transform(flag.begin(), flag.end(), flag.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (flag == "true" || flag == "1") {
            role.is_system_role = true;
        } else if (flag == "false" || flag == "0") {
            role.is_system_role = false;
        } else {
            return unparsed(line_number, line,
                            vigil::compat::format("unrecognized system role flag '{}'", flag));
        }

        if (role.name.empty()) {
            return unparsed(line_number, line, "empty role name");
        }
        return parsed_event{line_number, std::move(role)};
    }

    auto finish() -> std::optional<parsed_event> override { return std::nullopt; }
};

auto type_mismatch(entity_type type, std::string_view expected) -> Result<std::string> {
    return make_error<std::string>(
        error_codes::invalid_argument,
        vigil::compat::format("{} archives take {} events", core::to_string(type), expected),
        "archive");
}

}  // namespace

// =============================================================================
// Rendering
// =============================================================================

auto sanitize_field(std::string_view value) -> std::string {
    std::string out{value};
    for (auto& c : out) {
        if (c == '|') {
            c = '_';
        } else if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return out;
}

auto file_header(entity_type type, std::string_view partition_key) -> std::string {
    switch (type) {
        case entity_type::user:
            return vigil::compat::format("User Registrations for {}\n\n",
                                         month_title(type, partition_key));
        case entity_type::activity_log:
            return vigil::compat::format("Activity for {}\n\n",
                                         month_title(type, partition_key));
        case entity_type::interaction_mark:
        case entity_type::interaction_attribute:
        case entity_type::auth_request:
        case entity_type::auth_approval:
        case entity_type::security_event:
        case entity_type::notification:
        case entity_type::invite_usage:
        case entity_type::role_assignment: {
            const auto* layout = layout_of(type);
            return vigil::compat::format("{} for {}\nFormat: {}\n\n", layout->title,
                                         month_title(type, partition_key), layout->format);
        }
        case entity_type::prayer:
        case entity_type::session:
        case entity_type::invite_token:
        case entity_type::role:
            return {};
    }
    return {};
}

auto render_append(entity_type type, std::string_view partition_key,
                   const archive_event& event, const append_context& context)
    -> Result<std::string> {
    std::string text;
    if (context.file_empty) {
        text = file_header(type, partition_key);
    }

    switch (type) {
        case entity_type::user: {
            const auto* user = std::get_if<user_registered>(&event);
            if (user == nullptr) {
                return type_mismatch(type, "user_registered");
            }
            text += render_user_line(*user);
            break;
        }
        case entity_type::prayer: {
            const auto* activity = std::get_if<prayer_activity>(&event);
            if (activity == nullptr) {
                return type_mismatch(type, "prayer_activity");
            }
            text += render_prayer_activity(*activity);
            break;
        }
        case entity_type::activity_log: {
            const auto* entry = std::get_if<ledger_entry>(&event);
            if (entry == nullptr || entry->type != type) {
                return type_mismatch(type, "activity_log ledger");
            }
            auto day = std::chrono::floor<std::chrono::days>(as_minutes(entry->occurred_at));
            if (context.last_date_header != day) {
                text += vigil::compat::format("\n{}\n", format_human_date(day));
            }
            text += render_activity_log_line(*entry);
            break;
        }
        case entity_type::interaction_mark:
        case entity_type::interaction_attribute:
        case entity_type::auth_request:
        case entity_type::auth_approval:
        case entity_type::security_event:
        case entity_type::notification:
        case entity_type::invite_usage:
        case entity_type::role_assignment: {
            const auto* entry = std::get_if<ledger_entry>(&event);
            if (entry == nullptr || entry->type != type) {
                return type_mismatch(type, "matching ledger");
            }
            text += render_pipe_row(*layout_of(type), *entry);
            break;
        }
        case entity_type::session:
        case entity_type::invite_token:
        case entity_type::role:
            return make_error<std::string>(
                error_codes::invalid_argument,
                vigil::compat::format("{} archives are snapshots and cannot be appended",
                                      core::to_string(type)),
                "archive");
    }

    text += '\n';
    return text;
}

auto render_prayer_file(const prayer_submitted& prayer) -> std::string {
    std::string text;
    text += vigil::compat::format("Prayer {} by {}\n", sanitize_field(prayer.prayer_id),
                                  sanitize_field(prayer.author));
    text += vigil::compat::format("Submitted {}\n", format_human(prayer.submitted_at));
    if (!prayer.project_tag.empty()) {
        text += vigil::compat::format("Project: {}\n", sanitize_field(prayer.project_tag));
    }
    if (!prayer.target_audience.empty()) {
        text += vigil::compat::format("Audience: {}\n",
                                      sanitize_field(prayer.target_audience));
    }
    text += '\n';
    text += escape_block(prayer.text);
    text += "\n\n";
    if (!prayer.generated_prayer.empty()) {
        text += vigil::compat::format("{}\n", kGeneratedMarker);
        text += escape_block(prayer.generated_prayer);
        text += "\n\n";
    }
    text += vigil::compat::format("{}\n", kActivityMarker);
    return text;
}

auto render_prayer_activity(const prayer_activity& activity) -> std::string {
    auto stamp = format_human(activity.occurred_at);
    auto actor = sanitize_field(activity.actor);

    for (const auto& phrase : kFixedPhrases) {
        if (activity.action == phrase.action) {
            return vigil::compat::format("{} - {}{}", stamp, actor, phrase.suffix);
        }
    }
    if (activity.action == "testimony") {
        return vigil::compat::format("{} - {}{}{}", stamp, actor, kTestimonyPhrase,
                                     sanitize_field(activity.detail));
    }

    auto line = vigil::compat::format("{} - {} {}", stamp, actor, action_token(activity.action));
    if (!activity.detail.empty()) {
        line += ": ";
        line += sanitize_field(activity.detail);
    }
    return line;
}

auto render_session_snapshot(const std::vector<ledger_entry>& sessions,
                             const archive_time& taken_at) -> std::string {
    const auto* layout = layout_of(entity_type::session);
    std::string text = vigil::compat::format("Session Snapshot for {}\nFormat: {}\n\n",
                                             format_snapshot_stamp(taken_at),
                                             layout->format);
    for (const auto& session : sessions) {
        text += render_pipe_row(*layout, session);
        text += '\n';
    }
    text += vigil::compat::format("\nTotal active sessions: {}", sessions.size());
    return text;
}

auto render_invite_tokens(const std::vector<invite_token_state>& tokens,
                          const archive_time& now) -> std::string {
    auto is_active = [&](const invite_token_state& token) {
        if (token.used) {
            return false;
        }
        if (token.expires_at.empty()) {
            return true;
        }
        auto expires = parse_with_fallbacks(token.expires_at, kPipeFallbacks);
        return !expires || as_seconds(*expires) > as_seconds(now);
    };

    auto row = [](const invite_token_state& token) {
        return vigil::compat::format("{}|{}|{}|{}|{}|{}\n", sanitize_field(token.token),
                                     sanitize_field(token.created_by),
                                     sanitize_field(token.expires_at),
                                     token.used ? "True" : "False",
                                     sanitize_field(token.used_by),
                                     sanitize_field(token.created_at));
    };

    std::string active;
    std::string inactive;
    std::size_t active_count = 0;
    for (const auto& token : tokens) {
        if (is_active(token)) {
            active += row(token);
            ++active_count;
        } else {
            inactive += row(token);
        }
    }

    return vigil::compat::format(
        "Active Invite Tokens - Updated {}\nFormat: {}\n\nACTIVE TOKENS:\n{}\n"
        "RECENTLY EXPIRED TOKENS:\n{}\nActive tokens: {}\nTotal tokens: {}",
        format_snapshot_stamp(now), kInviteTokenFormat, active, inactive, active_count,
        tokens.size());
}

auto render_role_definitions(const std::vector<role_definition>& roles,
                             const archive_time& now) -> std::string {
    std::string text = vigil::compat::format("Role Definitions - Updated {}\nFormat: {}\n\n",
                                             format_snapshot_stamp(now), kRoleDefinitionFormat);
    for (const auto& role : roles) {
        std::string permissions{role.permissions};
        std::replace_if(permissions.begin(), permissions.end(),
                        [](char c) { return c == '\n' || c == '\r'; }, ' ');
        text += vigil::compat::format("{}|{}|{}|{}|{}\n", sanitize_field(role.name),
                                      sanitize_field(role.description), permissions,
                                      role.is_system_role ? "True" : "False",
                                      sanitize_field(role.created_by));
    }
    text += vigil::compat::format("\nTotal roles: {}", roles.size());
    return text;
}

auto scan_last_date_header(std::string_view content)
    -> std::optional<std::chrono::sys_days> {
    std::optional<std::chrono::sys_days> last;
    while (!content.empty()) {
        auto end = content.find('\n');
        auto line = content.substr(0, end);
        if (!line.empty() && line.size() <= 24) {
            if (auto day = parse_human_date(line)) {
                last = day;
            }
        }
        if (end == std::string_view::npos) {
            break;
        }
        content.remove_prefix(end + 1);
    }
    return last;
}

// =============================================================================
// Parsing
// =============================================================================

auto make_line_parser(entity_type type) -> std::unique_ptr<line_parser> {
    switch (type) {
        case entity_type::user:
            return std::make_unique<user_parser>();
        case entity_type::prayer:
            return std::make_unique<prayer_parser>();
        case entity_type::activity_log:
            return std::make_unique<activity_log_parser>();
        case entity_type::invite_token:
            return std::make_unique<invite_token_parser>();
        case entity_type::role:
            return std::make_unique<role_definition_parser>();
        case entity_type::session:
            return std::make_unique<session_snapshot_parser>(*layout_of(type));
        case entity_type::interaction_mark:
        case entity_type::interaction_attribute:
        case entity_type::auth_request:
        case entity_type::auth_approval:
        case entity_type::security_event:
        case entity_type::notification:
        case entity_type::invite_usage:
        case entity_type::role_assignment:
            return std::make_unique<pipe_log_parser>(type, *layout_of(type));
    }
    return nullptr;
}

}  // namespace vigil::archive
