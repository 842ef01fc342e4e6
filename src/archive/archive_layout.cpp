/**
 * @file archive_layout.cpp
 * @brief Partition key validation and path resolution
 */

#include <vigil/archive/archive_layout.hpp>

#include <vigil/compat/format.hpp>

#include <algorithm>
#include <cctype>

namespace vigil::archive {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

struct file_pattern {
    std::string_view directory;
    std::string_view prefix;
    std::string_view suffix;
};

auto pattern_of(core::entity_type type) -> file_pattern {
    switch (type) {
        case core::entity_type::user:
            return {"users", "", "_users.txt"};
        case core::entity_type::prayer:
            return {"prayers", "", ".txt"};
        case core::entity_type::interaction_mark:
            return {"prayers/marks", "", "_marks.txt"};
        case core::entity_type::interaction_attribute:
            return {"prayers/attributes", "", "_attributes.txt"};
        case core::entity_type::activity_log:
            return {"activity", "activity_", ".txt"};
        case core::entity_type::auth_request:
            return {"auth", "", "_auth_requests.txt"};
        case core::entity_type::auth_approval:
            return {"auth", "", "_auth_approvals.txt"};
        case core::entity_type::session:
            return {"auth", "", "_sessions_snapshot.txt"};
        case core::entity_type::invite_token:
            return {"system", "", ".txt"};
        case core::entity_type::invite_usage:
            return {"system", "", "_invite_usage.txt"};
        case core::entity_type::security_event:
            return {"auth", "", "_security_events.txt"};
        case core::entity_type::notification:
            return {"auth/notifications", "", "_notifications.txt"};
        case core::entity_type::role:
            return {"roles", "", ".txt"};
        case core::entity_type::role_assignment:
            return {"roles", "", "_role_assignments.txt"};
    }
    return {"", "", ""};
}

/// 'd' in @p shape matches one digit, every other character itself
auto matches_shape(std::string_view text, std::string_view shape) -> bool {
    if (text.size() != shape.size()) {
        return false;
    }
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] == 'd') {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                return false;
            }
        } else if (shape[i] != text[i]) {
            return false;
        }
    }
    return true;
}

auto valid_month_digits(std::string_view mm) -> bool {
    int month = (mm[0] - '0') * 10 + (mm[1] - '0');
    return month >= 1 && month <= 12;
}

auto valid_prayer_key(std::string_view key) -> bool {
    // YYYY/MM/YYYY_MM_DD_prayer_at_HHMM[_N]
    constexpr std::string_view shape = "dddd/dd/dddd_dd_dd_prayer_at_dddd";
    if (key.size() < shape.size() || !matches_shape(key.substr(0, shape.size()), shape)) {
        return false;
    }
    if (key.substr(0, 4) != key.substr(8, 4) || key.substr(5, 2) != key.substr(13, 2)) {
        return false;
    }
    if (!valid_month_digits(key.substr(5, 2))) {
        return false;
    }
    auto suffix = key.substr(shape.size());
    if (suffix.empty()) {
        return true;
    }
    if (suffix.size() < 2 || suffix.front() != '_') {
        return false;
    }
    return std::all_of(suffix.begin() + 1, suffix.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

}  // namespace

auto partition_scheme_of(core::entity_type type) noexcept -> partition_scheme {
    switch (type) {
        case core::entity_type::prayer:
            return partition_scheme::per_instance;
        case core::entity_type::session:
            return partition_scheme::daily;
        case core::entity_type::invite_token:
        case core::entity_type::role:
            return partition_scheme::fixed;
        case core::entity_type::user:
        case core::entity_type::interaction_mark:
        case core::entity_type::interaction_attribute:
        case core::entity_type::activity_log:
        case core::entity_type::auth_request:
        case core::entity_type::auth_approval:
        case core::entity_type::invite_usage:
        case core::entity_type::security_event:
        case core::entity_type::notification:
        case core::entity_type::role_assignment:
            return partition_scheme::monthly;
    }
    return partition_scheme::monthly;
}

auto fixed_partition_key(core::entity_type type) noexcept -> std::string_view {
    switch (type) {
        case core::entity_type::invite_token:
            return kInviteTokenPartition;
        case core::entity_type::role:
            return kRoleDefinitionsPartition;
        default:
            return {};
    }
}

auto validate_partition_key(core::entity_type type, std::string_view key) -> VoidResult {
    bool valid = false;
    switch (partition_scheme_of(type)) {
        case partition_scheme::per_instance:
            valid = valid_prayer_key(key);
            break;
        case partition_scheme::monthly:
            valid = matches_shape(key, "dddd_dd") && valid_month_digits(key.substr(5, 2));
            break;
        case partition_scheme::daily:
            valid = matches_shape(key, "dddd_dd_dd") && valid_month_digits(key.substr(5, 2));
            break;
        case partition_scheme::fixed:
            valid = key == fixed_partition_key(type);
            break;
    }

    if (!valid) {
        return make_error<std::monostate>(
            error_codes::invalid_partition_key,
            vigil::compat::format("Invalid partition key '{}' for {}", key,
                                  core::to_string(type)),
            "archive");
    }
    return ok();
}

auto relative_path(core::entity_type type, std::string_view key)
    -> Result<std::filesystem::path> {
    auto valid = validate_partition_key(type, key);
    if (valid.is_err()) {
        return make_error<std::filesystem::path>(valid.error().code,
                                                 valid.error().message, "archive");
    }

    auto pattern = pattern_of(type);
    std::string file_name;
    file_name.reserve(pattern.prefix.size() + key.size() + pattern.suffix.size());
    file_name.append(pattern.prefix).append(key).append(pattern.suffix);
    return std::filesystem::path{std::string{pattern.directory}} / file_name;
}

auto partition_for(core::entity_type type, const archive_time& t) -> std::string {
    auto tp = as_minutes(t);
    auto day_point = std::chrono::floor<std::chrono::days>(tp);
    std::chrono::year_month_day ymd{day_point};
    std::chrono::hh_mm_ss hms{tp - day_point};
    auto y = static_cast<int>(ymd.year());
    auto m = static_cast<unsigned>(ymd.month());
    auto d = static_cast<unsigned>(ymd.day());

    switch (partition_scheme_of(type)) {
        case partition_scheme::per_instance:
            return vigil::compat::format("{:04}/{:02}/{:04}_{:02}_{:02}_prayer_at_{:02}{:02}",
                                         y, m, y, m, d, hms.hours().count(),
                                         hms.minutes().count());
        case partition_scheme::daily:
            return vigil::compat::format("{:04}_{:02}_{:02}", y, m, d);
        case partition_scheme::fixed:
            return std::string{fixed_partition_key(type)};
        case partition_scheme::monthly:
            break;
    }
    return vigil::compat::format("{:04}_{:02}", y, m);
}

auto partition_month(core::entity_type type, std::string_view key)
    -> std::optional<std::chrono::year_month> {
    if (validate_partition_key(type, key).is_err()) {
        return std::nullopt;
    }
    auto scheme = partition_scheme_of(type);
    if (scheme != partition_scheme::monthly && scheme != partition_scheme::daily) {
        return std::nullopt;
    }
    int y = std::stoi(std::string{key.substr(0, 4)});
    auto m = static_cast<unsigned>(std::stoi(std::string{key.substr(5, 2)}));
    return std::chrono::year{y} / std::chrono::month{m};
}

auto partition_key_of(core::entity_type type, const std::filesystem::path& relative)
    -> std::optional<std::string> {
    auto pattern = pattern_of(type);
    auto generic = relative.generic_string();

    std::string directory = std::string{pattern.directory} + "/";
    if (generic.rfind(directory, 0) != 0) {
        return std::nullopt;
    }
    auto rest = std::string_view{generic}.substr(directory.size());

    if (rest.size() < pattern.prefix.size() + pattern.suffix.size() ||
        rest.substr(0, pattern.prefix.size()) != pattern.prefix ||
        rest.substr(rest.size() - pattern.suffix.size()) != pattern.suffix) {
        return std::nullopt;
    }
    auto key = rest.substr(pattern.prefix.size(),
                           rest.size() - pattern.prefix.size() - pattern.suffix.size());
    if (validate_partition_key(type, key).is_err()) {
        return std::nullopt;
    }
    return std::string{key};
}

auto is_temp_file(const std::filesystem::path& path) -> bool {
    auto name = path.filename().string();
    return name.find(".tmp.") != std::string::npos ||
           (name.size() > 4 && name.compare(name.size() - 4, 4, ".tmp") == 0);
}

auto list_partitions(const std::filesystem::path& root, core::entity_type type)
    -> Result<std::vector<std::filesystem::path>> {
    std::vector<std::filesystem::path> partitions;
    auto pattern = pattern_of(type);
    auto directory = root / std::string{pattern.directory};

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return partitions;
    }

    auto consider = [&](const std::filesystem::path& file) {
        if (is_temp_file(file)) {
            return;
        }
        auto relative = std::filesystem::path{std::string{pattern.directory}} /
                        file.lexically_relative(directory);
        if (partition_key_of(type, relative)) {
            partitions.push_back(file);
        }
    };

    if (partition_scheme_of(type) == partition_scheme::per_instance) {
        for (auto it = std::filesystem::recursive_directory_iterator(directory, ec);
             !ec && it != std::filesystem::recursive_directory_iterator();
             it.increment(ec)) {
            if (it->is_regular_file()) {
                consider(it->path());
            }
        }
    } else {
        for (auto it = std::filesystem::directory_iterator(directory, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file()) {
                consider(it->path());
            }
        }
    }

    if (ec) {
        return make_error<std::vector<std::filesystem::path>>(
            error_codes::archive_io_error,
            vigil::compat::format("Failed to enumerate {}: {}", directory.string(),
                                  ec.message()),
            "archive");
    }

    std::sort(partitions.begin(), partitions.end(),
              [](const auto& a, const auto& b) {
                  return a.generic_string() < b.generic_string();
              });
    return partitions;
}

}  // namespace vigil::archive
