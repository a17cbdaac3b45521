#include "hatch/types.hpp"
#include "hatch/store.hpp"

#include <algorithm>
#include <cctype>

namespace hatch {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<OverwritePolicy> parse_overwrite_policy(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "always") return OverwritePolicy::Always;
    if (lower == "if_newer_version") return OverwritePolicy::IfNewerVersion;
    return std::nullopt;
}

std::optional<RollbackPolicy> parse_rollback_policy(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "delete_key") return RollbackPolicy::DeleteWholeKeyOnUninstall;
    if (lower == "delete_value") return RollbackPolicy::DeleteValueOnUninstall;
    if (lower == "leave") return RollbackPolicy::LeaveInPlaceOnUninstall;
    return std::nullopt;
}

std::optional<WriteMode> parse_write_mode(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "overwrite") return WriteMode::Overwrite;
    if (lower == "append_member") return WriteMode::AppendListMember;
    return std::nullopt;
}

std::optional<ShortcutLocation> parse_shortcut_location(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "start_menu") return ShortcutLocation::StartMenu;
    if (lower == "desktop") return ShortcutLocation::Desktop;
    return std::nullopt;
}

bool same_mutation(const RegistryOperation& a, const RegistryOperation& b) {
    return key_path_equal(a.path, b.path) &&
           name_equal(a.value_name, b.value_name) &&
           a.data == b.data &&
           a.rollback == b.rollback &&
           a.mode == b.mode;
}

} // namespace hatch
