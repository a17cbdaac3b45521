#include "hatch/shortcuts.hpp"
#include "hatch/expansion.hpp"
#include "hatch/platform.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <optional>

namespace hatch {

namespace {

// Escape a string value for a desktop entry key
std::string escape_value(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::optional<std::string> expand_field(const std::string& value, const ConstantMap& constants,
                                        std::string& error) {
    auto expanded = expand_constants(value, constants);
    if (!expanded.ok) {
        error = !expanded.error.empty() ? expanded.error
                : "unknown constant {" + expanded.unknown.front() + "}";
        return std::nullopt;
    }
    return expanded.value;
}

} // namespace

std::string shortcut_file_name(const std::string& app_id, const std::string& display_name) {
    std::string name = app_id + "-" + display_name;
    for (auto& c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '_' && c != '-') {
            c = '-';
        }
    }
    return name + ".desktop";
}

std::string quote_exec_argument(const std::string& arg) {
    static const std::string reserved = " \t\n\"'\\><~|&;$*?#()`";

    std::string escaped;
    bool needs_quotes = arg.empty();
    for (char c : arg) {
        if (reserved.find(c) != std::string::npos) needs_quotes = true;
        if (c == '"' || c == '`' || c == '$' || c == '\\') escaped += '\\';
        if (c == '%') escaped += '%';
        escaped += c;
    }
    if (!needs_quotes) return escaped;
    return "\"" + escaped + "\"";
}

std::string render_desktop_entry(const ShortcutEntry& shortcut,
                                 const std::string& app_id,
                                 const std::string& working_dir) {
    std::string exec = quote_exec_argument(shortcut.target_path);
    for (const auto& arg : shortcut.arguments) {
        exec += " " + quote_exec_argument(arg);
    }

    // Exec is already in its quoted form; only the value-level backslash
    // escaping still applies
    std::string out = "[Desktop Entry]\n";
    out += "Type=Application\n";
    out += "Version=1.0\n";
    out += "Name=" + escape_value(shortcut.display_name) + "\n";
    out += "Exec=" + escape_value(exec) + "\n";
    if (!working_dir.empty()) {
        out += "Path=" + escape_value(working_dir) + "\n";
    }
    if (!shortcut.icon.empty()) {
        out += "Icon=" + escape_value(shortcut.icon) + "\n";
    }
    if (!shortcut.comment.empty()) {
        out += "Comment=" + escape_value(shortcut.comment) + "\n";
    }
    out += "Terminal=false\n";
    out += "X-Hatch-AppId=" + escape_value(app_id) + "\n";
    return out;
}

Result<std::vector<CreatedShortcut>> create_shortcuts(const std::vector<ShortcutEntry>& entries,
                                                      const ShortcutContext& context,
                                                      WarningCollector& collector) {
    std::vector<CreatedShortcut> created;

    for (const auto& entry : entries) {
        if (!is_step_selected(entry.gating_task, context.selection)) {
            spdlog::debug("shortcut '{}' skipped: task {} not selected",
                          entry.display_name, entry.gating_task);
            continue;
        }

        ShortcutEntry expanded = entry;
        std::string error;
        auto target = expand_field(entry.target_path, context.constants, error);
        auto icon = target ? expand_field(entry.icon, context.constants, error) : std::nullopt;
        auto comment = icon ? expand_field(entry.comment, context.constants, error) : std::nullopt;
        if (!target || !icon || !comment) {
            return Result<std::vector<CreatedShortcut>>::err(
                Error(ErrorCode::CONFIGURATION_ERROR,
                      "shortcut '" + entry.display_name + "': " + error));
        }
        expanded.target_path = *target;
        expanded.icon = *icon;
        expanded.comment = *comment;
        expanded.arguments.clear();
        for (const auto& arg : entry.arguments) {
            auto value = expand_field(arg, context.constants, error);
            if (!value) {
                return Result<std::vector<CreatedShortcut>>::err(
                    Error(ErrorCode::CONFIGURATION_ERROR,
                          "shortcut '" + entry.display_name + "': " + error));
            }
            expanded.arguments.push_back(*value);
        }

        if (!context.dry_run && !path_exists(expanded.target_path)) {
            spdlog::warn("shortcut '{}' skipped: target {} does not exist",
                         entry.display_name, expanded.target_path);
            collector.emit(Warning::shortcut_skipped,
                           warnings::shortcut_skipped(entry.display_name, "target missing"));
            continue;
        }

        bool desktop = entry.location == ShortcutLocation::Desktop;
        const std::string& dir = desktop ? context.desktop_dir : context.applications_dir;

        CreatedShortcut shortcut;
        shortcut.name = entry.display_name;
        shortcut.location = shortcut_location_to_string(entry.location);
        shortcut.path = join_path(dir, shortcut_file_name(context.app_id, entry.display_name));

        if (!context.dry_run) {
            if (!is_directory(dir)) {
                auto made = atomic_create_directory(dir);
                if (!made.ok) {
                    return Result<std::vector<CreatedShortcut>>::err(
                        Error(ErrorCode::DEPLOYMENT_ERROR, made.error, dir));
                }
            }

            auto written = atomic_write_file(
                shortcut.path, render_desktop_entry(expanded, context.app_id, context.install_dir));
            if (!written.ok) {
                return Result<std::vector<CreatedShortcut>>::err(
                    Error(ErrorCode::DEPLOYMENT_ERROR, written.error, shortcut.path));
            }

            if (desktop) {
                std::error_code ec;
                std::filesystem::permissions(shortcut.path,
                                             std::filesystem::perms::owner_exec |
                                             std::filesystem::perms::group_exec |
                                             std::filesystem::perms::others_exec,
                                             std::filesystem::perm_options::add, ec);
                if (ec) {
                    spdlog::warn("could not mark {} executable: {}", shortcut.path, ec.message());
                }
            }
        }

        spdlog::info("{} shortcut {}", context.dry_run ? "would create" : "created", shortcut.path);
        created.push_back(std::move(shortcut));
    }

    return Result<std::vector<CreatedShortcut>>::ok(std::move(created));
}

Result<void> remove_shortcuts(const std::vector<CreatedShortcut>& shortcuts) {
    std::optional<Error> first_error;

    for (const auto& shortcut : shortcuts) {
        if (!path_exists(shortcut.path)) {
            continue;
        }
        if (!remove_file(shortcut.path)) {
            spdlog::error("could not remove shortcut {}", shortcut.path);
            if (!first_error) {
                first_error = Error(ErrorCode::IO_ERROR, "cannot remove shortcut", shortcut.path);
            }
            continue;
        }
        spdlog::debug("removed shortcut {}", shortcut.path);
    }

    if (first_error) {
        return Result<void>::err(*first_error);
    }
    return Result<void>::ok();
}

} // namespace hatch
