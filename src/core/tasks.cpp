#include "hatch/tasks.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace hatch {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

Result<TaskSelection> resolve_selected_tasks(const Manifest& manifest,
                                             const TaskChoices& choices) {
    for (const auto& [task_id, selected] : choices) {
        if (!manifest.find_task(task_id)) {
            return Result<TaskSelection>::err(
                Error(ErrorCode::CONFIGURATION_ERROR, "unknown task '" + task_id + "'"));
        }
    }

    TaskSelection selection;
    for (const auto& task : manifest.tasks) {
        auto it = choices.find(task.id);
        bool selected = it != choices.end() ? it->second : task.default_selected;
        if (selected) {
            selection.insert(task.id);
        }
        spdlog::debug("task {}: {}{}", task.id, selected ? "selected" : "not selected",
                      it != choices.end() ? "" : " (default)");
    }
    return Result<TaskSelection>::ok(std::move(selection));
}

Result<void> add_task_choice(TaskChoices& choices, const std::string& task_id, bool selected) {
    if (task_id.empty()) {
        return Result<void>::err(Error(ErrorCode::CONFIGURATION_ERROR, "empty task id"));
    }
    auto it = choices.find(task_id);
    if (it != choices.end() && it->second != selected) {
        return Result<void>::err(Error(ErrorCode::CONFIGURATION_ERROR,
                                       "task '" + task_id + "' both selected and deselected"));
    }
    choices[task_id] = selected;
    return Result<void>::ok();
}

Result<TaskChoices> parse_task_choices(const std::string& list) {
    TaskChoices choices;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        std::string item = trim(list.substr(start, comma - start));
        start = comma + 1;

        if (item.empty()) continue;
        bool selected = true;
        if (item[0] == '!') {
            selected = false;
            item = trim(item.substr(1));
        }
        auto added = add_task_choice(choices, item, selected);
        if (added.isErr()) {
            return Result<TaskChoices>::err(added.error());
        }
    }
    return Result<TaskChoices>::ok(std::move(choices));
}

} // namespace hatch
