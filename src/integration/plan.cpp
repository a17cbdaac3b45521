#include "hatch/plan.hpp"
#include "hatch/expansion.hpp"
#include "hatch/store.hpp"

#include <spdlog/spdlog.h>

namespace hatch {

namespace {

Result<std::string> expand(const std::string& input, const ConstantMap& constants,
                           const std::string& where) {
    auto expanded = expand_constants(input, constants);
    if (!expanded.ok) {
        std::string reason = !expanded.error.empty() ? expanded.error
                             : "unknown constant {" + expanded.unknown.front() + "}";
        return Result<std::string>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, where + ": " + reason));
    }
    return Result<std::string>::ok(expanded.value);
}

RegistryOperation make_op(const std::string& path, const std::string& value_name,
                          const std::string& data, RollbackPolicy rollback,
                          const std::string& gating_task, const std::string& origin,
                          WriteMode mode = WriteMode::Overwrite) {
    RegistryOperation op;
    op.path = path;
    op.value_name = value_name;
    op.data = data;
    op.rollback = rollback;
    op.mode = mode;
    op.gating_task = gating_task;
    op.origin = origin;
    return op;
}

} // namespace

Result<IntegrationPlan> build_integration_plan(const Manifest& manifest,
                                               const TaskSelection& selection,
                                               const ConstantMap& constants,
                                               const std::string& classes_root) {
    auto root = normalize_key_path(classes_root);
    if (!root) {
        return Result<IntegrationPlan>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, "invalid classes root", classes_root));
    }
    const std::string& c = *root;

    IntegrationPlan plan;

    struct SelectedAssociation {
        const AssociationRule* rule;
        std::string icon;
        std::string command;
    };
    std::vector<SelectedAssociation> selected;

    for (const auto& rule : manifest.associations) {
        if (!is_step_selected(rule.gating_task, selection)) {
            spdlog::debug("association {} skipped: task {} not selected",
                          rule.extension, rule.gating_task);
            continue;
        }

        std::string origin = "association:" + rule.extension;
        auto friendly = expand(rule.friendly_name, constants, origin);
        if (friendly.isErr()) return Result<IntegrationPlan>::err(friendly.error());
        auto icon = expand(rule.icon_ref, constants, origin);
        if (icon.isErr()) return Result<IntegrationPlan>::err(icon.error());
        auto command = expand(rule.open_command_template, constants, origin);
        if (command.isErr()) return Result<IntegrationPlan>::err(command.error());

        std::string prog_key = c + "\\" + rule.prog_id;

        // Shared list: add our member, never replace the list
        plan.push_back(make_op(c + "\\" + rule.extension + "\\OpenWithProgids", rule.prog_id, "",
                               RollbackPolicy::DeleteValueOnUninstall, rule.gating_task, origin,
                               WriteMode::AppendListMember));
        // Subtree namespaced by our ProgId
        plan.push_back(make_op(prog_key, "", friendly.value(),
                               RollbackPolicy::DeleteWholeKeyOnUninstall, rule.gating_task, origin));
        plan.push_back(make_op(prog_key + "\\DefaultIcon", "", icon.value(),
                               RollbackPolicy::DeleteWholeKeyOnUninstall, rule.gating_task, origin));
        plan.push_back(make_op(prog_key + "\\shell\\open\\command", "", command.value(),
                               RollbackPolicy::DeleteWholeKeyOnUninstall, rule.gating_task, origin));

        selected.push_back({&rule, icon.value(), command.value()});
    }

    if (!selected.empty()) {
        std::string app_key = c + "\\Applications\\" + manifest.executable;
        std::string origin = "application:" + manifest.executable;

        for (const auto& s : selected) {
            plan.push_back(make_op(app_key + "\\SupportedTypes", s.rule->extension, "",
                                   RollbackPolicy::DeleteWholeKeyOnUninstall,
                                   s.rule->gating_task, origin));
        }

        // The application entry lives as long as any of its associations;
        // it takes the icon and command of the first selected one
        const auto& first = selected.front();
        plan.push_back(make_op(app_key + "\\DefaultIcon", "", first.icon,
                               RollbackPolicy::DeleteWholeKeyOnUninstall,
                               first.rule->gating_task, origin));
        plan.push_back(make_op(app_key + "\\shell\\open\\command", "", first.command,
                               RollbackPolicy::DeleteWholeKeyOnUninstall,
                               first.rule->gating_task, origin));
    }

    for (size_t i = 0; i < manifest.registry.size(); ++i) {
        const auto& entry = manifest.registry[i];
        if (!is_step_selected(entry.gating_task, selection)) {
            continue;
        }

        std::string origin = "registry[" + std::to_string(i) + "]";
        auto path = expand(entry.path, constants, origin);
        if (path.isErr()) return Result<IntegrationPlan>::err(path.error());
        auto data = expand(entry.data, constants, origin);
        if (data.isErr()) return Result<IntegrationPlan>::err(data.error());

        auto normalized = normalize_key_path(path.value());
        if (!normalized) {
            return Result<IntegrationPlan>::err(
                Error(ErrorCode::CONFIGURATION_ERROR, origin + ": invalid key path", path.value()));
        }

        plan.push_back(make_op(*normalized, entry.value_name, data.value(), entry.rollback,
                               entry.gating_task, origin));
    }

    spdlog::debug("integration plan: {} operation(s)", plan.size());
    return Result<IntegrationPlan>::ok(std::move(plan));
}

} // namespace hatch
