#include "imgui_app.hpp"
#include "imgui.h"
#include <cstring>

namespace instman {

static void copy_to_buffer(char* buffer, size_t size, const std::string& value) {
    std::strncpy(buffer, value.c_str(), size - 1);
    buffer[size - 1] = '\0';
}

void ImGuiApp::request_delete(const Instance& instance) {
    auto& cd = view_model_.confirm_dialog;
    cd.action = ConfirmAction::DeleteInstance;
    cd.target_id = instance.id;
    cd.target_name = instance.name;
    cd.error_message.clear();
    cd.is_visible = true;
}

void ImGuiApp::request_confirm(const ConfirmAction action) {
    auto& cd = view_model_.confirm_dialog;
    cd.action = action;
    cd.target_id.clear();
    cd.target_name.clear();
    cd.error_message.clear();
    cd.is_visible = true;
}

void ImGuiApp::execute_confirm() {
    auto& cd = view_model_.confirm_dialog;

    ActionResult result;
    switch (cd.action) {
        case ConfirmAction::DeleteInstance:
            result = actions_.remove(cd.target_id);
            break;
        case ConfirmAction::MigrateAccounts:
            result = actions_.migrate();
            break;
        case ConfirmAction::PruneAccounts:
            result = actions_.prune();
            break;
    }

    if (result.success) {
        cd.is_visible = false;
        report(result);
    } else {
        cd.error_message = result.message;
    }
}

void ImGuiApp::render_confirm_dialog() {
    auto& cd = view_model_.confirm_dialog;
    if (!cd.is_visible) return;

    ImGui::OpenPopup("Confirm");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(620, 0), ImGuiCond_Always);

    if (ImGui::BeginPopupModal("Confirm", &cd.is_visible, ImGuiWindowFlags_AlwaysAutoResize)) {
        if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            cd.is_visible = false;
            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return;
        }

        const char* confirm_label = "OK";
        switch (cd.action) {
            case ConfirmAction::DeleteInstance:
                ImGui::TextWrapped("Delete this instance? Its accounts are released, the user data dir is kept.");
                ImGui::Spacing();
                ImGui::Text("Instance: %s", cd.target_name.c_str());
                confirm_label = "Delete";
                break;
            case ConfirmAction::MigrateAccounts:
                ImGui::TextWrapped("Bind every account that no instance holds to the default instance?");
                confirm_label = "Migrate";
                break;
            case ConfirmAction::PruneAccounts:
                ImGui::TextWrapped("Remove bindings to accounts that no longer exist?");
                confirm_label = "Prune";
                break;
        }

        if (!cd.error_message.empty()) {
            ImGui::Spacing();
            ImGui::Separator();
            ImGui::Spacing();
            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.4f, 0.4f, 1.0f));
            ImGui::TextWrapped("%s", cd.error_message.c_str());
            ImGui::PopStyleColor();
        }

        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();

        if (ImGui::Button(confirm_label, ImVec2(120, 0))) {
            execute_confirm();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0))) {
            cd.is_visible = false;
        }

        ImGui::EndPopup();
    }
}

void ImGuiApp::open_form(const FormKind kind) {
    auto& fd = view_model_.form_dialog;
    fd.kind = kind;
    fd.error_message.clear();
    fd.target_id.clear();
    fd.name_buffer[0] = '\0';
    fd.user_data_dir_buffer[0] = '\0';
    fd.extra_args_buffer[0] = '\0';

    if (kind == FormKind::RenameInstance) {
        const Instance* selected = view_model_.instance_list.selected();
        if (!selected) return;
        fd.target_id = selected->id;
        copy_to_buffer(fd.name_buffer, sizeof(fd.name_buffer), selected->name);
    }

    fd.focus_first_field = true;
    fd.is_visible = true;
}

void ImGuiApp::submit_form() {
    auto& fd = view_model_.form_dialog;
    fd.name = fd.name_buffer;
    fd.user_data_dir = fd.user_data_dir_buffer;
    fd.extra_args = fd.extra_args_buffer;

    ActionResult result = fd.kind == FormKind::CreateInstance
        ? actions_.create(fd.name, fd.user_data_dir, fd.extra_args)
        : actions_.rename(fd.target_id, fd.name);

    if (!result.success) {
        fd.error_message = result.message;
        return;
    }

    fd.is_visible = false;
    report(result);
}

void ImGuiApp::render_form_dialog() {
    auto& fd = view_model_.form_dialog;
    if (!fd.is_visible) return;

    const char* title = fd.kind == FormKind::CreateInstance ? "New Instance" : "Rename Instance";
    ImGui::OpenPopup(title);

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(700, 0), ImGuiCond_Always);

    if (ImGui::BeginPopupModal(title, &fd.is_visible, ImGuiWindowFlags_AlwaysAutoResize)) {
        if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            fd.is_visible = false;
            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return;
        }

        bool submit = false;

        if (fd.focus_first_field) {
            ImGui::SetKeyboardFocusHere();
            fd.focus_first_field = false;
        }
        submit |= ImGui::InputText("Name", fd.name_buffer, sizeof(fd.name_buffer),
                                   ImGuiInputTextFlags_EnterReturnsTrue);

        if (fd.kind == FormKind::CreateInstance) {
            submit |= ImGui::InputText("User data dir", fd.user_data_dir_buffer, sizeof(fd.user_data_dir_buffer),
                                       ImGuiInputTextFlags_EnterReturnsTrue);
            if (ImGui::IsItemHovered()) {
                ImGui::SetTooltip("Created when missing; must not belong to another instance");
            }
            submit |= ImGui::InputText("Extra args", fd.extra_args_buffer, sizeof(fd.extra_args_buffer),
                                       ImGuiInputTextFlags_EnterReturnsTrue);
            if (ImGui::IsItemHovered()) {
                ImGui::SetTooltip("Passed to the application on every launch, e.g. --disable-gpu");
            }
        }

        if (!fd.error_message.empty()) {
            ImGui::Spacing();
            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.4f, 0.4f, 1.0f));
            ImGui::TextWrapped("%s", fd.error_message.c_str());
            ImGui::PopStyleColor();
        }

        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();

        if (ImGui::Button("Save", ImVec2(120, 0)) || submit) {
            submit_form();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0))) {
            fd.is_visible = false;
        }

        ImGui::EndPopup();
    }
}

} // namespace instman
