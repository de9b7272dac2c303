#pragma once

#include <string>

namespace instman {

enum class FormKind {
    CreateInstance,
    RenameInstance
};

enum class FormField {
    Name,
    UserDataDir,
    ExtraArgs
};

struct FormDialogViewModel {
    // Visibility
    bool is_visible = false;

    FormKind kind = FormKind::CreateInstance;

    // Instance being renamed
    std::string target_id;

    // Field values; the GUI edits the buffers, the TUI the strings
    std::string name;
    std::string user_data_dir;
    std::string extra_args;   // shell-like, split on whitespace
    char name_buffer[256] = {};
    char user_data_dir_buffer[1024] = {};
    char extra_args_buffer[1024] = {};

    FormField active_field = FormField::Name;
    bool focus_first_field = false;

    // Error state
    std::string error_message;

    [[nodiscard]] int field_count() const { return kind == FormKind::CreateInstance ? 3 : 1; }

    std::string& field(FormField which) {
        switch (which) {
            case FormField::UserDataDir: return user_data_dir;
            case FormField::ExtraArgs:   return extra_args;
            case FormField::Name:        break;
        }
        return name;
    }

    [[nodiscard]] const std::string& field(FormField which) const {
        switch (which) {
            case FormField::UserDataDir: return user_data_dir;
            case FormField::ExtraArgs:   return extra_args;
            case FormField::Name:        break;
        }
        return name;
    }
};

} // namespace instman
