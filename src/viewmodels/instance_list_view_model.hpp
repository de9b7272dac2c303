#pragma once

#include "../status_poller.hpp"
#include <memory>
#include <string>

namespace instman {

struct InstanceListViewModel {
    // Snapshot from the list poller
    std::shared_ptr<const StatusSnapshot> data;

    // Selection state
    std::string selected_id;

    // UI flags
    bool scroll_to_selected = false;

    [[nodiscard]] const Instance* selected() const {
        if (!data) return nullptr;
        for (const auto& instance : data->instances) {
            if (instance.id == selected_id) return &instance;
        }
        return nullptr;
    }

    [[nodiscard]] int selected_index() const {
        if (!data) return -1;
        for (size_t i = 0; i < data->instances.size(); ++i) {
            if (data->instances[i].id == selected_id) return static_cast<int>(i);
        }
        return -1;
    }

    // Keeps the selection on an existing row after the list changed
    void fix_selection() {
        if (!data || data->instances.empty()) {
            selected_id.clear();
            return;
        }
        if (selected_index() < 0) {
            selected_id = data->instances.front().id;
        }
    }
};

} // namespace instman
