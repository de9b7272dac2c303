#pragma once

#include "instance.hpp"
#include "interfaces/i_instance_store.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace instman {

// Owns every Instance record. Mutations of one instance are serialized by a
// per-instance mutex held across read-modify-persist-commit, so a failed
// store write leaves the record unchanged. Different instances mutate in
// parallel.
class InstanceRegistry {
public:
    InstanceRegistry(IInstanceStore& store, std::string default_user_data_dir);

    InstanceRegistry(const InstanceRegistry&) = delete;
    InstanceRegistry& operator=(const InstanceRegistry&) = delete;

    // Default first, then by creation time
    [[nodiscard]] std::vector<Instance> list() const;
    [[nodiscard]] std::vector<InstanceSummary> summaries() const;

    Instance create(const std::string& name, const std::string& user_data_dir,
                    std::vector<std::string> extra_args = {});

    [[nodiscard]] Instance get(const std::string& id) const;
    [[nodiscard]] std::optional<Instance> find_default() const;
    [[nodiscard]] bool contains(const std::string& id) const;

    // Replaces the mutable fields of an existing record
    void update(const Instance& instance);

    // ConflictError for the default instance. Bound accounts are released
    // before the record is deleted.
    void remove(const std::string& id);

    // Returns the default instance, creating or promoting one when none exists
    Instance ensure_default();

    // Applies fn to a copy of the record under the instance lock, validates,
    // persists and commits. Anything fn throws aborts the mutation.
    Instance mutate(const std::string& id, const std::function<void(Instance&)>& fn);

    [[nodiscard]] std::string default_user_data_dir() const;
    // Path used when ensure_default has to create the default instance
    void set_default_user_data_dir(const std::string& dir);

    // True when some instance already uses dir
    [[nodiscard]] bool owns_user_data_dir(const std::string& dir) const;

private:
    struct Slot {
        std::mutex mutex;
        Instance instance;
        bool removed = false;
    };

    void load();
    [[nodiscard]] std::shared_ptr<Slot> find_slot(const std::string& id) const;
    [[nodiscard]] std::vector<std::shared_ptr<Slot>> all_slots() const;
    void insert_slot(const Instance& instance);
    void persist_repair(const Instance& instance);

    static void validate_name(const std::string& name);
    static void prepare_user_data_dir(const std::string& normalized);
    static void check_update(const Instance& current, Instance& next);
    static std::string generate_id();

    IInstanceStore& store_;
    std::string default_user_data_dir_;

    // Guards slots_, dir_owners_, default_id_ and default_user_data_dir_.
    // Never held across I/O.
    mutable std::shared_mutex slots_mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;
    std::map<std::string, std::string> dir_owners_;   // normalized dir -> id
    std::string default_id_;

    // Serializes create and ensure_default
    std::mutex create_mutex_;
};

} // namespace instman
