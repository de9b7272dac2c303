#include "instance_registry.hpp"
#include "errors.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <random>
#include <unistd.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace instman {

namespace {

bool list_order(const Instance& a, const Instance& b) {
    if (a.is_default != b.is_default) return a.is_default;
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    if (a.name != b.name) return a.name < b.name;
    return a.id < b.id;
}

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

InstanceRegistry::InstanceRegistry(IInstanceStore& store, std::string default_user_data_dir)
    : store_(store)
    , default_user_data_dir_(normalize_dir(default_user_data_dir))
{
    load();
}

void InstanceRegistry::load() {
    std::vector<Instance> records = store_.load_all();

    // Oldest first, so repairs keep the earliest record
    std::stable_sort(records.begin(), records.end(), [](const Instance& a, const Instance& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });

    bool have_default = false;
    for (auto& instance : records) {
        if (instance.id.empty() || slots_.contains(instance.id)) {
            spdlog::warn("Skipping instance record with empty or duplicate id '{}'", instance.id);
            continue;
        }

        const std::string dir = normalize_dir(instance.user_data_dir);
        if (auto it = dir_owners_.find(dir); it != dir_owners_.end()) {
            spdlog::warn("Skipping instance {} ({}): user data dir {} already used by {}",
                         instance.name, instance.id, dir, it->second);
            continue;
        }

        bool repaired = false;

        std::vector<std::string> unique_ids;
        for (const auto& account_id : instance.account_ids) {
            if (std::find(unique_ids.begin(), unique_ids.end(), account_id) == unique_ids.end()) {
                unique_ids.push_back(account_id);
            }
        }
        if (unique_ids.size() != instance.account_ids.size()) {
            spdlog::warn("Instance {}: collapsed {} duplicate account bindings",
                         instance.id, instance.account_ids.size() - unique_ids.size());
            instance.account_ids = std::move(unique_ids);
            repaired = true;
        }

        if (instance.current_account_id && !instance.has_account(*instance.current_account_id)) {
            spdlog::warn("Instance {}: current account {} is not bound, clearing it",
                         instance.id, *instance.current_account_id);
            instance.current_account_id.reset();
            repaired = true;
        }

        if (instance.last_launch_args && has_helper_marker(*instance.last_launch_args)) {
            spdlog::warn("Instance {}: discarding launch args recorded from a helper process", instance.id);
            instance.last_launch_args.reset();
            repaired = true;
        }

        if (instance.is_default) {
            if (have_default) {
                spdlog::warn("Instance {} ({}) is also marked default, keeping the oldest default",
                             instance.name, instance.id);
                instance.is_default = false;
                repaired = true;
            }
            have_default = true;
        }

        if (repaired) {
            persist_repair(instance);
        }
        insert_slot(instance);
    }

    spdlog::info("Loaded {} instances", slots_.size());
}

void InstanceRegistry::persist_repair(const Instance& instance) {
    try {
        store_.save(instance);
    } catch (const StorageError& e) {
        // The repaired copy is still used in memory and saved on the next mutation
        spdlog::warn("Failed to persist repaired instance {}: {}", instance.id, e.what());
    }
}

void InstanceRegistry::insert_slot(const Instance& instance) {
    auto slot = std::make_shared<Slot>();
    slot->instance = instance;

    std::unique_lock lock(slots_mutex_);
    slots_[instance.id] = slot;
    dir_owners_[normalize_dir(instance.user_data_dir)] = instance.id;
    if (instance.is_default) {
        default_id_ = instance.id;
    }
}

std::shared_ptr<InstanceRegistry::Slot> InstanceRegistry::find_slot(const std::string& id) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        throw NotFoundError(fmt::format("Instance '{}' not found", id));
    }
    return it->second;
}

std::vector<std::shared_ptr<InstanceRegistry::Slot>> InstanceRegistry::all_slots() const {
    std::shared_lock lock(slots_mutex_);
    std::vector<std::shared_ptr<Slot>> result;
    result.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        result.push_back(slot);
    }
    return result;
}

std::vector<Instance> InstanceRegistry::list() const {
    std::vector<Instance> result;
    for (const auto& slot : all_slots()) {
        std::lock_guard lock(slot->mutex);
        if (!slot->removed) {
            result.push_back(slot->instance);
        }
    }
    std::sort(result.begin(), result.end(), list_order);
    return result;
}

std::vector<InstanceSummary> InstanceRegistry::summaries() const {
    std::vector<InstanceSummary> result;
    for (const auto& instance : list()) {
        result.push_back(InstanceSummary::from(instance));
    }
    return result;
}

Instance InstanceRegistry::get(const std::string& id) const {
    auto slot = find_slot(id);
    std::lock_guard lock(slot->mutex);
    if (slot->removed) {
        throw NotFoundError(fmt::format("Instance '{}' not found", id));
    }
    return slot->instance;
}

std::string InstanceRegistry::default_user_data_dir() const {
    std::shared_lock lock(slots_mutex_);
    return default_user_data_dir_;
}

void InstanceRegistry::set_default_user_data_dir(const std::string& dir) {
    std::unique_lock lock(slots_mutex_);
    default_user_data_dir_ = normalize_dir(dir);
}

bool InstanceRegistry::owns_user_data_dir(const std::string& dir) const {
    std::shared_lock lock(slots_mutex_);
    return dir_owners_.contains(normalize_dir(dir));
}

bool InstanceRegistry::contains(const std::string& id) const {
    std::shared_lock lock(slots_mutex_);
    return slots_.contains(id);
}

std::optional<Instance> InstanceRegistry::find_default() const {
    std::shared_ptr<Slot> slot;
    {
        std::shared_lock lock(slots_mutex_);
        if (default_id_.empty()) return std::nullopt;
        if (auto it = slots_.find(default_id_); it != slots_.end()) {
            slot = it->second;
        }
    }
    if (!slot) return std::nullopt;

    std::lock_guard lock(slot->mutex);
    if (slot->removed) return std::nullopt;
    return slot->instance;
}

void InstanceRegistry::validate_name(const std::string& name) {
    if (trim(name).empty()) {
        throw ValidationError("Instance name must not be empty");
    }
}

void InstanceRegistry::prepare_user_data_dir(const std::string& normalized) {
    std::error_code ec;
    const auto status = fs::status(normalized, ec);

    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw ValidationError(fmt::format("User data dir {} is not accessible: {}", normalized, ec.message()));
    }

    if (fs::exists(status)) {
        if (!fs::is_directory(status)) {
            throw ValidationError(fmt::format("User data dir {} exists and is not a directory", normalized));
        }
        if (access(normalized.c_str(), R_OK | W_OK | X_OK) != 0) {
            throw ValidationError(fmt::format("User data dir {} is not accessible", normalized));
        }
        return;
    }

    if (!fs::create_directories(normalized, ec) && ec) {
        throw ValidationError(fmt::format("Cannot create user data dir {}: {}", normalized, ec.message()));
    }
}

std::string InstanceRegistry::generate_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // RFC 4122 variant

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF,
                       lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

Instance InstanceRegistry::create(const std::string& name, const std::string& user_data_dir,
                                  std::vector<std::string> extra_args) {
    validate_name(name);

    if (user_data_dir.empty() || !fs::path(user_data_dir).is_absolute()) {
        throw ValidationError(fmt::format("User data dir '{}' must be an absolute path", user_data_dir));
    }
    const std::string dir = normalize_dir(user_data_dir);

    std::lock_guard create_lock(create_mutex_);

    {
        std::shared_lock lock(slots_mutex_);
        if (auto it = dir_owners_.find(dir); it != dir_owners_.end()) {
            throw ValidationError(fmt::format("User data dir {} is already used by instance {}", dir, it->second));
        }
    }

    prepare_user_data_dir(dir);

    Instance instance;
    instance.id = generate_id();
    instance.name = trim(name);
    instance.user_data_dir = dir;
    instance.extra_args = std::move(extra_args);
    instance.created_at = now_seconds();

    store_.save(instance);
    insert_slot(instance);

    spdlog::info("Created instance {} ({}) at {}", instance.name, instance.id, instance.user_data_dir);
    return instance;
}

void InstanceRegistry::check_update(const Instance& current, Instance& next) {
    if (next.user_data_dir != current.user_data_dir) {
        throw ValidationError(fmt::format("User data dir of instance {} cannot be changed", current.id));
    }
    if (next.is_default != current.is_default) {
        throw ConflictError(fmt::format("Default flag of instance {} cannot be changed", current.id));
    }
    if (next.created_at != current.created_at) {
        throw ValidationError(fmt::format("Creation time of instance {} cannot be changed", current.id));
    }

    validate_name(next.name);
    next.name = trim(next.name);

    for (size_t i = 0; i < next.account_ids.size(); ++i) {
        if (next.account_ids[i].empty()) {
            throw ValidationError("Account id must not be empty");
        }
        if (std::find(next.account_ids.begin(), next.account_ids.begin() + static_cast<long>(i),
                      next.account_ids[i]) != next.account_ids.begin() + static_cast<long>(i)) {
            throw ValidationError(fmt::format("Account {} is bound twice", next.account_ids[i]));
        }
    }

    if (next.current_account_id && !next.has_account(*next.current_account_id)) {
        throw ValidationError(fmt::format("Account {} is not bound to instance {}",
                                          *next.current_account_id, current.id));
    }

    // Recorded args were built from the old launch configuration
    if (next.extra_args != current.extra_args || next.executable != current.executable) {
        next.last_launch_args.reset();
    }
}

Instance InstanceRegistry::mutate(const std::string& id, const std::function<void(Instance&)>& fn) {
    auto slot = find_slot(id);
    std::lock_guard lock(slot->mutex);
    if (slot->removed) {
        throw NotFoundError(fmt::format("Instance '{}' not found", id));
    }

    Instance next = slot->instance;
    fn(next);
    next.id = slot->instance.id;
    check_update(slot->instance, next);

    store_.save(next);
    slot->instance = next;
    return next;
}

void InstanceRegistry::update(const Instance& instance) {
    mutate(instance.id, [&](Instance& next) { next = instance; });
    spdlog::info("Updated instance {} ({})", instance.name, instance.id);
}

void InstanceRegistry::remove(const std::string& id) {
    auto slot = find_slot(id);
    std::lock_guard lock(slot->mutex);
    if (slot->removed) {
        throw NotFoundError(fmt::format("Instance '{}' not found", id));
    }
    if (slot->instance.is_default) {
        throw ConflictError("The default instance cannot be deleted");
    }

    if (!slot->instance.account_ids.empty()) {
        Instance released = slot->instance;
        for (const auto& account_id : slot->instance.account_ids) {
            spdlog::info("Unbound account {} from instance {}", account_id, id);
        }
        released.account_ids.clear();
        released.current_account_id.reset();
        store_.save(released);
        slot->instance = released;
    }

    store_.remove(id);
    slot->removed = true;

    {
        std::unique_lock map_lock(slots_mutex_);
        slots_.erase(id);
        dir_owners_.erase(normalize_dir(slot->instance.user_data_dir));
    }

    spdlog::info("Deleted instance {} ({})", slot->instance.name, id);
}

Instance InstanceRegistry::ensure_default() {
    if (auto existing = find_default()) {
        return *existing;
    }

    std::lock_guard create_lock(create_mutex_);

    // Another caller may have won the race
    if (auto existing = find_default()) {
        return *existing;
    }

    const std::string dir = default_user_data_dir();
    if (dir.empty()) {
        throw ValidationError("No default user data dir is configured");
    }

    std::shared_ptr<Slot> owner;
    {
        std::shared_lock lock(slots_mutex_);
        if (auto it = dir_owners_.find(dir); it != dir_owners_.end()) {
            owner = slots_.at(it->second);
        }
    }

    if (owner) {
        std::optional<Instance> promoted;
        {
            std::lock_guard lock(owner->mutex);
            // A concurrent remove() may have deleted the owner after the lookup
            if (!owner->removed) {
                Instance next = owner->instance;
                next.is_default = true;
                store_.save(next);
                owner->instance = next;
                promoted = std::move(next);
            }
        }
        if (promoted) {
            {
                std::unique_lock lock(slots_mutex_);
                default_id_ = promoted->id;
            }
            spdlog::info("Promoted instance {} ({}) to default", promoted->name, promoted->id);
            return *promoted;
        }
        spdlog::debug("Owner of {} was deleted before promotion, creating a new default", dir);
    }

    Instance instance;
    instance.id = generate_id();
    instance.name = "Default";
    instance.user_data_dir = dir;
    instance.is_default = true;
    instance.created_at = now_seconds();

    store_.save(instance);
    insert_slot(instance);

    spdlog::info("Created default instance ({}) at {}", instance.id, instance.user_data_dir);
    return instance;
}

} // namespace instman
