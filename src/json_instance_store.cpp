#include "json_instance_store.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace instman {

namespace {

constexpr const char* kIndexFile = "instances.json";
constexpr const char* kInstancesDir = "instances";
constexpr const char* kIndexVersion = "1.0";

} // namespace

JsonInstanceStore::JsonInstanceStore(fs::path data_dir)
    : data_dir_(std::move(data_dir))
{
}

fs::path JsonInstanceStore::index_path() const {
    return data_dir_ / kIndexFile;
}

fs::path JsonInstanceStore::record_path(const std::string& id) const {
    return data_dir_ / kInstancesDir / (id + ".json");
}

std::string JsonInstanceStore::read_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw StorageError(fmt::format("Failed to open {}", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void JsonInstanceStore::write_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError(fmt::format("Failed to create {}: {}", path.parent_path().string(), ec.message()));
    }

    fs::path temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            throw StorageError(fmt::format("Failed to write {}", temp_path.string()));
        }
        file << content;
        file.flush();
        if (!file) {
            throw StorageError(fmt::format("Failed to write {}", temp_path.string()));
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        throw StorageError(fmt::format("Failed to replace {}: {}", path.string(), ec.message()));
    }
}

void JsonInstanceStore::write_index(const std::vector<InstanceSummary>& summaries) {
    nlohmann::json index = {
        {"version", kIndexVersion},
        {"instances", summaries}
    };
    write_atomic(index_path(), index.dump(2));
}

std::vector<Instance> JsonInstanceStore::load_all() {
    std::lock_guard lock(mutex_);
    summaries_.clear();

    std::error_code ec;
    if (!fs::exists(index_path(), ec)) {
        spdlog::info("Instance index {} not found, starting empty", index_path().string());
        return {};
    }

    const std::string content = read_file(index_path());
    if (trim(content).empty()) {
        spdlog::warn("Instance index {} is empty, starting empty", index_path().string());
        return {};
    }

    std::vector<InstanceSummary> listed;
    try {
        listed = nlohmann::json::parse(content).at("instances").get<std::vector<InstanceSummary>>();
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(fmt::format("Failed to parse instance index {}: {}", index_path().string(), e.what()));
    }

    std::vector<Instance> instances;
    bool dropped = false;
    for (const auto& summary : listed) {
        try {
            auto instance = nlohmann::json::parse(read_file(record_path(summary.id))).get<Instance>();
            if (instance.id != summary.id) {
                throw StorageError(fmt::format("record id {} does not match index", instance.id));
            }
            summaries_.push_back(InstanceSummary::from(instance));
            instances.push_back(std::move(instance));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Dropping instance {} from index: {}", summary.id, e.what());
            dropped = true;
        } catch (const StorageError& e) {
            spdlog::warn("Dropping instance {} from index: {}", summary.id, e.what());
            dropped = true;
        }
    }

    if (dropped) {
        write_index(summaries_);
    }

    spdlog::debug("Loaded instance index with {} instances", instances.size());
    return instances;
}

void JsonInstanceStore::save(const Instance& instance) {
    const nlohmann::json record = instance;

    std::lock_guard lock(mutex_);
    write_atomic(record_path(instance.id), record.dump(2));

    auto summaries = summaries_;
    const auto summary = InstanceSummary::from(instance);
    auto it = std::find_if(summaries.begin(), summaries.end(),
                           [&](const InstanceSummary& s) { return s.id == instance.id; });
    if (it != summaries.end()) {
        *it = summary;
    } else {
        summaries.push_back(summary);
    }
    write_index(summaries);
    summaries_ = std::move(summaries);
}

void JsonInstanceStore::remove(const std::string& id) {
    std::lock_guard lock(mutex_);

    auto summaries = summaries_;
    auto it = std::find_if(summaries.begin(), summaries.end(),
                           [&](const InstanceSummary& s) { return s.id == id; });
    if (it != summaries.end()) {
        summaries.erase(it);
        write_index(summaries);
        summaries_ = std::move(summaries);
    }

    std::error_code ec;
    fs::remove(record_path(id), ec);
    if (ec) {
        throw StorageError(fmt::format("Failed to delete instance file for {}: {}", id, ec.message()));
    }
}

} // namespace instman
