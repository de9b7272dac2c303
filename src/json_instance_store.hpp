#pragma once

#include "interfaces/i_instance_store.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace instman {

// <data_dir>/instances.json holds the summary index, <data_dir>/instances/<id>.json
// the full records. Files are replaced atomically through a .tmp sibling.
class JsonInstanceStore : public IInstanceStore {
public:
    explicit JsonInstanceStore(std::filesystem::path data_dir);
    ~JsonInstanceStore() override = default;

    std::vector<Instance> load_all() override;
    void save(const Instance& instance) override;
    void remove(const std::string& id) override;

    [[nodiscard]] const std::filesystem::path& data_dir() const { return data_dir_; }

private:
    [[nodiscard]] std::filesystem::path index_path() const;
    [[nodiscard]] std::filesystem::path record_path(const std::string& id) const;
    void write_index(const std::vector<InstanceSummary>& summaries);

    static void write_atomic(const std::filesystem::path& path, const std::string& content);
    static std::string read_file(const std::filesystem::path& path);

    std::filesystem::path data_dir_;

    // Guards summaries_ and index writes
    std::mutex mutex_;
    std::vector<InstanceSummary> summaries_;
};

} // namespace instman
