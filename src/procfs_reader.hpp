#pragma once

#include "errors.hpp"
#include "process_info.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace instman {

class ProcfsReader {
public:
    // Throws TransientQueryError when /proc cannot be iterated.
    // Processes that vanish mid-read are skipped.
    std::vector<ProcessInfo> get_all_processes();
    std::optional<ProcessInfo> get_process_info(int pid);

    // Error reporting
    std::vector<QueryError> get_recent_errors();
    void clear_errors();

private:
    static std::string read_file(const std::string& path);
    static std::string read_symlink(const std::string& path);
    static std::vector<std::string> split_cmdline(const std::string& raw);

    // Error tracking
    void add_error(const std::string& message);
    mutable std::mutex errors_mutex_;
    std::vector<QueryError> recent_errors_;
    static constexpr size_t kMaxErrors = 10;
};

} // namespace instman
