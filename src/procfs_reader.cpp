#include "procfs_reader.hpp"
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace instman {

void ProcfsReader::add_error(const std::string& message) {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<QueryError> ProcfsReader::get_recent_errors() {
    std::lock_guard lock(errors_mutex_);
    // Return errors from the last 10 seconds
    auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(10);
    std::vector<QueryError> result;
    for (const auto& err : recent_errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

void ProcfsReader::clear_errors() {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.clear();
}

std::string ProcfsReader::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string ProcfsReader::read_symlink(const std::string& path) {
    char buf[4096];
    const ssize_t len = readlink(path.c_str(), buf, sizeof(buf) - 1);
    if (len == -1) return {};
    buf[len] = '\0';
    return buf;
}

std::vector<std::string> ProcfsReader::split_cmdline(const std::string& raw) {
    // NUL separated, with a trailing NUL
    std::vector<std::string> args;
    size_t start = 0;
    while (start < raw.size()) {
        size_t end = raw.find('\0', start);
        if (end == std::string::npos) end = raw.size();
        args.push_back(raw.substr(start, end - start));
        start = end + 1;
    }

    // Chromium helpers overwrite their argv with one space joined string
    if (args.size() == 1 && args.front().find(' ') != std::string::npos) {
        std::vector<std::string> words;
        std::istringstream iss(args.front());
        std::string word;
        while (iss >> word) {
            words.push_back(word);
        }
        return words;
    }
    return args;
}

std::vector<ProcessInfo> ProcfsReader::get_all_processes() {
    std::vector<ProcessInfo> processes;

    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec) {
        const std::string message = fmt::format("Failed to iterate /proc: {}", ec.message());
        add_error(message);
        throw TransientQueryError(message);
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            const std::string message = fmt::format("Failed to iterate /proc: {}", ec.message());
            add_error(message);
            throw TransientQueryError(message);
        }

        const auto& name = it->path().filename().string();
        int pid = 0;
        if (auto [ptr, parse_ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
            parse_ec != std::errc{} || ptr != name.data() + name.size()) {
            continue;
        }

        // Gone between readdir and open: not an error
        if (auto info = get_process_info(pid)) {
            processes.push_back(std::move(*info));
        }
    }

    return processes;
}

std::optional<ProcessInfo> ProcfsReader::get_process_info(int pid) {
    std::string proc_path = "/proc/" + std::to_string(pid);

    std::string stat_content = read_file(proc_path + "/stat");
    if (stat_content.empty()) return std::nullopt;

    ProcessInfo info;
    info.pid = pid;

    // Parse stat - format: pid (comm) state ppid ...
    // comm can contain spaces and parentheses, so find the last ')'
    size_t comm_start = stat_content.find('(');
    size_t comm_end = stat_content.rfind(')');
    if (comm_start == std::string::npos || comm_end == std::string::npos || comm_end <= comm_start) {
        add_error(fmt::format("PID {}: malformed stat (missing comm)", pid));
        return std::nullopt;
    }

    const std::string comm = stat_content.substr(comm_start + 1, comm_end - comm_start - 1);

    if (comm_end + 2 >= stat_content.size()) {
        add_error(fmt::format("PID {}: truncated stat (no fields after comm)", pid));
        return std::nullopt;
    }

    std::istringstream iss(stat_content.substr(comm_end + 2));
    std::string state;
    int ppid = 0;
    iss >> state >> ppid;
    if (iss.fail()) {
        add_error(fmt::format("PID {}: failed to parse stat fields", pid));
        return std::nullopt;
    }
    info.parent_pid = ppid;

    // Kernel threads have an empty cmdline
    info.args = split_cmdline(read_file(proc_path + "/cmdline"));
    info.executable_path = read_symlink(proc_path + "/exe");

    // comm is truncated to 15 characters, argv[0] is not
    if (!info.args.empty() && !info.args.front().empty()) {
        info.name = fs::path(info.args.front()).filename().string();
    } else {
        info.name = comm;
    }

    return info;
}

} // namespace instman
