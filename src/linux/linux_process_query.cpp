#include "linux_process_query.hpp"

namespace instman {

LinuxProcessQuery::LinuxProcessQuery() = default;

std::vector<ProcessInfo> LinuxProcessQuery::get_all_processes() {
    return reader_.get_all_processes();
}

std::vector<QueryError> LinuxProcessQuery::get_recent_errors() {
    return reader_.get_recent_errors();
}

void LinuxProcessQuery::clear_errors() {
    reader_.clear_errors();
}

} // namespace instman
