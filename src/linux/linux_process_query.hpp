#pragma once

#include "../interfaces/i_process_query.hpp"
#include "../procfs_reader.hpp"

namespace instman {

class LinuxProcessQuery : public IProcessQuery {
public:
    LinuxProcessQuery();
    ~LinuxProcessQuery() override = default;

    std::vector<ProcessInfo> get_all_processes() override;

    std::vector<QueryError> get_recent_errors() override;
    void clear_errors() override;

private:
    ProcfsReader reader_;
};

} // namespace instman
