#pragma once

#include "../errors.hpp"
#include "../process_info.hpp"
#include <vector>

namespace instman {

class IProcessQuery {
public:
    virtual ~IProcessQuery() = default;

    // Snapshot of the process table. Throws TransientQueryError when the
    // table cannot be read.
    virtual std::vector<ProcessInfo> get_all_processes() = 0;

    virtual std::vector<QueryError> get_recent_errors() = 0;
    virtual void clear_errors() = 0;
};

} // namespace instman
