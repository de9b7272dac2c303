#pragma once

#include <string>
#include <vector>

namespace instman {

// One entry of the OS process table, as much as instance matching needs
struct ProcessInfo {
    int pid = 0;
    int parent_pid = 0;
    std::string name;                 // executable file name (argv[0] base name, else comm)
    std::string executable_path;      // /proc/<pid>/exe target, may be empty
    std::vector<std::string> args;    // full argv including argv[0]
};

} // namespace instman
