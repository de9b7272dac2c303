#include "linux_process_launcher.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/format.h>

namespace instman {

namespace {

void write_int(int fd, int value) {
    // Best effort from the child; the parent treats a short read as success
    ssize_t ignored = write(fd, &value, sizeof(value));
    (void)ignored;
}

bool read_int(int fd, int& value) {
    size_t total = 0;
    auto* out = reinterpret_cast<char*>(&value);
    while (total < sizeof(value)) {
        ssize_t n = read(fd, out + total, sizeof(value) - total);
        if (n == 0) return false;
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

void detach_stdio() {
    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd < 0) return;
    dup2(null_fd, STDIN_FILENO);
    dup2(null_fd, STDOUT_FILENO);
    dup2(null_fd, STDERR_FILENO);
    if (null_fd > STDERR_FILENO) close(null_fd);
}

} // namespace

LaunchResult LinuxProcessLauncher::launch(const std::string& executable, const std::vector<std::string>& args) {
    LaunchResult result;

    if (executable.empty()) {
        result.error_message = "No executable configured";
        return result;
    }

    std::vector<std::string> local_argv;
    local_argv.reserve(args.size() + 1);
    local_argv.push_back(executable);
    local_argv.insert(local_argv.end(), args.begin(), args.end());

    std::vector<char*> cargv;
    cargv.reserve(local_argv.size() + 1);
    for (auto& s : local_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    // pid_pipe carries the application pid (or -1 and errno when the second
    // fork failed), exec_pipe an errno when exec failed. exec_pipe is closed
    // on a successful exec, so EOF there means the application is running.
    int pid_pipe[2];
    int exec_pipe[2];
    if (pipe2(pid_pipe, O_CLOEXEC) != 0) {
        result.error_message = fmt::format("pipe failed: {}", strerror(errno));
        return result;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.error_message = fmt::format("pipe failed: {}", strerror(errno));
        close(pid_pipe[0]);
        close(pid_pipe[1]);
        return result;
    }

    pid_t child = fork();
    if (child == -1) {
        result.error_message = fmt::format("fork failed: {}", strerror(errno));
        close(pid_pipe[0]);
        close(pid_pipe[1]);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return result;
    }

    if (child == 0) {
        // Intermediate child: new session, fork the application, report its pid
        close(pid_pipe[0]);
        close(exec_pipe[0]);
        setsid();
        pid_t grandchild = fork();
        if (grandchild == -1) {
            write_int(pid_pipe[1], -1);
            write_int(pid_pipe[1], errno);
            _exit(1);
        }
        if (grandchild == 0) {
            close(pid_pipe[1]);
            detach_stdio();
            execvp(cargv[0], cargv.data());
            // Only reached when exec failed
            write_int(exec_pipe[1], errno);
            _exit(127);
        }
        write_int(pid_pipe[1], static_cast<int>(grandchild));
        _exit(0);
    }

    close(pid_pipe[1]);
    close(exec_pipe[1]);

    int status = 0;
    while (waitpid(child, &status, 0) == -1 && errno == EINTR) {
    }

    int pid = -1;
    int fork_errno = 0;
    const bool got_pid = read_int(pid_pipe[0], pid);
    if (got_pid && pid == -1) {
        read_int(pid_pipe[0], fork_errno);
    }
    close(pid_pipe[0]);

    int exec_errno = 0;
    const bool exec_failed = got_pid && pid != -1 && read_int(exec_pipe[0], exec_errno);
    close(exec_pipe[0]);

    if (!got_pid) {
        result.error_message = "Launcher process exited unexpectedly";
        return result;
    }
    if (pid == -1) {
        result.error_message = fmt::format("fork failed: {}", strerror(fork_errno));
        return result;
    }
    if (exec_failed) {
        result.error_message = fmt::format("Failed to execute {}: {}", executable, strerror(exec_errno));
        return result;
    }

    result.success = true;
    result.pid = pid;
    return result;
}

} // namespace instman
