#include "process.hpp"
#include "platform.hpp"

#include <chrono>
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>

namespace platform {

static int exit_code(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// SIGTERM, a short grace period, then SIGKILL. Always reaps the child.
static void kill_child(pid_t pid) {
    kill(pid, SIGTERM);
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid, &status, WNOHANG) == pid) return;
        sleep_ms(100);
    }
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

static void redirect(int target_fd, const char* path, int flags) {
    int fd = open(path, flags, 0644);
    if (fd < 0) return;
    dup2(fd, target_fd);
    close(fd);
}

int run_process(const std::string& program,
                const std::vector<std::string>& args,
                int timeout_ms,
                const std::string& stderr_log) {
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return 127;

    if (pid == 0) {
        redirect(STDIN_FILENO, "/dev/null", O_RDONLY);
        redirect(STDOUT_FILENO, "/dev/null", O_WRONLY);
        if (!stderr_log.empty()) {
            redirect(STDERR_FILENO, stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND);
        }
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    int status = 0;
    if (timeout_ms <= 0) {
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) return -1;
        }
        return exit_code(status);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) return exit_code(status);
        if (ret < 0 && errno != EINTR) return -1;
        sleep_ms(50);
    }

    kill_child(pid);
    return -1;
}

} // namespace platform
