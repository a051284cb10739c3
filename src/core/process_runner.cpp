#include "process_runner.h"

#include <cerrno>
#include <cstring>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "cli_parse.h"

namespace roleicon::core {

namespace {

constexpr int k_exec_failed_exit_code = 127;
constexpr size_t k_read_chunk_size = 4096;

} // namespace

bool PosixProcessRunner::run(const std::filesystem::path& executable,
                             const std::vector<std::string>& args,
                             ProcessResult& out,
                             std::string& error) {
    out = ProcessResult{};

    const std::string exe = executable.string();
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const std::string& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (pipe(fds) != 0) {
        error = std::string("Failed to create pipe: ") + std::strerror(errno);
        return false;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        error = std::string("Failed to fork: ") + std::strerror(errno);
        close(fds[0]);
        close(fds[1]);
        return false;
    }

    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        execv(exe.c_str(), argv.data());
        _exit(k_exec_failed_exit_code);
    }

    close(fds[1]);
    char buffer[k_read_chunk_size];
    while (true) {
        const ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            out.output.append(buffer, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = "Failed to wait for " + to_quoted(exe) + ": " + std::strerror(errno);
            return false;
        }
    }

    out.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return true;
}

} // namespace roleicon::core
