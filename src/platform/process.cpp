#include "patchguard/platform.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace patchguard {

namespace {

// Closes both ends of a pipe on scope exit
class Pipe {
public:
    Pipe() {
        if (pipe(fds_) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    explicit operator bool() const { return fds_[0] >= 0 && fds_[1] >= 0; }

    int read_fd() const { return fds_[0]; }
    int write_fd() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) close(fds_[0]);
        fds_[0] = -1;
    }
    void close_write() {
        if (fds_[1] >= 0) close(fds_[1]);
        fds_[1] = -1;
    }

private:
    int fds_[2];
};

} // namespace

CommandResult run_command(const std::vector<std::string>& argv, const std::string& working_dir) {
    CommandResult result;

    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe || !err_pipe) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    std::vector<char*> c_argv;
    for (const auto& s : argv) {
        c_argv.push_back(const_cast<char*>(s.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(out_pipe.write_fd(), STDOUT_FILENO);
        dup2(err_pipe.write_fd(), STDERR_FILENO);
        out_pipe.close_read();
        err_pipe.close_read();

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            const char msg[] = "cannot change to working directory\n";
            ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(127);
        }

        execvp(c_argv[0], c_argv.data());

        const char msg[] = "cannot execute command\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    // Parent process
    out_pipe.close_write();
    err_pipe.close_write();

    pollfd fds[2] = {
        {out_pipe.read_fd(), POLLIN, 0},
        {err_pipe.read_fd(), POLLIN, 0},
    };
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    int open_streams = 2;
    char buffer[4096];

    while (open_streams > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    int status;
    if (waitpid(pid, &status, 0) == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (!result.error.empty()) {
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

} // namespace patchguard
