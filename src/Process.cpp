#include "../include/Process.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace prefixrun;

namespace {
    // Child side of the exec-status pipe: which step failed, and errno.
    struct ExecError {
        int step = 0; // 1 = chdir, 2 = exec
        int err = 0;
    };

    void close_quietly(const int fd) {
        while (::close(fd) == -1 && errno == EINTR) {
        }
    }

    std::string errno_text(const int err) {
        return std::strerror(err);
    }
} // namespace

std::string prefixrun::join_command(const std::vector<std::string> &argv) {
    std::string out;
    for (const auto &a: argv) {
        if (!out.empty()) out.push_back(' ');
        if (a.empty() || a.find_first_of(" \t'\"") != std::string::npos) {
            out += "'" + a + "'";
        } else {
            out += a;
        }
    }
    return out;
}

int PosixLauncher::spawn_and_wait(const std::vector<std::string> &argv, const std::string &cwd) {
    if (argv.empty()) {
        throw InvocationFailure(_("Empty command"));
    }

    // Closed by a successful exec: EOF on the read end means the child is running argv.
    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) == -1) {
        throw InvocationFailure(std::string(_("pipe failed: ")) + errno_text(errno));
    }

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &a: argv) cargv.push_back(const_cast<char *>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        close_quietly(status_pipe[0]);
        close_quietly(status_pipe[1]);
        throw InvocationFailure(std::string(_("fork failed: ")) + errno_text(err));
    }
    if (pid == 0) {
        close_quietly(status_pipe[0]);
        ExecError e;
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            e.step = 1;
            e.err = errno;
        } else {
            ::execvp(cargv[0], cargv.data());
            e.step = 2;
            e.err = errno;
        }
        ssize_t ignored = ::write(status_pipe[1], &e, sizeof(e));
        (void) ignored;
        _exit(127);
    }

    close_quietly(status_pipe[1]);
    ExecError e;
    ssize_t got = 0;
    do {
        got = ::read(status_pipe[0], &e, sizeof(e));
    } while (got == -1 && errno == EINTR);
    close_quietly(status_pipe[0]);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);
    if (waited == -1) {
        throw InvocationFailure(std::string(_("waitpid failed: ")) + errno_text(errno));
    }

    if (got == static_cast<ssize_t>(sizeof(e))) {
        if (e.step == 1) {
            throw InvocationFailure(std::string(_("cannot enter directory ")) + cwd + ": " + errno_text(e.err));
        }
        throw InvocationFailure(std::string(_("cannot execute ")) + argv[0] + ": " + errno_text(e.err));
    }

    int rc = -1;
    if (WIFEXITED(status)) rc = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) rc = 128 + WTERMSIG(status);

    if (fail_on_exit_code && rc != 0) {
        if (WIFSIGNALED(status)) {
            throw InvocationFailure(std::string(_("killed by signal ")) + std::to_string(WTERMSIG(status)), rc);
        }
        throw InvocationFailure(std::string(_("exited with status ")) + std::to_string(rc), rc);
    }
    return rc;
}
