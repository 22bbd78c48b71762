#include "Subprocess.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
    // Closes on scope exit; -1 means "nothing to close"
    struct Fd {
        int fd = -1;
        Fd() = default;
        explicit Fd(int f) : fd(f) {}
        ~Fd() { reset(); }
        Fd(const Fd&) = delete;
        Fd& operator=(const Fd&) = delete;
        void reset() {
            if (fd >= 0) ::close(fd);
            fd = -1;
        }
    };

    void makePipe(Fd& readEnd, Fd& writeEnd) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
        readEnd.fd = fds[0];
        writeEnd.fd = fds[1];
    }

    // environ with overrides applied, as owned strings
    std::vector<std::string> buildEnv(const EnvOverrides& env) {
        std::vector<std::string> out;
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            const auto eq = entry.find('=');
            const std::string name = entry.substr(0, eq);
            bool overridden = false;
            for (const auto& kv : env) {
                if (kv.first == name) { overridden = true; break; }
            }
            if (!overridden) out.push_back(std::move(entry));
        }
        for (const auto& kv : env) out.push_back(kv.first + "=" + kv.second);
        return out;
    }

    std::vector<char*> toCharPtrs(std::vector<std::string>& v) {
        std::vector<char*> out;
        out.reserve(v.size() + 1);
        for (auto& s : v) out.push_back(s.data());
        out.push_back(nullptr);
        return out;
    }

    int waitChild(pid_t pid) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw std::system_error(errno, std::generic_category(), "waitpid");
            }
        }
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }
}

ProcessResult runProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout,
                         const EnvOverrides& env) {
    if (argv.empty()) throw std::invalid_argument("runProcess: empty argv");

    Fd outR, outW, errR, errW;
    makePipe(outR, outW);
    makePipe(errR, errW);

    posix_spawn_file_actions_t actions;
    if (int rc = posix_spawn_file_actions_init(&actions); rc != 0) {
        throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions_init");
    }
    int actRc = posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (actRc == 0) actRc = posix_spawn_file_actions_adddup2(&actions, outW.fd, STDOUT_FILENO);
    if (actRc == 0) actRc = posix_spawn_file_actions_adddup2(&actions, errW.fd, STDERR_FILENO);
    if (actRc != 0) {
        posix_spawn_file_actions_destroy(&actions);
        throw std::system_error(actRc, std::generic_category(), "posix_spawn_file_actions");
    }

    std::vector<std::string> args(argv);
    auto argPtrs = toCharPtrs(args);
    auto envStrings = buildEnv(env);
    auto envPtrs = toCharPtrs(envStrings);

    pid_t pid = -1;
    const int spawnRc = posix_spawnp(&pid, args[0].c_str(), &actions, nullptr,
                                     argPtrs.data(), envPtrs.data());
    posix_spawn_file_actions_destroy(&actions);
    if (spawnRc != 0) {
        throw std::system_error(spawnRc, std::generic_category(), "cannot run " + argv[0]);
    }

    // Parent keeps only the read ends, so EOF arrives when the child exits
    outW.reset();
    errW.reset();

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool outOpen = true, errOpen = true;
    char buf[4096];

    while (outOpen || errOpen) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            // SIGKILL: a child stuck waiting on the token must not outlive the deadline
            result.timedOut = true;
            ::kill(pid, SIGKILL);
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        pollfd fds[2];
        nfds_t n = 0;
        if (outOpen) fds[n++] = pollfd{outR.fd, POLLIN, 0};
        if (errOpen) fds[n++] = pollfd{errR.fd, POLLIN, 0};

        int prc = ::poll(fds, n, static_cast<int>(remaining.count()));
        if (prc < 0) {
            if (errno == EINTR) continue;
            const int saved = errno;
            ::kill(pid, SIGKILL);
            waitChild(pid);
            throw std::system_error(saved, std::generic_category(), "poll");
        }

        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const bool isOut = (fds[i].fd == outR.fd);
            ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                (isOut ? result.out : result.err).append(buf, static_cast<std::size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                (isOut ? outOpen : errOpen) = false;
            }
        }
    }

    result.exitCode = waitChild(pid);
    return result;
}

void execReplacing(const std::vector<std::string>& argv, const EnvOverrides& env) {
    if (argv.empty()) throw std::invalid_argument("execReplacing: empty argv");

    for (const auto& kv : env) {
        if (::setenv(kv.first.c_str(), kv.second.c_str(), 1) != 0) {
            throw std::system_error(errno, std::generic_category(), "setenv " + kv.first);
        }
    }

    std::vector<std::string> args(argv);
    auto argPtrs = toCharPtrs(args);
    ::execvp(args[0].c_str(), argPtrs.data());
    throw std::system_error(errno, std::generic_category(), "exec " + argv[0]);
}
