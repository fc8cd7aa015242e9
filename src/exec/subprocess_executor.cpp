// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <exec/subprocess_executor.h>
#include <fuzzer/errors.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

using Clock = std::chrono::steady_clock;

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/** pipe2() pair closed on scope exit */
struct CPipe {
    int fds[2]{-1, -1};

    bool Open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    int& ReadEnd() { return fds[0]; }
    int& WriteEnd() { return fds[1]; }

    ~CPipe() {
        CloseFd(fds[0]);
        CloseFd(fds[1]);
    }
};

bool SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

/** Read whatever is available; closes `fd` on EOF or a hard error. */
void DrainFd(int& fd, std::string& sink) {
    char buf[4096];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
        sink.append(buf, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        CloseFd(fd);
    }
}

std::vector<char*> MakeArgv(std::vector<std::string>& strings) {
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1);
    for (std::string& s : strings) {
        argv.push_back(&s[0]);
    }
    argv.push_back(nullptr);
    return argv;
}

int64_t RemainingMs(const Clock::time_point& deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
}

} // namespace

CSubprocessExecutor::CSubprocessExecutor(std::vector<std::string> command, std::string working_dir,
                                         std::string artifact_dir, int64_t timeout_ms)
    : m_command(std::move(command)), m_workingDir(std::move(working_dir)),
      m_artifactDir(std::move(artifact_dir)), m_timeoutMs(timeout_ms) {
    if (m_command.empty() || m_command[0].empty()) {
        throw ConfigurationError("harness", "no harness command given");
    }
    if (m_timeoutMs < -1 || m_timeoutMs > MAX_EXEC_TIMEOUT_MS) {
        throw ConfigurationError("exec_timeout_ms",
                                 strprintf("timeout must be -1 or 0..%lld ms", static_cast<long long>(MAX_EXEC_TIMEOUT_MS)));
    }
    // A harness that exits before reading all of stdin must surface as EPIPE
    std::signal(SIGPIPE, SIG_IGN);
}

std::string CSubprocessExecutor::NextArtifactPath() {
    std::string dir = m_artifactDir.empty() ? "." : m_artifactDir;
    return strprintf("%s/coverage-%d-%llu.txt", dir.c_str(), static_cast<int>(::getpid()),
                     static_cast<unsigned long long>(m_nExecutions));
}

std::vector<std::string> CSubprocessExecutor::BuildEnvironment(const std::string& artifact) const {
    const std::string prefix = std::string(COVERAGE_FILE_ENV) + "=";

    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        if (std::strncmp(*entry, prefix.c_str(), prefix.size()) != 0) {
            env.emplace_back(*entry);
        }
    }
    env.push_back(prefix + artifact);
    return env;
}

CExecutionResult CSubprocessExecutor::Execute(const std::string& input) {
    CExecutionResult result;
    result.coverage_artifact = NextArtifactPath();
    ++m_nExecutions;

    // A leftover file from an earlier process with the same pid would be misread
    ::unlink(result.coverage_artifact.c_str());

    CPipe in, out, err;
    if (!in.Open() || !out.Open() || !err.Open()) {
        throw ExecutionError(strprintf("pipe() failed: %s", std::strerror(errno)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in.ReadEnd(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out.WriteEnd(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err.WriteEnd(), STDERR_FILENO);
    if (!m_workingDir.empty()) {
        int chdir_status = posix_spawn_file_actions_addchdir_np(&actions, m_workingDir.c_str());
        if (chdir_status != 0) {
            posix_spawn_file_actions_destroy(&actions);
            throw ExecutionError(strprintf("cannot run harness in '%s': %s", m_workingDir.c_str(),
                                           std::strerror(chdir_status)));
        }
    }

    std::vector<std::string> args = m_command;
    std::vector<std::string> env = BuildEnvironment(result.coverage_artifact);
    std::vector<char*> argv = MakeArgv(args);
    std::vector<char*> envp = MakeArgv(env);

    pid_t pid = -1;
    int status = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    if (status != 0) {
        throw ExecutionError(strprintf("cannot start harness '%s': %s", m_command[0].c_str(), std::strerror(status)));
    }

    CloseFd(in.ReadEnd());
    CloseFd(out.WriteEnd());
    CloseFd(err.WriteEnd());
    SetNonBlocking(in.WriteEnd());
    SetNonBlocking(out.ReadEnd());
    SetNonBlocking(err.ReadEnd());

    const bool has_deadline = m_timeoutMs >= 0;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(has_deadline ? m_timeoutMs : 0);

    size_t written = 0;
    if (input.empty()) {
        CloseFd(in.WriteEnd());
    }

    while (out.ReadEnd() >= 0 || err.ReadEnd() >= 0) {
        struct pollfd pfds[3];
        int* owners[3];
        nfds_t nfds = 0;
        if (in.WriteEnd() >= 0) {
            pfds[nfds] = {in.WriteEnd(), POLLOUT, 0};
            owners[nfds++] = &in.WriteEnd();
        }
        if (out.ReadEnd() >= 0) {
            pfds[nfds] = {out.ReadEnd(), POLLIN, 0};
            owners[nfds++] = &out.ReadEnd();
        }
        if (err.ReadEnd() >= 0) {
            pfds[nfds] = {err.ReadEnd(), POLLIN, 0};
            owners[nfds++] = &err.ReadEnd();
        }

        int wait_ms = -1;
        if (has_deadline) {
            int64_t remaining = RemainingMs(deadline);
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }
            // Bounded by MAX_EXEC_TIMEOUT_MS, well inside int
            wait_ms = static_cast<int>(remaining);
        }

        int r = ::poll(pfds, nfds, wait_ms);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            int poll_errno = errno;
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            throw ExecutionError(strprintf("poll() failed: %s", std::strerror(poll_errno)));
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (pfds[i].revents == 0) {
                continue;
            }
            if (owners[i] == &in.WriteEnd()) {
                ssize_t n = ::write(in.WriteEnd(), input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == input.size()) {
                        CloseFd(in.WriteEnd());
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    // Harness stopped reading stdin
                    CloseFd(in.WriteEnd());
                }
            } else if (owners[i] == &out.ReadEnd()) {
                DrainFd(out.ReadEnd(), result.stdout_data);
            } else {
                DrainFd(err.ReadEnd(), result.stderr_data);
            }
        }
    }

    // Pipes are closed; the child may still be running until the deadline
    int wstatus = 0;
    while (true) {
        if (result.timed_out) {
            ::kill(pid, SIGKILL);
        }
        pid_t w = ::waitpid(pid, &wstatus, (has_deadline && !result.timed_out) ? WNOHANG : 0);
        if (w == pid) {
            result.exit_status = wstatus;
            break;
        }
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            LogPrintExec(WARN, "waitpid(%d) failed: %s", static_cast<int>(pid), std::strerror(errno));
            break;
        }
        if (RemainingMs(deadline) <= 0) {
            result.timed_out = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    if (result.timed_out) {
        LogPrintExec(WARN, "Harness killed after %lld ms timeout", static_cast<long long>(m_timeoutMs));
    }
    LogPrintExec(DEBUG, "exec #%llu: %zu bytes in, %zu stdout, %zu stderr, status=%d",
                 static_cast<unsigned long long>(m_nExecutions), input.size(),
                 result.stdout_data.size(), result.stderr_data.size(), result.exit_status);
    return result;
}
