#include "util/exec.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pw::util::exec {

namespace {

constexpr size_t STDERR_TAIL_BYTES = 64 * 1024;

void appendTail(std::string& dst, const char* data, const size_t n) {
    dst.append(data, n);
    if (dst.size() > STDERR_TAIL_BYTES) dst.erase(0, dst.size() - STDERR_TAIL_BYTES);
}

std::string joinPipeline(const std::vector<Argv>& stages) {
    std::string out;
    for (size_t i = 0; i < stages.size(); ++i) {
        if (i) out += " | ";
        out += joinQuoted(stages[i]);
    }
    return out;
}

struct Child {
    pid_t pid{-1};
    int stderr_fd{-1};
    StageResult result;
};

void closeFd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

}

CollectionError::CollectionError(const std::string& command, const std::string& reason)
    : std::runtime_error(fmt::format("Command failed [{}]: {}", command, reason)),
      command_(command) {}

bool Remote::isLocal() const {
    return host.empty() || host == "localhost" || host == "127.0.0.1" || host == "::1";
}

std::string Remote::target() const {
    return user.empty() ? host : user + "@" + host;
}

bool PipelineResult::ok() const {
    return !timed_out && std::all_of(stages.begin(), stages.end(), [](const StageResult& s) { return s.ok(); });
}

std::optional<size_t> PipelineResult::failedStage() const {
    std::optional<size_t> sigpipeVictim;
    for (size_t i = 0; i < stages.size(); ++i) {
        if (stages[i].ok()) continue;
        if (stages[i].term_signal == SIGPIPE) {
            if (!sigpipeVictim) sigpipeVictim = i;
            continue;
        }
        return i;
    }
    return sigpipeVictim;
}

std::string shellQuote(const std::string& word) {
    if (!word.empty() && std::all_of(word.begin(), word.end(), [](const char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || std::strchr("@%+=:,./_-", c);
    })) return word;

    std::string out = "'";
    for (const char c : word) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string joinQuoted(const Argv& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += shellQuote(a);
    }
    return out;
}

std::string excerpt(const std::string& command) {
    return command.size() > COMMAND_EXCERPT_LEN ? command.substr(0, COMMAND_EXCERPT_LEN) : command;
}

std::string excerpt(const Argv& argv) { return excerpt(joinQuoted(argv)); }

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

Argv sshArgv(const Remote& remote, const std::string& remoteCommand, const std::vector<std::string>& extraOptions) {
    Argv argv{
        "ssh", "-T",
        "-o", "BatchMode=yes",
        "-o", fmt::format("ConnectTimeout={}", remote.connect_timeout.count()),
        "-o", "StrictHostKeyChecking=accept-new"
    };
    for (const auto& opt : extraOptions) {
        argv.emplace_back("-o");
        argv.push_back(opt);
    }
    if (!remote.identity_file.empty()) {
        argv.emplace_back("-i");
        argv.push_back(remote.identity_file);
    }
    argv.push_back(remote.target());
    argv.push_back(remoteCommand);
    return argv;
}

Argv wrapForRemote(const Argv& argv, const std::optional<Remote>& remote) {
    if (!remote || remote->isLocal()) return argv;
    return sshArgv(*remote, joinQuoted(argv));
}

std::string localHostname() {
    std::array<char, 256> buf{};
    if (::gethostname(buf.data(), buf.size() - 1) != 0) return "localhost";
    return {buf.data()};
}

std::string ProcessRunner::run(const Argv& argv, const std::chrono::seconds timeout, const std::optional<Remote>& remote) {
    const auto full = wrapForRemote(argv, remote);
    const auto result = spawn_({full}, timeout);

    if (result.timed_out)
        throw CollectionError(excerpt(full), fmt::format("timed out after {}s", timeout.count()));

    const auto& stage = result.stages.front();
    if (!stage.ok()) {
        const auto reason = stage.term_signal
            ? fmt::format("killed by signal {}", stage.term_signal)
            : fmt::format("exit status {}: {}", stage.exit_code, trim(stage.stderr_text));
        throw CollectionError(excerpt(full), reason);
    }

    return trim(result.stdout_text);
}

PipelineResult ProcessRunner::runPipeline(const std::vector<Argv>& stages, const std::chrono::seconds timeout) {
    if (stages.empty()) throw std::invalid_argument("runPipeline requires at least one stage");

    auto result = spawn_(stages, timeout);

    if (result.timed_out)
        throw CollectionError(excerpt(joinPipeline(stages)), fmt::format("timed out after {}s", timeout.count()));

    if (const auto failed = result.failedStage()) {
        const auto& stage = result.stages[*failed];
        throw CollectionError(excerpt(stages[*failed]),
                              fmt::format("pipeline stage {} failed ({}): {}", *failed,
                                          stage.term_signal ? fmt::format("signal {}", stage.term_signal)
                                                            : fmt::format("exit {}", stage.exit_code),
                                          trim(stage.stderr_text)));
    }

    return result;
}

bool ProcessRunner::toolAvailable(const std::string& tool) {
    try {
        return !run({"which", tool}, std::chrono::seconds(5)).empty();
    } catch (const CollectionError&) {
        return false;
    }
}

PipelineResult ProcessRunner::spawn_(const std::vector<Argv>& stages, const std::chrono::seconds timeout) const {
    log::Registry::exec()->debug("[ProcessRunner] Running: {}", joinPipeline(stages));

    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;

    std::vector<Child> children(stages.size());

    const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) throw std::runtime_error("Failed to open /dev/null");

    int prevRead = devnull;
    int stdoutFd = -1;

    const auto abortSpawn = [&](const std::string& why) {
        closeFd(prevRead);
        for (auto& c : children) {
            closeFd(c.stderr_fd);
            if (c.pid > 0) {
                ::kill(c.pid, SIGKILL);
                ::waitpid(c.pid, nullptr, 0);
            }
        }
        throw CollectionError(excerpt(joinPipeline(stages)), why);
    };

    for (size_t i = 0; i < stages.size(); ++i) {
        if (stages[i].empty()) abortSpawn(fmt::format("stage {} has no arguments", i));

        int outPipe[2];
        int errPipe[2];
        if (::pipe2(outPipe, O_CLOEXEC) == -1) abortSpawn("pipe() failed");
        if (::pipe2(errPipe, O_CLOEXEC) == -1) {
            ::close(outPipe[0]);
            ::close(outPipe[1]);
            abortSpawn("pipe() failed");
        }

        const pid_t pid = ::fork();
        if (pid < 0) {
            for (const int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) ::close(fd);
            abortSpawn("fork() failed");
        }

        if (pid == 0) {
            ::signal(SIGPIPE, SIG_DFL);
            ::dup2(prevRead, STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);

            std::vector<char*> args;
            args.reserve(stages[i].size() + 1);
            for (const auto& a : stages[i]) args.push_back(const_cast<char*>(a.c_str()));
            args.push_back(nullptr);

            ::execvp(args[0], args.data());
            const auto msg = fmt::format("execvp {}: {}\n", stages[i][0], std::strerror(errno));
            [[maybe_unused]] const auto n = ::write(STDERR_FILENO, msg.data(), msg.size());
            ::_exit(127);
        }

        children[i].pid = pid;
        children[i].stderr_fd = errPipe[0];
        ::close(errPipe[1]);
        ::close(outPipe[1]);
        closeFd(prevRead);
        prevRead = outPipe[0];
    }

    stdoutFd = prevRead;
    prevRead = -1;

    PipelineResult result;
    std::array<char, 8192> buf{};

    const auto openFds = [&] {
        std::vector<pollfd> fds;
        if (stdoutFd >= 0) fds.push_back({stdoutFd, POLLIN, 0});
        for (const auto& c : children)
            if (c.stderr_fd >= 0) fds.push_back({c.stderr_fd, POLLIN, 0});
        return fds;
    };

    for (auto fds = openFds(); !fds.empty(); fds = openFds()) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        const int rc = ::poll(fds.data(), fds.size(), static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.timed_out = true;
            break;
        }
        if (rc == 0) continue;

        for (const auto& p : fds) {
            if (!(p.revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const ssize_t n = ::read(p.fd, buf.data(), buf.size());

            if (p.fd == stdoutFd) {
                if (n > 0) result.stdout_text.append(buf.data(), static_cast<size_t>(n));
                else closeFd(stdoutFd);
                continue;
            }

            for (auto& c : children) {
                if (c.stderr_fd != p.fd) continue;
                if (n > 0) appendTail(c.result.stderr_text, buf.data(), static_cast<size_t>(n));
                else closeFd(c.stderr_fd);
                break;
            }
        }
    }

    if (result.timed_out) {
        log::Registry::exec()->warn("[ProcessRunner] Deadline of {}s passed, killing {} process(es)",
                                    timeout.count(), children.size());
        for (const auto& c : children) ::kill(c.pid, SIGKILL);
    }

    closeFd(stdoutFd);
    for (auto& c : children) {
        closeFd(c.stderr_fd);
        int status = 0;
        while (::waitpid(c.pid, &status, 0) < 0 && errno == EINTR) {}
        if (WIFEXITED(status)) c.result.exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status)) c.result.term_signal = WTERMSIG(status);
        result.stages.push_back(std::move(c.result));
    }

    result.elapsed_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    return result;
}

}
