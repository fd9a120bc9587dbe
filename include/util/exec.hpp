#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pw::util::exec {

using Argv = std::vector<std::string>;

inline constexpr size_t COMMAND_EXCERPT_LEN = 50;

class CollectionError : public std::runtime_error {
public:
    CollectionError(const std::string& command, const std::string& reason);

    [[nodiscard]] const std::string& command() const noexcept { return command_; }

private:
    std::string command_;  // truncated excerpt
};

struct Remote {
    std::string host;
    std::string user;
    std::string identity_file;
    std::chrono::seconds connect_timeout{10};

    [[nodiscard]] bool isLocal() const;
    [[nodiscard]] std::string target() const;   // [user@]host
};

struct StageResult {
    int exit_code{0};
    int term_signal{0};
    std::string stderr_text;   // tail only

    [[nodiscard]] bool ok() const { return exit_code == 0 && term_signal == 0; }
};

struct PipelineResult {
    std::string stdout_text;
    std::vector<StageResult> stages;
    double elapsed_sec{};
    bool timed_out{false};

    [[nodiscard]] bool ok() const;

    // First stage that failed on its own account; a SIGPIPE victim only when nothing else failed.
    [[nodiscard]] std::optional<size_t> failedStage() const;
};

class Runner {
public:
    virtual ~Runner() = default;

    // Trimmed stdout. Throws CollectionError on non-zero exit, spawn failure or timeout.
    virtual std::string run(const Argv& argv,
                            std::chrono::seconds timeout,
                            const std::optional<Remote>& remote = std::nullopt) = 0;

    // Stages are connected stdout to stdin. Returns every stage's status; throws CollectionError
    // naming the failing stage when any stage fails or the deadline passes.
    virtual PipelineResult runPipeline(const std::vector<Argv>& stages, std::chrono::seconds timeout) = 0;

    virtual bool toolAvailable(const std::string& tool) = 0;
};

class ProcessRunner final : public Runner {
public:
    std::string run(const Argv& argv, std::chrono::seconds timeout,
                    const std::optional<Remote>& remote = std::nullopt) override;

    PipelineResult runPipeline(const std::vector<Argv>& stages, std::chrono::seconds timeout) override;

    bool toolAvailable(const std::string& tool) override;

private:
    PipelineResult spawn_(const std::vector<Argv>& stages, std::chrono::seconds timeout) const;
};

std::string shellQuote(const std::string& word);
std::string joinQuoted(const Argv& argv);
std::string excerpt(const std::string& command);
std::string excerpt(const Argv& argv);
std::string trim(const std::string& s);

// ssh -T -o BatchMode=yes -o ConnectTimeout=N -o StrictHostKeyChecking=accept-new [extra] [-i key] target cmd
Argv sshArgv(const Remote& remote, const std::string& remoteCommand, const std::vector<std::string>& extraOptions = {});

// argv unchanged for local targets, wrapped in ssh otherwise
Argv wrapForRemote(const Argv& argv, const std::optional<Remote>& remote);

std::string localHostname();

}
