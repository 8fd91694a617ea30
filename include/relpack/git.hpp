#pragma once

#include <relpack/log.hpp>
#include <relpack/result.hpp>
#include <string>
#include <vector>

namespace relpack {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr. The child is
// killed after `timeout_seconds` (<= 0 waits forever) and a Timeout error
// is returned. A command that cannot be executed exits with 127.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Seam between the pipeline and the processes it starts
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual Result<CommandResult> run(const std::vector<std::string>& args,
                                      const std::string& working_dir,
                                      int timeout_seconds) = 0;
};

class SystemCommandRunner : public CommandRunner {
public:
    Result<CommandResult> run(const std::vector<std::string>& args,
                              const std::string& working_dir,
                              int timeout_seconds) override;
};

// "git tag -d v1.2.3" style rendering for messages
std::string describe_command(const std::vector<std::string>& args);

// Runs `args` and turns a non-zero exit into an ExternalTool error that
// carries the command and the tail of its stderr
Result<CommandResult> run_checked(CommandRunner& runner,
                                  const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds);

// Strict release tags (vX.Y.Z, no suffix) from `git tag -l` output, in
// the order given
std::vector<std::string> parse_tag_list(const std::string& output);

// Wrapper around the git operations the release pipeline needs
class GitCli {
public:
    GitCli(CommandRunner& runner, std::string repo_dir, int timeout_seconds = 60)
        : runner_(runner), repo_dir_(std::move(repo_dir)),
          timeout_seconds_(timeout_seconds) {}

    // `git rev-parse --git-dir` succeeds
    Result<bool> is_repository();

    Status create_tag(const std::string& tag);
    Status delete_tag(const std::string& tag);
    Result<bool> tag_exists(const std::string& tag);

    // `git tag -l v* --sort=-v:refname`, newest first
    Result<std::vector<std::string>> list_release_tags();

    // `git rev-parse --short HEAD`
    Result<std::string> short_head();

    const std::string& repo_dir() const { return repo_dir_; }

private:
    Result<CommandResult> git(const std::vector<std::string>& args);

    CommandRunner& runner_;
    std::string repo_dir_;
    int timeout_seconds_;
};

// Owns a transient tag created for the external build tool. release()
// deletes it and reports the outcome; if release() was never called the
// destructor deletes it and logs any failure.
class TemporaryTag {
public:
    static Result<TemporaryTag> create(GitCli& git, const std::string& tag,
                                       log::Logger& logger);

    TemporaryTag(TemporaryTag&& other) noexcept;
    TemporaryTag& operator=(TemporaryTag&&) = delete;
    TemporaryTag(const TemporaryTag&) = delete;
    TemporaryTag& operator=(const TemporaryTag&) = delete;
    ~TemporaryTag();

    const std::string& name() const { return tag_; }
    bool active() const { return active_; }

    Status release();

private:
    TemporaryTag(GitCli& git, std::string tag, log::Logger& logger)
        : git_(&git), tag_(std::move(tag)), logger_(&logger), active_(true) {}

    GitCli* git_;
    std::string tag_;
    log::Logger* logger_;
    bool active_;
};

} // namespace relpack
