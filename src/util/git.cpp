#include <relpack/git.hpp>
#include <relpack/version.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace relpack {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Read whatever is available; returns false once the pipe hit EOF
bool drain_pipe(int fd, std::string& out) {
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return true;  // EAGAIN: nothing more right now
    }
}

} // namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return RelpackError{RelpackError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0) {
        return RelpackError{RelpackError::IO,
            std::string("pipe() failed: ") + std::strerror(errno)};
    }
    if (pipe(err_pipe) != 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return RelpackError{RelpackError::IO,
            std::string("pipe() failed: ") + std::strerror(saved)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) close_fd(*fd);
        return RelpackError{RelpackError::IO,
            std::string("fork() failed: ") + std::strerror(saved)};
    }

    if (pid == 0) {
        // Child
        close(out_pipe[0]);
        close(err_pipe[0]);
        if (dup2(out_pipe[1], STDOUT_FILENO) < 0 || dup2(err_pipe[1], STDERR_FILENO) < 0) {
            _exit(127);
        }
        close(out_pipe[1]);
        close(err_pipe[1]);
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    if (fcntl(out_fd, F_SETFL, O_NONBLOCK) != 0 || fcntl(err_fd, F_SETFL, O_NONBLOCK) != 0) {
        int saved = errno;
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        close_fd(out_fd);
        close_fd(err_fd);
        return RelpackError{RelpackError::IO,
            std::string("fcntl() failed: ") + std::strerror(saved)};
    }

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        if (timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close_fd(out_fd);
                close_fd(err_fd);
                return RelpackError{RelpackError::Timeout,
                    describe_command(args) + " timed out after " +
                    std::to_string(timeout_seconds) + "s"};
            }
        }

        pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
        int nfds = 0;
        if (out_fd >= 0) ++nfds;
        if (err_fd >= 0) ++nfds;
        if (out_fd < 0) fds[0] = fds[1];
        if (nfds > 0 && poll(fds, static_cast<nfds_t>(nfds), 20) < 0 && errno != EINTR) {
            int saved = errno;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close_fd(out_fd);
            close_fd(err_fd);
            return RelpackError{RelpackError::IO,
                std::string("poll() failed: ") + std::strerror(saved)};
        }
        if (out_fd >= 0 && !drain_pipe(out_fd, out_buf)) close_fd(out_fd);
        if (err_fd >= 0 && !drain_pipe(err_fd, err_buf)) close_fd(err_fd);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            // Whatever the child wrote before exiting is still in the pipes
            if (out_fd >= 0) drain_pipe(out_fd, out_buf);
            if (err_fd >= 0) drain_pipe(err_fd, err_buf);
            close_fd(out_fd);
            close_fd(err_fd);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        }
        if (w < 0 && errno != EINTR) {
            int saved = errno;
            close_fd(out_fd);
            close_fd(err_fd);
            return RelpackError{RelpackError::IO,
                std::string("waitpid failed: ") + std::strerror(saved)};
        }
        if (nfds == 0) usleep(1000);
    }
}

Result<CommandResult> SystemCommandRunner::run(const std::vector<std::string>& args,
                                               const std::string& working_dir,
                                               int timeout_seconds) {
    return run_command(args, working_dir, timeout_seconds);
}

std::string describe_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

static std::string tail_lines(const std::string& text, size_t max_lines) {
    std::string trimmed = text;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    size_t pos = trimmed.size();
    for (size_t n = 0; n < max_lines && pos != std::string::npos && pos > 0; ++n) {
        pos = trimmed.rfind('\n', pos - 1);
    }
    if (pos == std::string::npos || pos == 0) return trimmed;
    return trimmed.substr(pos + 1);
}

Result<CommandResult> run_checked(CommandRunner& runner,
                                  const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    auto r = runner.run(args, working_dir, timeout_seconds);
    if (r.is_err()) {
        return std::move(r).error().with_context(describe_command(args));
    }
    if (r.value().exit_code != 0) {
        std::string msg = describe_command(args) + " exited with status " +
                          std::to_string(r.value().exit_code);
        std::string detail = tail_lines(r.value().stderr_str, 5);
        if (!detail.empty()) msg += ": " + detail;
        return RelpackError{RelpackError::ExternalTool, msg};
    }
    return r;
}

// ---------------------------------------------------------------------------
// Tag parsing
// ---------------------------------------------------------------------------

std::vector<std::string> parse_tag_list(const std::string& output) {
    std::vector<std::string> tags;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) continue;
        auto end = line.find_last_not_of(" \t\r");
        std::string tag = line.substr(start, end - start + 1);

        auto v = Version::parse(tag);
        if (v.is_err() || v.value().is_snapshot()) continue;
        tags.push_back(std::move(tag));
    }
    return tags;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<CommandResult> GitCli::git(const std::vector<std::string>& args) {
    std::vector<std::string> full{"git"};
    full.insert(full.end(), args.begin(), args.end());
    return runner_.run(full, repo_dir_, timeout_seconds_);
}

Result<bool> GitCli::is_repository() {
    auto r = git({"rev-parse", "--git-dir"});
    if (r.is_err()) return std::move(r).error();
    return Result<bool>::ok(r.value().exit_code == 0);
}

Status GitCli::create_tag(const std::string& tag) {
    auto r = git({"tag", tag});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return RelpackError{RelpackError::ExternalTool,
            "git tag " + tag + " failed: " + r.value().stderr_str};
    }
    return ok_status();
}

Status GitCli::delete_tag(const std::string& tag) {
    auto r = git({"tag", "-d", tag});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return RelpackError{RelpackError::ExternalTool,
            "git tag -d " + tag + " failed: " + r.value().stderr_str,
            "remove it manually with: git tag -d " + tag};
    }
    return ok_status();
}

Result<bool> GitCli::tag_exists(const std::string& tag) {
    auto r = git({"rev-parse", "-q", "--verify", "refs/tags/" + tag});
    if (r.is_err()) return std::move(r).error();
    return Result<bool>::ok(r.value().exit_code == 0);
}

Result<std::vector<std::string>> GitCli::list_release_tags() {
    auto r = git({"tag", "-l", "v*", "--sort=-v:refname"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return RelpackError{RelpackError::ExternalTool,
            "git tag -l failed: " + r.value().stderr_str};
    }
    return Result<std::vector<std::string>>::ok(parse_tag_list(r.value().stdout_str));
}

Result<std::string> GitCli::short_head() {
    auto r = git({"rev-parse", "--short", "HEAD"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return RelpackError{RelpackError::ExternalTool,
            "git rev-parse --short HEAD failed: " + r.value().stderr_str};
    }
    std::string sha = r.value().stdout_str;
    while (!sha.empty() && (sha.back() == '\n' || sha.back() == '\r')) sha.pop_back();
    return Result<std::string>::ok(std::move(sha));
}

// ---------------------------------------------------------------------------
// TemporaryTag
// ---------------------------------------------------------------------------

Result<TemporaryTag> TemporaryTag::create(GitCli& git, const std::string& tag,
                                          log::Logger& logger) {
    RELPACK_TRY(git.create_tag(tag));
    logger.debug("created temporary tag %s", tag.c_str());
    return Result<TemporaryTag>::ok(TemporaryTag(git, tag, logger));
}

TemporaryTag::TemporaryTag(TemporaryTag&& other) noexcept
    : git_(other.git_), tag_(std::move(other.tag_)), logger_(other.logger_),
      active_(other.active_) {
    other.active_ = false;
}

TemporaryTag::~TemporaryTag() {
    if (!active_) return;
    auto st = release();
    if (st.is_err()) logger_->report(st.error());
}

Status TemporaryTag::release() {
    if (!active_) return ok_status();
    active_ = false;
    auto st = git_->delete_tag(tag_);
    if (st.is_ok()) logger_->debug("removed temporary tag %s", tag_.c_str());
    return st;
}

} // namespace relpack
