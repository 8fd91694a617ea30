#include <relpack/tool_lookup.hpp>

#include <cstdlib>

namespace relpack {

std::string expand_home(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home != nullptr && *home != '\0') {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Result<std::string> find_candidate(const std::vector<std::string>& candidates,
                                   const CandidateCheck& check) {
    if (candidates.empty()) {
        return RelpackError{RelpackError::NotFound, "no candidates to try"};
    }

    std::string tried;
    for (const auto& c : candidates) {
        std::string path = expand_home(c);
        auto st = check(path);
        if (st.is_ok()) return Result<std::string>::ok(std::move(path));
        tried += "\n  " + path + ": " + st.error().message;
    }
    return RelpackError{RelpackError::NotFound,
        "none of the candidates could be used:" + tried,
        "install the tool or list its location in the configuration"};
}

Result<std::string> find_tool(CommandRunner& runner,
                              const std::vector<std::string>& candidates,
                              int timeout_seconds) {
    return find_candidate(candidates, [&](const std::string& path) -> Status {
        auto r = runner.run({path, "--version"}, "", timeout_seconds);
        if (r.is_err()) return std::move(r).error();
        if (r.value().exit_code == 127) {
            return RelpackError{RelpackError::NotFound, "not found"};
        }
        if (r.value().exit_code != 0) {
            return RelpackError{RelpackError::ExternalTool,
                "--version exited with status " + std::to_string(r.value().exit_code)};
        }
        return ok_status();
    });
}

} // namespace relpack
