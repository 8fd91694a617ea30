#pragma once

#include <relpack/git.hpp>
#include <relpack/result.hpp>
#include <functional>
#include <string>
#include <vector>

namespace relpack {

// Replaces a leading "~/" with $HOME
std::string expand_home(const std::string& path);

using CandidateCheck = std::function<Status(const std::string& candidate)>;

// Tries each candidate (after ~ expansion) in order and returns the first
// one `check` accepts. When none is accepted the NotFound error lists every
// candidate with the reason it was rejected.
Result<std::string> find_candidate(const std::vector<std::string>& candidates,
                                   const CandidateCheck& check);

// find_candidate with "<candidate> --version exits 0" as the check
Result<std::string> find_tool(CommandRunner& runner,
                              const std::vector<std::string>& candidates,
                              int timeout_seconds = 30);

} // namespace relpack
