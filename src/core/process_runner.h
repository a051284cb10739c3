#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace roleicon::core {

struct ProcessResult {
    int exit_code = -1;
    std::string output;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs `executable` with `args` to completion. Returns false only when the
    // process could not be started; a non-zero exit is reported through
    // `out.exit_code`.
    virtual bool run(const std::filesystem::path& executable,
                     const std::vector<std::string>& args,
                     ProcessResult& out,
                     std::string& error) = 0;
};

// fork/execv with stdout and stderr merged into ProcessResult::output.
class PosixProcessRunner : public ProcessRunner {
public:
    bool run(const std::filesystem::path& executable,
             const std::vector<std::string>& args,
             ProcessResult& out,
             std::string& error) override;
};

} // namespace roleicon::core
