#ifndef JDKI_PROCESS_HPP
#define JDKI_PROCESS_HPP

#include <functional>
#include <string>
#include <vector>

namespace jdki {

struct ProcessResult {
    int exitCode = -1;
    std::string output; // stdout and stderr interleaved
};

class Process {
public:
    // Runs exe synchronously with stdout and stderr captured together.
    // Throws std::runtime_error if the process cannot be started.
    static ProcessResult run(const std::string& exe, const std::vector<std::string>& args,
                             std::function<void(const std::string&)> onOutput = nullptr);
};

} // namespace jdki

#endif // JDKI_PROCESS_HPP
