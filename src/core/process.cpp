#include "jdki/process.hpp"
#include "jdki/logger.hpp"
#include <cstdio>
#include <stdexcept>

#ifndef _WIN32
#include <cerrno>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace jdki {

#ifdef _WIN32

ProcessResult Process::run(const std::string& exe, const std::vector<std::string>& args,
                           std::function<void(const std::string&)> onOutput) {
    // cmd.exe strips the outer pair of quotes, hence the extra wrapping.
    std::string cmd = "\"\"" + exe + "\"";
    for (const auto& a : args) cmd += " \"" + a + "\"";
    cmd += " 2>&1\"";

    FILE* pipe = _popen(cmd.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to start " + exe);
    }

    ProcessResult result;
    char buffer[1024];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        std::string line(buffer);
        result.output += line;
        if (onOutput) onOutput(line);
    }
    result.exitCode = _pclose(pipe);
    return result;
}

#else

ProcessResult Process::run(const std::string& exe, const std::vector<std::string>& args,
                           std::function<void(const std::string&)> onOutput) {
    std::vector<std::string> finalArgs;
    finalArgs.push_back(exe);
    finalArgs.insert(finalArgs.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (const auto& s : finalArgs) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    int pipefd[2];
    if (pipe(pipefd) == -1) {
        throw std::runtime_error("pipe() failed: " + std::string(std::strerror(errno)));
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error("fork() failed: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        close(pipefd[0]);
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[1]);

        execv(exe.c_str(), argv.data());

        std::fprintf(stderr, "Failed to exec %s: %s\n", exe.c_str(), std::strerror(errno));
        _exit(127);
    }

    close(pipefd[1]);
    ProcessResult result;
    FILE* stream = fdopen(pipefd[0], "r");
    if (stream) {
        char buffer[1024];
        while (fgets(buffer, sizeof(buffer), stream)) {
            std::string line(buffer);
            result.output += line;
            if (onOutput) onOutput(line);
        }
        fclose(stream);
    } else {
        close(pipefd[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::runtime_error("waitpid() failed: " + std::string(std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        LOG_WARN(exe + " terminated by signal " + std::to_string(WTERMSIG(status)));
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}

#endif

} // namespace jdki
