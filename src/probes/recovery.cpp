#include "recovery.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <system_error>
#include <utility>

namespace slc {
CommandRecovery::CommandRecovery(std::vector<std::string> argv, const Logger& log)
    : argv_(std::move(argv)), log_(log) {
    if (argv_.empty()) throw std::invalid_argument("recovery command is empty");
}

std::string CommandRecovery::command_line() const {
    std::string out;
    for (const auto& a : argv_) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

void CommandRecovery::invoke() {
    log_.info("running recovery command: " + command_line());
    std::vector<char*> cargv;
    for (auto& a : argv_) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    std::fflush(nullptr);
    pid_t pid = ::fork();
    if (pid < 0) throw std::system_error(errno, std::generic_category(), "fork");
    if (pid == 0) {
        ::execvp(cargv[0], cargv.data());
        std::perror(cargv[0]);
        ::_exit(127);
    }

    int status = 0;
    if (::waitpid(pid, &status, 0) < 0)
        throw std::system_error(errno, std::generic_category(), "waitpid");
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        log_.debug("recovery command exited with status " + std::to_string(code));
        if (code != 0)
            throw RecoveryError("recovery command '" + command_line() + "' exited with status " +
                                    std::to_string(code),
                                code);
        return;
    }
    int sig = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
    throw RecoveryError(
        "recovery command '" + command_line() + "' killed by signal " + std::to_string(sig),
        128 + sig);
}
}  // namespace slc
