#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/logger.hpp"

namespace slc {
// Raised when the recovery command exits non-zero or dies from a signal.
class RecoveryError : public std::runtime_error {
   public:
    RecoveryError(const std::string& msg, int status)
        : std::runtime_error(msg), status_(status) {}
    int status() const {
        return status_;
    }

   private:
    int status_;
};

class Recovery {
   public:
    virtual ~Recovery() = default;
    virtual void invoke() = 0;
};

// Runs an argv-style command to completion; the child inherits stdio.
class CommandRecovery : public Recovery {
   public:
    CommandRecovery(std::vector<std::string> argv, const Logger& log);
    void invoke() override;
    std::string command_line() const;

   private:
    std::vector<std::string> argv_;
    const Logger& log_;
};
}  // namespace slc
