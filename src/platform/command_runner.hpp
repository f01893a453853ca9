/**
 * @file command_runner.hpp
 * @brief Bounded execution of external diagnostic and control tools.
 * @author Dimitris Kafetzis
 *
 * Vendor tools (nvidia-smi, sensors, cpupower, nvidia-settings) are run
 * through ICommandRunner so that every call carries a deadline and so that
 * tests can substitute canned output.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace thermal_guard {

struct CommandOutput {
    int exit_code{0};
    std::string stdout_text;

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

/**
 * @brief Abstract process launcher (virtual: injected once at startup).
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @brief Run argv[0] with arguments, capturing stdout.
     *
     * Returns ErrorCode::Timeout if the process outlives `timeout` (the
     * process is killed), ErrorCode::BackendUnavailable if it cannot be
     * started. A non-zero exit status is not an error at this level.
     */
    virtual Result<CommandOutput> run(const std::vector<std::string>& argv,
                                      Duration timeout) = 0;

    /// Whether `program` resolves to an executable on the search path.
    [[nodiscard]] virtual bool available(std::string_view program) const = 0;
};

/**
 * @brief fork/exec implementation with a poll()-driven deadline.
 */
class ProcessCommandRunner : public ICommandRunner {
public:
    /// `search_path` uses $PATH syntax; empty means the process environment.
    explicit ProcessCommandRunner(std::string search_path = {});

    Result<CommandOutput> run(const std::vector<std::string>& argv,
                              Duration timeout) override;
    [[nodiscard]] bool available(std::string_view program) const override;

    static constexpr size_t kMaxOutputBytes = 1024 * 1024;

private:
    [[nodiscard]] std::string resolve(std::string_view program) const;

    std::string search_path_;
};

}  // namespace thermal_guard
