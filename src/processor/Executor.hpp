#pragma once

#include "IProcessor.hpp"
#include <memory>
#include <string>

namespace mcpgate {

/**
 * @brief Map a processor configuration to its implementation
 * @throws ProcessorError for unsupported kinds or malformed kind config
 */
std::unique_ptr<IProcessor> make_processor(const ProcessorConfig& config,
                                           const std::string& working_dir);

/**
 * @brief Runs single processors on behalf of a Chain
 *
 * Stateless apart from the working directory handed to spawned commands.
 */
class Executor {
public:
    /**
     * @brief Construct executor
     * @param working_dir Directory processors run in (default: home directory)
     */
    explicit Executor(std::string working_dir = default_working_dir());

    /**
     * @brief Execute one processor on one input
     * @throws ProcessorError if the processor is disabled or unsupported
     */
    ProcessorOutput execute(const ProcessorConfig& config, const ProcessorInput& input) const;

    const std::string& working_dir() const { return working_dir_; }

    /**
     * @brief $HOME, falling back to the current directory
     */
    static std::string default_working_dir();

private:
    std::string working_dir_;
};

} // namespace mcpgate
