#pragma once

#include "IProcessor.hpp"
#include <string>
#include <vector>

namespace mcpgate {

/**
 * @brief Processor backed by an external command ("cli" kind)
 *
 * Each run spawns the command in the working directory, writes the
 * serialized ProcessorInput to its stdin and expects one ProcessorOutput
 * JSON document on stdout before the configured timeout.
 */
class CommandProcessor : public IProcessor {
public:
    /**
     * @brief Construct from a "cli" processor configuration
     * @param config Processor configuration (config.command required)
     * @param working_dir Directory the command runs in
     * @throws ProcessorError if config.command/config.args are malformed
     */
    CommandProcessor(ProcessorConfig config, std::string working_dir);

    const std::string& name() const override { return config_.name; }
    ProcessorOutput run(const ProcessorInput& input) override;

    const std::string& command() const { return command_; }
    const std::vector<std::string>& args() const { return args_; }

private:
    ProcessorOutput failure(const ProcessorInput& input, std::string message) const;
    ProcessorOutput parse_output(const ProcessorInput& input, const std::string& stdout_data) const;

    ProcessorConfig config_;
    std::string working_dir_;
    std::string command_;
    std::vector<std::string> args_;
};

} // namespace mcpgate
