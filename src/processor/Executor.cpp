#include "Executor.hpp"
#include "CommandProcessor.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <unistd.h>

namespace mcpgate {

std::unique_ptr<IProcessor> make_processor(const ProcessorConfig& config,
                                           const std::string& working_dir) {
    if (config.type == "cli") {
        return std::make_unique<CommandProcessor>(config, working_dir);
    }
    throw ProcessorError("unsupported processor type '" + config.type + "'");
}

Executor::Executor(std::string working_dir)
    : working_dir_(std::move(working_dir)) {
}

std::string Executor::default_working_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }

    char buffer[4096];
    if (getcwd(buffer, sizeof(buffer))) {
        return buffer;
    }
    return ".";
}

ProcessorOutput Executor::execute(const ProcessorConfig& config, const ProcessorInput& input) const {
    if (!config.enabled) {
        throw ProcessorError("processor '" + config.name + "' is disabled");
    }

    auto processor = make_processor(config, working_dir_);
    ProcessorOutput output = processor->run(input);

    spdlog::debug("Processor '{}' returned status {}", config.name, output.status);
    return output;
}

} // namespace mcpgate
