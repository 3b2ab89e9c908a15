#include "CommandProcessor.hpp"
#include "common/Util.hpp"
#include "process/Subprocess.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <limits>

namespace mcpgate {

namespace {

std::string processor_label(const std::string& name) {
    return "processor '" + name + "'";
}

} // namespace

CommandProcessor::CommandProcessor(ProcessorConfig config, std::string working_dir)
    : config_(std::move(config)), working_dir_(std::move(working_dir)) {
    const json& settings = config_.config;

    if (!settings.is_object() || !settings.contains("command") || !settings["command"].is_string()) {
        throw ProcessorError(processor_label(config_.name) + ": config.command must be a string");
    }
    command_ = settings["command"].get<std::string>();

    if (settings.contains("args")) {
        if (!settings["args"].is_array()) {
            throw ProcessorError(processor_label(config_.name) + ": config.args must be an array");
        }
        for (const auto& arg : settings["args"]) {
            if (!arg.is_string()) {
                throw ProcessorError(processor_label(config_.name) + ": config.args must contain only strings");
            }
            args_.push_back(arg.get<std::string>());
        }
    }
}

ProcessorOutput CommandProcessor::run(const ProcessorInput& input) {
    ProcessSpec spec;
    spec.command = command_;
    spec.args = args_;
    spec.working_dir = working_dir_;

    spdlog::debug("Running processor '{}': {}", config_.name, command_);

    ProcessResult result;
    try {
        result = Subprocess::run(spec, json(input).dump(), std::chrono::seconds(config_.timeout));
    } catch (const SubprocessError& e) {
        return failure(input, processor_label(config_.name) + " execution failed: " + e.what());
    }

    if (result.timed_out) {
        return failure(input, processor_label(config_.name) + " timed out after " +
                              std::to_string(config_.timeout) + " seconds");
    }

    if (result.exit_code != 0) {
        std::string message = processor_label(config_.name) + " execution failed: exit status " +
                              std::to_string(result.exit_code);
        if (!result.stderr_data.empty()) {
            message += "\nstderr: " + result.stderr_data;
        }
        return failure(input, std::move(message));
    }

    if (!result.stderr_data.empty()) {
        spdlog::debug("Processor '{}' stderr: {}", config_.name, result.stderr_data);
    }

    return parse_output(input, result.stdout_data);
}

ProcessorOutput CommandProcessor::failure(const ProcessorInput& input, std::string message) const {
    spdlog::warn("{}", message);

    ProcessorOutput output;
    output.status = 500;
    output.payload = input.payload;
    // Captured process output may hold arbitrary bytes
    output.error = to_valid_utf8(message);
    return output;
}

ProcessorOutput CommandProcessor::parse_output(const ProcessorInput& input,
                                               const std::string& stdout_data) const {
    auto invalid = [&](const std::string& reason) {
        std::string message = processor_label(config_.name) + " returned invalid JSON: " + reason;
        if (!stdout_data.empty()) {
            message += "\nstdout: " + stdout_data;
        }
        return failure(input, std::move(message));
    };

    json document;
    try {
        document = json::parse(stdout_data);
    } catch (const json::parse_error& e) {
        return invalid(e.what());
    }

    if (!document.is_object()) {
        return invalid("output must be an object");
    }

    ProcessorOutput output;

    const json status = document.value("status", json(0));
    if (!status.is_number_integer()) {
        return invalid("status must be an integer");
    }
    const bool too_large = status.is_number_unsigned() &&
        status.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    const std::int64_t code = too_large ? 0 : status.get<std::int64_t>();
    if (too_large || code < 100 || code >= 600) {
        return failure(input, processor_label(config_.name) + " returned invalid status code: " + status.dump());
    }
    output.status = static_cast<int>(code);

    const json payload = document.value("payload", json());
    if (payload.is_null()) {
        output.payload = input.payload;
    } else if (payload.is_object()) {
        output.payload = payload;
    } else {
        return invalid("payload must be an object");
    }

    const json error = document.value("error", json());
    if (error.is_string()) {
        output.error = error.get<std::string>();
    } else if (!error.is_null()) {
        return invalid("error must be a string or null");
    }

    const json metadata = document.value("metadata", json());
    if (!metadata.is_null() && !metadata.is_object()) {
        return invalid("metadata must be an object");
    }
    output.metadata = metadata;

    if (output.status >= 400 && !output.error) {
        output.error = "status " + std::to_string(output.status) + " requires error message";
    }

    return output;
}

} // namespace mcpgate
