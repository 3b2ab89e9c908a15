#pragma once

#include "ProcessorTypes.hpp"
#include <string>

namespace mcpgate {

/**
 * @brief Abstract interface for processor kinds
 *
 * An implementation inspects or transforms one message. It never throws for
 * misbehavior of the underlying program; such failures are reported as a
 * 500 ProcessorOutput that keeps the input payload.
 */
class IProcessor {
public:
    virtual ~IProcessor() = default;

    /**
     * @brief Configured processor name
     */
    virtual const std::string& name() const = 0;

    /**
     * @brief Process one message
     * @param input Message plus connection and chain context
     * @return Status, resulting payload and optional error/metadata
     */
    virtual ProcessorOutput run(const ProcessorInput& input) = 0;
};

} // namespace mcpgate
