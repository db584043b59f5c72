#pragma once

/**
 * EngineError.hpp
 * 
 * Fatal environment failure that aborts a whole batch.
 */

#include <stdexcept>
#include <string>

namespace lockerfetch::core {

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace lockerfetch::core
