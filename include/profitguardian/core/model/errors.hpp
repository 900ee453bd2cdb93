#pragma once

#include <stdexcept>
#include <string>

namespace ProfitGuardian {

// Fatal at startup: missing limits or malformed thresholds
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Tick-wide: the journal could not be written or read
class StoreUnavailableError : public std::runtime_error {
public:
    explicit StoreUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

// Tick-wide: the platform could not be reached at all
class PlatformUnavailableError : public std::runtime_error {
public:
    explicit PlatformUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ProfitGuardian
