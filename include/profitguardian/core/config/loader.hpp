#pragma once
#include <profitguardian/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    // Throws ProfitGuardian::ConfigurationError on any missing or malformed field
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
    static AppConfig::AppConfiguration loadFromString(const std::string& yaml);

    static void validate(const AppConfig::AppConfiguration& config);
};
