#include "ConfigManager.hpp"
#include "SunCalc.hpp"
#include <cmath>
#include <format>
#include <hyprlang.hpp>
#include <hyprutils/path/Path.hpp>
#include <hyprutils/string/VarList.hpp>
#include <limits>
#include <stdexcept>
#include <string>
#include "helpers/Log.hpp"

static std::string getMainConfigPath() {
    static const auto paths = Hyprutils::Path::findConfig("hourlytemp");

    return paths.first.value_or("");
}

CConfigManager::CConfigManager(std::string configPath) :
    m_config(configPath.empty() ? getMainConfigPath().c_str() : configPath.c_str(), Hyprlang::SConfigOptions{.throwAllErrors = true, .allowMissingConfig = true}) {
    currentConfigPath = configPath.empty() ? getMainConfigPath() : configPath;
}

void CConfigManager::init() {
    m_config.addConfigValue("latitude", Hyprlang::FLOAT{std::numeric_limits<float>::quiet_NaN()});
    m_config.addConfigValue("min-equations", Hyprlang::INT{5});
    m_config.addConfigValue("interpolate-gaps", Hyprlang::INT{1});
    m_config.addConfigValue("max-mean-bias", Hyprlang::FLOAT{std::numeric_limits<float>::quiet_NaN()});
    m_config.addConfigValue("max-stdev-bias", Hyprlang::FLOAT{std::numeric_limits<float>::quiet_NaN()});
    m_config.addConfigValue("proxy-priority", Hyprlang::STRING{""});
    m_config.addConfigValue("heat-base-temperature", Hyprlang::FLOAT{4.0f});
    m_config.addConfigValue("accumulation-output", Hyprlang::STRING{"cumulative"});
    m_config.addConfigValue("verbose", Hyprlang::INT{0});

    m_config.commence();

    auto result = m_config.parse();

    if (result.error)
        Debug::log(ERR, "Config has errors:\n{}\nProceeding ignoring faulty entries", result.getError());

    Debug::trace = std::any_cast<Hyprlang::INT>(m_config.getConfigValue("verbose")) != 0;

    Debug::log(LOG, "config: loaded {}", currentConfigPath.empty() ? "defaults" : currentConfigPath);
}

// unset bias limits mean no limit
static double biasLimit(float value) {
    return std::isnan(value) ? std::numeric_limits<double>::infinity() : static_cast<double>(value);
}

SReconstructionOptions CConfigManager::getReconstructionOptions() {
    SReconstructionOptions options;

    const auto             minEquations = std::any_cast<Hyprlang::INT>(m_config.getConfigValue("min-equations"));
    if (minEquations < 1)
        throw std::invalid_argument(std::format("min-equations must be at least 1, got {}", minEquations));

    options.minEquations    = static_cast<size_t>(minEquations);
    options.interpolateGaps = std::any_cast<Hyprlang::INT>(m_config.getConfigValue("interpolate-gaps")) != 0;
    options.maxMeanBias     = biasLimit(std::any_cast<Hyprlang::FLOAT>(m_config.getConfigValue("max-mean-bias")));
    options.maxStdevBias    = biasLimit(std::any_cast<Hyprlang::FLOAT>(m_config.getConfigValue("max-stdev-bias")));

    Hyprutils::String::CVarList stations(std::any_cast<Hyprlang::STRING>(m_config.getConfigValue("proxy-priority")), 0, ',', true);
    for (const auto& station : stations) {
        if (!station.empty())
            options.proxyPriority.push_back(station);
    }

    return options;
}

NAccumulation::SAccumulationOptions CConfigManager::getAccumulationOptions() {
    NAccumulation::SAccumulationOptions options;

    options.heatBaseTemperature = static_cast<double>(std::any_cast<Hyprlang::FLOAT>(m_config.getConfigValue("heat-base-temperature")));

    const std::string output = std::any_cast<Hyprlang::STRING>(m_config.getConfigValue("accumulation-output"));
    if (output == "cumulative")
        options.output = NAccumulation::OUTPUT_CUMULATIVE;
    else if (output == "hourly")
        options.output = NAccumulation::OUTPUT_PER_HOUR;
    else
        throw std::invalid_argument(std::format("accumulation-output must be 'cumulative' or 'hourly', got '{}'", output));

    return options;
}

double CConfigManager::getLatitude() {
    const double latitude = static_cast<double>(std::any_cast<Hyprlang::FLOAT>(m_config.getConfigValue("latitude")));
    if (std::isnan(latitude))
        throw std::invalid_argument("latitude is not configured");

    // validates the range
    NSunCalc::CSunCalculator calculator(latitude);
    return calculator.latitude();
}
