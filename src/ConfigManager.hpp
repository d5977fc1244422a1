#pragma once

#include "Accumulation.hpp"
#include "Options.hpp"
#include <hyprlang.hpp>
#include <string>

class CConfigManager {
  public:
    // an empty path looks up hourlytemp.conf in the user's config directories
    CConfigManager(std::string configPath);

    void                                init();

    SReconstructionOptions              getReconstructionOptions();
    NAccumulation::SAccumulationOptions getAccumulationOptions();
    // throws std::invalid_argument when unset or out of range
    double                              getLatitude();

  private:
    Hyprlang::CConfig m_config;

    std::string       currentConfigPath;
};
