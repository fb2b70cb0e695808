#pragma once

/**
 * @file detector_registry.hpp
 * @brief Built-in detector constructors, one per category
 */

#include "stylint/detector.hpp"

namespace stylint::detectors {

void add_security_detectors(DetectorSet& set);
void add_gas_detectors(DetectorSet& set);
void add_quality_detectors(DetectorSet& set);

}  // namespace stylint::detectors
