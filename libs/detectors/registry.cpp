/**
 * @file registry.cpp
 * @brief Default detector set
 */

#include "detector_registry.hpp"

#include <algorithm>

namespace stylint::detectors {

const DetectorSet& default_detectors()
{
    static const DetectorSet kDetectors = [] {
        DetectorSet set;
        add_security_detectors(set);
        add_gas_detectors(set);
        add_quality_detectors(set);
        return set;
    }();
    return kDetectors;
}

DetectorSet filter_by_category(const DetectorSet& set, const std::vector<Category>& categories)
{
    DetectorSet filtered;
    for (const auto& detector : set) {
        if (detector && std::ranges::find(categories, detector->descriptor().category) != categories.end()) {
            filtered.push_back(detector);
        }
    }
    return filtered;
}

}  // namespace stylint::detectors
