/**
 * @file RadiusMapper.hpp
 * @brief Maps similarity-to-concept onto a distance from the canvas center.
 */

#pragma once
#include <vector>
#include "domain/LayoutConfig.hpp"

namespace regionwalker::domain::layout {

/**
 * @class RadiusMapper
 * @brief Higher similarity gives a smaller radius, with a mild convex expansion.
 */
class RadiusMapper {
public:
    explicit RadiusMapper(const RadiusConfig& config) : m_config(config) {}

    /** @brief One radius per similarity score, each within [rMin, rMax]. */
    std::vector<double> Map(const std::vector<double>& similarities) const;

private:
    RadiusConfig m_config;
};

} // namespace regionwalker::domain::layout
