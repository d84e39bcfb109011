/**
 * @file CrowdComposer.hpp
 * @brief Regiment and Gaggle crowds below a raised concept card.
 */

#pragma once

#include <vector>
#include <string>
#include "domain/LayoutConfig.hpp"
#include "domain/LayoutTypes.hpp"
#include "domain/RandomSource.hpp"
#include "domain/layout/CrowdPlacer.hpp"

namespace regionwalker::application {

/**
 * @enum CrowdFormation
 * @brief Which crowd arrangement to produce.
 */
enum class CrowdFormation {
    Regiment,
    Gaggle
};

struct CrowdLayout {
    std::vector<domain::layout::CrowdPoint> points; ///< One per input item, same order.
    std::vector<domain::Card> cards;
};

class CrowdComposer {
public:
    explicit CrowdComposer(const domain::LayoutConfig& config) : m_config(config) {}

    /** @brief Crowd origin: center shifted down by crowdOffsetY. */
    domain::Position2D CrowdOrigin(const domain::Position2D& center) const;

    CrowdLayout Compose(size_t count,
                        CrowdFormation formation,
                        const std::string& conceptText,
                        const domain::Position2D& center,
                        domain::RandomSource& rng) const;

private:
    domain::LayoutConfig m_config;
};

} // namespace regionwalker::application
