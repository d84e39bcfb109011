/**
 * @file PathComposer.hpp
 * @brief Places a Hopscotch or Rolling Path selection on a down-right diagonal.
 */

#pragma once

#include <vector>
#include <string>
#include "domain/LayoutConfig.hpp"
#include "domain/LayoutTypes.hpp"
#include "domain/layout/PathBuilder.hpp"

namespace regionwalker::application {

/**
 * @struct PathLayout
 * @brief positions[i] belongs to items[path.order[i]].
 */
struct PathLayout {
    domain::layout::PathResult path;
    std::vector<domain::Position2D> positions;
    std::vector<domain::Card> cards;
};

class PathComposer {
public:
    explicit PathComposer(const domain::LayoutConfig& config) : m_config(config) {}

    /**
     * @brief Orders the items into a path and lays it out.
     *
     * Items that do not make it onto the path are not placed. The concept card
     * sits up-left of the first note; a PathSummary card one step past the last.
     */
    PathLayout Compose(const std::vector<domain::Item>& items,
                       const std::vector<float>& conceptEmbedding,
                       const std::string& conceptText,
                       domain::layout::PathVariant variant,
                       int cap,
                       const domain::Position2D& center) const;

    /** @brief Center of the i-th step of the diagonal. */
    domain::Position2D StepPosition(const domain::Position2D& center, size_t index) const;

private:
    domain::LayoutConfig m_config;
};

} // namespace regionwalker::application
