/**
 * @file LayoutConfig.hpp
 * @brief Tuning constants for every layout component.
 *
 * Each component keeps its own copy of the section it needs, so differently
 * tuned layouts can run side by side. Defaults reproduce the canvas behaviour the
 * plugin shipped with.
 */

#pragma once

namespace regionwalker::domain {

constexpr double kPi = 3.14159265358979323846;

/** @brief Similarity-to-radius mapping for Walkabout. */
struct RadiusConfig {
    double rMin = 600.0;
    double rMax = 2400.0;
    double expansionPower = 1.25;
    double similarityEpsilon = 1e-10;
};

/** @brief Spring relaxation used to derive 2D coordinates. */
struct ForceConfig {
    int iterations = 100;
    double springConstant = 50.0;
    double damping = 0.9;
    double initialRadius = 100.0;
    double minDistance = 0.1;
    double initialJitter = 0.0; ///< Start-layout perturbation; 0 keeps the circle exact.
};

/** @brief Swirl detection and rotation search. */
struct NormalizerConfig {
    double swirlGapRatio = 3.0;
    double rotationStepDegrees = 10.0;
};

/** @brief k-means over the normalized layout. */
struct ClusteringConfig {
    int minClusters = 3;
    int maxClusters = 8;
    int itemsPerCluster = 5;
    int maxIterations = 50;
    double convergenceEpsilon = 0.01;
};

/** @brief Spread of cluster mates and summary card placement. */
struct WalkaboutConfig {
    double maxRadialSpread = 120.0;
    double maxAngularSpread = kPi / 6.0;
    double radialSpreadDecay = 0.5;
    double angularSpreadDecay = 0.6;
    double midLevelLow = 0.3;
    double midLevelHigh = 0.7;
    double inwardPullFactor = 0.3;
    double radiusFloorFactor = 0.95;
    double minRadialFraction = 0.25;
    double summaryCardOffset = 150.0;
    int summarySourceLimit = 10;
};

/** @brief Hopscotch / Rolling Path construction and placement. */
struct PathConfig {
    double similarityThreshold = 0.65;
    int maxLength = 50;
    double stepSpacing = 100.0;
    int summarySourceLimit = 20;
};

/** @brief Regiment grid. */
struct RegimentConfig {
    double gridGap = 50.0;
};

/** @brief One rejection-sampling phase of the Gaggle placer. */
struct GagglePhase {
    int attempts = 2000;
    double radiusExpansion = 1.0;
    double noiseFactor = 0.8;  ///< Gaussian std-dev as a fraction of min spacing.
    double jitterFactor = 0.3; ///< Uniform jitter width as a fraction of min spacing.
    double boundFactor = 1.2;  ///< Acceptance circle relative to the phase radius.
};

/** @brief Organic crowd scatter. */
struct GaggleConfig {
    double spacingPadding = 20.0;
    double minRadius = 600.0;
    double radiusScale = 1.8;
    GagglePhase strict{2000, 1.0, 0.8, 0.3, 1.2};
    GagglePhase relaxed{500, 1.5, 1.0, 0.4, 1.2};
};

/** @brief Node and card footprints plus crowd offsets. */
struct CanvasConfig {
    double noteWidth = 280.0;
    double noteHeight = 200.0;
    double conceptCardWidth = 400.0;
    double conceptCardHeight = 150.0;
    double clusterCardWidth = 300.0;
    double clusterCardHeight = 100.0;
    double crowdOffsetY = 200.0;
    double conceptCardRaise = 50.0;
    int excerptLength = 500;
};

/**
 * @struct LayoutConfig
 * @brief Aggregate of all layout tunables.
 */
struct LayoutConfig {
    RadiusConfig radius;
    ForceConfig force;
    NormalizerConfig normalizer;
    ClusteringConfig clustering;
    WalkaboutConfig walkabout;
    PathConfig path;
    RegimentConfig regiment;
    GaggleConfig gaggle;
    CanvasConfig canvas;
};

} // namespace regionwalker::domain
