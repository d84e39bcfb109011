#include <cassert>
#include <iostream>

#include "application/CrowdComposer.hpp"
#include "domain/layout/CrowdPlacer.hpp"
#include "TestSupport.hpp"

using namespace regionwalker;
using namespace regionwalker::domain;
using namespace regionwalker::domain::layout;
using application::CrowdComposer;
using application::CrowdFormation;
using test::Distance;
using test::Near;

namespace {

void TestRegiment() {
    LayoutConfig config;
    CrowdPlacer placer(config.canvas, config.regiment, config.gaggle);

    assert(CrowdPlacer::RegimentColumns(0) == 1 && "At least one column");
    assert(CrowdPlacer::RegimentColumns(10) == 3 && "floor(sqrt(10)) columns");
    assert(CrowdPlacer::RegimentColumns(16) == 4 && "Perfect square");

    const Position2D origin{40.0, 60.0};
    auto cells = placer.Regiment(10, origin);
    assert(cells.size() == 10 && "One cell per item");
    assert(Near(cells[0], origin) && "First cell sits on the origin");
    assert(Near(cells[1], {370.0, 60.0}) && "Column pitch is note width plus gap");
    assert(Near(cells[3], {40.0, 310.0}) && "Row pitch is note height plus gap");
    assert(Near(cells[9], {40.0, 810.0}) && "Ten items fill four rows");
    std::cout << "[PASS] Regiment grid." << std::endl;
}

void TestGaggle() {
    LayoutConfig config;
    CrowdPlacer placer(config.canvas, config.regiment, config.gaggle);
    assert(Near(placer.GaggleSpacing(), 300.0) && "Spacing is the larger note side plus padding");
    assert(Near(placer.GaggleRadius(1), config.gaggle.minRadius) && "Small crowds use the minimum radius");

    const Position2D origin{-200.0, 100.0};
    const size_t n = 25;
    MersenneRandomSource rng(21);
    auto points = placer.Gaggle(n, origin, rng);
    assert(points.size() == n && "Every item is placed");

    const double spacing = placer.GaggleSpacing();
    const double radius = placer.GaggleRadius(n);
    for (size_t j = 0; j < n; ++j) {
        if (points[j].outcome == PlacementOutcome::BestEffort) continue;
        for (size_t i = 0; i < j; ++i) {
            assert(Distance(points[i].position, points[j].position) >= spacing - 1e-9 &&
                   "Accepted positions keep their distance to earlier ones");
        }
        double limit = points[j].outcome == PlacementOutcome::Strict
            ? radius * config.gaggle.strict.radiusExpansion * config.gaggle.strict.boundFactor
            : radius * config.gaggle.relaxed.radiusExpansion * config.gaggle.relaxed.boundFactor;
        assert(Distance(points[j].position, origin) <= limit + 1e-9 && "Accepted positions stay in bounds");
    }

    MersenneRandomSource replay(21);
    auto again = placer.Gaggle(n, origin, replay);
    for (size_t i = 0; i < n; ++i) {
        assert(Near(points[i].position, again[i].position) && "Same seed, same crowd");
    }
    std::cout << "[PASS] Gaggle spacing." << std::endl;
}

void TestGaggleFallback() {
    // Notes far larger than the disk: only the first one fits cleanly
    LayoutConfig config;
    config.canvas.noteWidth = 1000.0;
    config.canvas.noteHeight = 1000.0;
    config.gaggle.radiusScale = 0.1;
    config.gaggle.minRadius = 1.0;
    CrowdPlacer placer(config.canvas, config.regiment, config.gaggle);

    MersenneRandomSource rng(4);
    auto points = placer.Gaggle(20, {0.0, 0.0}, rng);
    assert(points.size() == 20 && "Budget exhaustion still places everyone");
    assert(points[0].outcome == PlacementOutcome::Strict && "First note has nobody to collide with");
    for (size_t i = 1; i < points.size(); ++i) {
        assert(points[i].outcome == PlacementOutcome::BestEffort && "Impossible spacing is flagged best-effort");
        assert(std::isfinite(points[i].position.x) && std::isfinite(points[i].position.y) && "No NaN");
    }
    std::cout << "[PASS] Gaggle best-effort fallback." << std::endl;
}

void TestComposer() {
    LayoutConfig config;
    CrowdComposer composer(config);
    const Position2D center{10.0, 20.0};
    assert(Near(composer.CrowdOrigin(center), {10.0, 220.0}) && "Crowd hangs below the center");

    MersenneRandomSource rng(8);
    auto regiment = composer.Compose(4, CrowdFormation::Regiment, "Topic", center, rng);
    assert(regiment.points.size() == 4 && "One point per item");
    assert(Near(regiment.points[0].position, {10.0, 220.0}) && "Grid starts at the crowd origin");
    assert(regiment.cards.size() == 1 && regiment.cards[0].kind == CardKind::Concept &&
           Near(regiment.cards[0].anchor, {10.0, -30.0}) && "Concept card is raised above the center");

    auto gaggle = composer.Compose(6, CrowdFormation::Gaggle, "", center, rng);
    assert(gaggle.points.size() == 6 && gaggle.cards.empty() && "No concept text, no card");
    std::cout << "[PASS] Crowd composer." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CrowdPlacer Test..." << std::endl;
    TestRegiment();
    TestGaggle();
    TestGaggleFallback();
    TestComposer();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
