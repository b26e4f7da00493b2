#include <gtest/gtest.h>

#include "config.hpp"
#include "geometry.hpp"
#include "graph.hpp"
#include "test_helpers.hpp"

#include <cstring>

namespace {

Graph chain3()
{
    Graph g;
    g.addVertex({ 0.0f, 0.0f, 0.0f });
    g.addVertex({ 1.0f, 2.0f, 3.0f });
    g.addVertex({ -1.0f, 0.5f, 0.25f });
    g.addEdge(0, 1);
    g.addEdge(1, 2);
    return g;
}

void expectColor(const std::vector<float>& colors, std::size_t slot, glm::vec3 expected)
{
    EXPECT_FLOAT_EQ(colors[slot * 3],     expected.r) << "slot " << slot;
    EXPECT_FLOAT_EQ(colors[slot * 3 + 1], expected.g) << "slot " << slot;
    EXPECT_FLOAT_EQ(colors[slot * 3 + 2], expected.b) << "slot " << slot;
}

} // namespace

TEST(GeometryProjector, BuffersSizedExactlyToGraph)
{
    const Palette palette;
    const GeometryProjector projector{ palette };
    Graph g = chain3();
    GeometryBuffers out;

    projector.project(g, out);

    EXPECT_EQ(out.points.count(), 3u);
    EXPECT_EQ(out.points.positions.size(), 9u);
    EXPECT_EQ(out.points.colors.size(),    9u);
    EXPECT_EQ(out.lines.count(), 4u);
    EXPECT_EQ(out.lines.positions.size(), 12u);

    // Segment 0 runs from vertex 0 to vertex 1
    EXPECT_FLOAT_EQ(out.lines.positions[3], 1.0f);
    EXPECT_FLOAT_EQ(out.lines.positions[4], 2.0f);
    EXPECT_FLOAT_EQ(out.lines.positions[5], 3.0f);
}

TEST(GeometryProjector, VertexColourFollowsIntensity)
{
    const Palette palette;
    const GeometryProjector projector{ palette };
    Graph g = chain3();
    g.vertex(1).glowIntensity = 1.0f;
    g.vertex(2).glowIntensity = 0.5f;
    GeometryBuffers out;

    projector.project(g, out);

    expectColor(out.points.colors, 0, palette.matte);
    expectColor(out.points.colors, 1, palette.glow);
    expectColor(out.points.colors, 2, glm::mix(palette.matte, palette.glow, 0.5f));
}

TEST(GeometryProjector, EdgeEndpointTakesBrighterOfVertexAndEdge)
{
    const Palette palette;
    const GeometryProjector projector{ palette };
    Graph g = chain3();
    g.vertex(1).glowIntensity  = 0.6f;
    g.edges()[0].glowIntensity = 0.2f;   // edge 0-1
    GeometryBuffers out;

    projector.project(g, out);

    // Edge 0-1: vertex 0 is dark, so its end shows the edge's own pulse.
    expectColor(out.lines.colors, 0, projector.colorFor(0.2f));
    expectColor(out.lines.colors, 1, projector.colorFor(0.6f));

    // Edge 1-2 is not glowing, but vertex 1 bleeds onto it.
    expectColor(out.lines.colors, 2, projector.colorFor(0.6f));
    expectColor(out.lines.colors, 3, palette.matte);
}

TEST(GeometryProjector, ProjectionIsIdempotent)
{
    const GeometryProjector projector{ Palette{} };
    MersenneRandom rng{ 11 };
    Graph g = Graph::nearestNeighbour(GraphParams{}, rng);
    g.vertex(4).glowIntensity  = 0.3f;
    g.edges()[2].glowIntensity = 0.8f;

    GeometryBuffers a, b;
    projector.project(g, a);
    projector.project(g, b);
    EXPECT_EQ(a, b);

    const GeometryBuffers snapshot = a;
    projector.project(g, a);
    ASSERT_EQ(snapshot.points.positions.size(), a.points.positions.size());
    EXPECT_EQ(std::memcmp(snapshot.points.positions.data(), a.points.positions.data(),
                          a.points.positions.size() * sizeof(float)), 0);
    EXPECT_EQ(std::memcmp(snapshot.lines.colors.data(), a.lines.colors.data(),
                          a.lines.colors.size() * sizeof(float)), 0);
}

TEST(GeometryProjector, ReprojectionReusesStorage)
{
    const GeometryProjector projector{ Palette{} };
    Graph g = squareGraph();
    GeometryBuffers out;

    projector.project(g, out);
    const float* points = out.points.positions.data();
    const float* lines  = out.lines.colors.data();

    g.vertex(0).position.x   = 9.0f;
    g.vertex(0).glowIntensity = 1.0f;
    projector.project(g, out);

    EXPECT_EQ(out.points.positions.data(), points);
    EXPECT_EQ(out.lines.colors.data(),     lines);
    EXPECT_FLOAT_EQ(out.points.positions[0], 9.0f);
}

TEST(GeometryProjector, ColourClampsOutOfRangeIntensity)
{
    const Palette palette;
    const GeometryProjector projector{ palette };

    EXPECT_EQ(projector.colorFor(-1.0f), palette.matte);
    EXPECT_EQ(projector.colorFor( 2.0f), palette.glow);
}

TEST(Palette, HexConversion)
{
    const glm::vec3 c = colorFromHex(0xffd700);
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_FLOAT_EQ(c.g, 215.0f / 255.0f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
}
