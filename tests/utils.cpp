#include "test_common.hpp"

#include <stdexcept>

TEST_CASE("graph bookkeeping") {
    Graph g(4);
    g.add_edge(0, 1);
    g.add_edge(1, 0);
    g.add_edge(2, 2);
    g.normalize();

    CHECK_EQ(g.m(), 1);
    CHECK_EQ(g.degree(0), 1);
    CHECK_EQ(g.degree(2), 0);
    CHECK_EQ(g.edge_density(), doctest::Approx(1.0 / 6.0));
    CHECK_THROWS_AS(g.add_edge(0, 4), std::out_of_range);

    CHECK_EQ(Graph().edge_density(), 0.0);
    CHECK_EQ(Graph(1).edge_density(), 0.0);
    CHECK_EQ(make_complete(5).edge_density(), doctest::Approx(1.0));
}

TEST_CASE("color counting and density") {
    CHECK_EQ(count_colors({}), 0);
    CHECK_EQ(max_color({}), -1);
    CHECK(has_dense_colors({}));

    std::vector<int> gappy = {0, 3, 3, 7};
    CHECK_EQ(count_colors(gappy), 3);
    CHECK_FALSE(has_dense_colors(gappy));

    CHECK_EQ(compact_colors(gappy), 3);
    CHECK_EQ(gappy, (std::vector<int>{0, 1, 1, 2}));
    CHECK(has_dense_colors(gappy));
}

TEST_CASE("conflicts") {
    Graph g = square();
    std::vector<int> color = {0, 1, 0, 1};
    CHECK(is_proper_coloring(g, color));
    CHECK_EQ(find_conflicts(g, color).edges, 0);

    color[1] = 0;
    Conflicts c = find_conflicts(g, color);
    CHECK_EQ(c.edges, 2);
    CHECK_EQ(c.vertices, (std::vector<int>{0, 1, 2}));
    CHECK_FALSE(is_proper_coloring(g, color));
    CHECK_FALSE(verify_coloring(g, {0, 1, 0}, 2));

    CHECK_THROWS_AS(find_conflicts(g, {0, 1}), std::invalid_argument);
}
