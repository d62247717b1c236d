#include "test_common.hpp"

#include <stdexcept>
#include <string>

TEST_CASE("empty graph is trivially colored") {
    Graph g;
    SearchOptions opt;

    for (auto s : {solve_dsatur(g), solve_incomplete(g, opt)}) {
        CHECK(s.solved);
        CHECK_EQ(s.status, SolveStatus::Colored);
        CHECK(s.coloring.empty());
        CHECK_EQ(s.num_colors, 0);
        CHECK_EQ(s.num_nodes, 0);
        CHECK_EQ(s.num_edges, 0);
        CHECK_EQ(s.edge_density, 0.0);
    }
}

TEST_CASE("summaries describe the instance") {
    Graph g = make_cycle(6);
    SearchOptions opt;

    for (auto s : {solve_dsatur(g), solve_incomplete(g, opt)}) {
        REQUIRE(s.solved);
        CHECK_EQ(s.status, SolveStatus::Colored);
        CHECK_EQ(s.num_nodes, 6);
        CHECK_EQ(s.num_edges, 6);
        CHECK_EQ(s.edge_density, doctest::Approx(6.0 / 15.0));
        CHECK_EQ(s.num_colors, 2);
        check_valid_dense(g, s.coloring, s.num_colors);
        CHECK(s.seconds >= 0.0);
    }
}

TEST_CASE("incomplete solver scenarios") {
    SearchOptions opt;

    SUBCASE("star") {
        Graph g = make_star(5);
        auto s = solve_incomplete(g, opt);
        CHECK_EQ(s.num_colors, 2);
        check_valid_dense(g, s.coloring, 2);
    }

    SUBCASE("edgeless") {
        Graph g(9);
        auto s = solve_incomplete(g, opt);
        CHECK_EQ(s.num_colors, 1);
    }

    SUBCASE("complete") {
        Graph g = make_complete(5);
        auto s = solve_incomplete(g, opt);
        CHECK_EQ(s.num_colors, 5);
        check_valid_dense(g, s.coloring, 5);
    }

    SUBCASE("random graphs") {
        for (uint64_t seed = 1; seed <= 4; seed++) {
            Graph g = make_random_gnp(100, 0.1, seed);
            opt.seed = seed;
            auto s = solve_incomplete(g, opt);
            REQUIRE(s.solved);
            check_valid_dense(g, s.coloring, s.num_colors);
        }
    }
}

TEST_CASE("incomplete solver is reproducible for a fixed seed") {
    Graph g = make_random_gnp(80, 0.2, 3);
    SearchOptions opt;
    opt.seed = 99;
    auto a = solve_incomplete(g, opt);
    auto b = solve_incomplete(g, opt);
    CHECK_EQ(a.coloring, b.coloring);
    CHECK_EQ(a.num_colors, b.num_colors);
}

TEST_CASE("trial search keeps the best construction") {
    Graph g = make_random_gnp(60, 0.3, 8);
    SearchOptions opt;
    opt.trials = 6;
    std::mt19937_64 rng(5);
    Timer t;

    auto found = search(g, opt, rng, t);
    CHECK_EQ(found.trials, 6);
    CHECK_FALSE(found.timed_out);
    check_valid_dense(g, found.color, found.num_colors);

    opt.trials = 0;
    CHECK_THROWS_AS(search(g, opt, rng, t), std::invalid_argument);
}

TEST_CASE("near-zero budget reports a timeout promptly") {
    Graph g = make_random_gnp(1500, 0.5, 21);
    SearchOptions opt;
    opt.max_seconds = 1e-6;

    SUBCASE("incomplete") {
        Timer t;
        auto s = solve_incomplete(g, opt);
        CHECK_FALSE(s.solved);
        CHECK_EQ(s.status, SolveStatus::TimedOut);
        if (!s.coloring.empty()) CHECK(verify_coloring(g, s.coloring, s.num_colors));
        else CHECK_EQ(s.num_colors, 0);
        CHECK_EQ(s.num_nodes, 1500);
        CHECK(t.seconds() < 2.0);
    }

    SUBCASE("dsatur") {
        Timer t;
        auto s = solve_dsatur(g, opt.max_seconds);
        CHECK_FALSE(s.solved);
        CHECK_EQ(s.status, SolveStatus::TimedOut);
        CHECK(s.coloring.empty());
        CHECK(t.seconds() < 2.0);
    }
}

TEST_CASE("timeout during local search keeps the best coloring") {
    Graph g = make_random_gnp(600, 0.3, 3);
    SearchOptions opt;
    opt.trials = 1;
    opt.local_search_iterations = 100000000;
    opt.max_seconds = 0.3;

    Timer t;
    auto s = solve_incomplete(g, opt);
    CHECK_FALSE(s.solved);
    CHECK_EQ(s.status, SolveStatus::TimedOut);
    REQUIRE_FALSE(s.coloring.empty());
    CHECK(s.num_colors > 0);
    check_valid_dense(g, s.coloring, s.num_colors);
    CHECK(t.seconds() < 5.0);
}

TEST_CASE("status names") {
    CHECK_EQ(std::string(status_name(SolveStatus::Colored)), "COLORED");
    CHECK_EQ(std::string(status_name(SolveStatus::TimedOut)), "TIMEOUT");
}
