#include "test_common.hpp"

#include <stdexcept>
#include <string>

static std::vector<NamedGraph> sample_instances() {
    std::vector<NamedGraph> out;
    out.push_back(NamedGraph{"square", make_cycle(4)});
    out.push_back(NamedGraph{"k5", make_complete(5)});
    out.push_back(NamedGraph{"star", make_star(5)});
    out.push_back(NamedGraph{"empty", Graph()});
    out.push_back(NamedGraph{"grid", make_grid(5, 5)});
    out.push_back(NamedGraph{"random", make_random_gnp(90, 0.2, 4)});
    return out;
}

TEST_CASE("batch solving keeps input order and solves every instance") {
    auto instances = sample_instances();
    SearchOptions opt;

    for (Algorithm algo : {Algorithm::Dsatur, Algorithm::Incomplete}) {
        auto results = solve_batch(instances, algo, opt, 3);
        REQUIRE_EQ(results.size(), instances.size());
        for (size_t i = 0; i < results.size(); i++) {
            CHECK_EQ(results[i].name, instances[i].name);
            CHECK(results[i].summary.solved);
            check_valid_dense(instances[i].graph, results[i].summary.coloring,
                              results[i].summary.num_colors);
        }
        CHECK_EQ(results[0].summary.num_colors, 2);
        CHECK_EQ(results[1].summary.num_colors, 5);
        CHECK_EQ(results[2].summary.num_colors, 2);
        CHECK_EQ(results[3].summary.num_colors, 0);

        BatchStats st = summarize(results);
        CHECK_EQ(st.total, 6);
        CHECK_EQ(st.solved, 6);
        CHECK(st.mean_seconds >= 0.0);
    }
}

TEST_CASE("batch matches sequential solving for the same seeds") {
    auto instances = sample_instances();
    SearchOptions opt;
    opt.seed = 17;

    auto results = solve_batch(instances, Algorithm::Incomplete, opt, 4);
    for (size_t i = 0; i < instances.size(); i++) {
        SearchOptions local = opt;
        local.seed = opt.seed + i;
        auto s = solve_incomplete(instances[i].graph, local);
        CHECK_EQ(results[i].summary.coloring, s.coloring);
    }
}

TEST_CASE("batch edge cases") {
    SearchOptions opt;
    CHECK(solve_batch({}, Algorithm::Dsatur, opt, 2).empty());
    CHECK_EQ(summarize({}).total, 0);
    CHECK_EQ(summarize({}).mean_seconds, 0.0);
    CHECK_THROWS_AS(solve_batch(sample_instances(), Algorithm::Dsatur, opt, 0), std::invalid_argument);
}

TEST_CASE("timed out instances count as unsolved") {
    std::vector<NamedGraph> instances;
    instances.push_back(NamedGraph{"big", make_random_gnp(1200, 0.5, 2)});
    instances.push_back(NamedGraph{"tiny", make_cycle(3)});
    SearchOptions opt;
    opt.max_seconds = 1e-6;

    auto results = solve_batch(instances, Algorithm::Incomplete, opt, 2);
    CHECK_FALSE(results[0].summary.solved);
    BatchStats st = summarize(results);
    CHECK_EQ(st.total, 2);
    CHECK(st.solved <= 1);
}
