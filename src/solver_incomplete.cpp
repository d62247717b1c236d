#include "coloring.hpp"
#include "timer.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <vector>

std::vector<double> uniform_weights(int n) {
    if (n <= 0) return {};
    return std::vector<double>(n, 1.0 / n);
}

void reweight(std::vector<double>& weights, const std::vector<int>& vertices, double increment) {
    for (int u : vertices) weights.at(u) += increment;

    double total = 0.0;
    for (double w : weights) total += w;
    if (total <= 0.0) return;
    for (double& w : weights) w /= total;
}

void check_options(const SearchOptions& opt) {
    if (opt.trials < 1) throw std::invalid_argument("at least one trial is required");
    if (opt.local_search_iterations < 0) throw std::invalid_argument("negative iteration count");
    if (opt.conflict_increment < 0.0) throw std::invalid_argument("negative conflict increment");
    if (opt.perturbation_fraction < 0.0 || opt.perturbation_fraction > 1.0)
        throw std::invalid_argument("perturbation fraction must be in [0,1]");
}

SearchOutcome search(const Graph& g, const SearchOptions& opt,
                     std::mt19937_64& rng, const Timer& t) {
    check_options(opt);

    SearchOutcome res;
    if (g.n == 0) return res;

    std::vector<double> weights = uniform_weights(g.n);

    for (int trial = 0; trial < opt.trials; trial++) {
        if (t.expired(opt.max_seconds)) {
            res.timed_out = true;
            break;
        }

        Construction c = construct_once(g, weights, rng);
        res.trials++;
        if (res.color.empty() || c.num_colors < res.num_colors) {
            res.num_colors = c.num_colors;
            res.color = c.color;
        }

        // Constructions are proper, so this set is normally empty.
        Conflicts conf = find_conflicts(g, c.color);
        reweight(weights, conf.vertices, opt.conflict_increment);

        spdlog::debug("search: trial {} used {} colors (best {}), {} conflicting vertices",
                      trial, c.num_colors, res.num_colors, conf.vertices.size());
    }
    return res;
}

SolutionSummary solve_incomplete(const Graph& g, const SearchOptions& opt) {
    check_options(opt);
    Timer t;
    SolutionSummary s;
    s.num_nodes = g.n;
    s.num_edges = g.m();
    s.edge_density = g.edge_density();

    if (g.n == 0) {
        s.status = SolveStatus::Colored;
        s.solved = true;
        s.seconds = t.seconds();
        return s;
    }

    std::mt19937_64 rng(opt.seed);
    SearchOutcome found = search(g, opt, rng, t);

    bool timed_out = found.timed_out || found.color.empty();
    s.coloring = std::move(found.color);
    s.num_colors = found.num_colors;
    if (!timed_out) {
        RefineOutcome refined = refine(g, s.coloring, opt, rng, t);
        timed_out = refined.timed_out;
        s.coloring = std::move(refined.color);
        s.num_colors = refined.num_colors;
    }

    s.seconds = t.seconds();
    if (timed_out) {
        // The best proper coloring found so far is still reported.
        spdlog::warn("incomplete: budget of {}s exhausted after {} trials (best so far {} colors)",
                     opt.max_seconds, found.trials, s.num_colors);
        s.status = SolveStatus::TimedOut;
        s.solved = false;
        return s;
    }

    s.status = SolveStatus::Colored;
    s.solved = true;
    return s;
}
