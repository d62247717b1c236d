#include "coloring.hpp"
#include "timer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

void perturb(std::vector<int>& color, double fraction, std::mt19937_64& rng) {
    int top = max_color(color);
    if (top < 0) return;

    std::vector<int> nodes(color.size());
    std::iota(nodes.begin(), nodes.end(), 0);
    std::shuffle(nodes.begin(), nodes.end(), rng);

    size_t count = (size_t)((double)nodes.size() * fraction);
    std::uniform_int_distribution<int> pick(0, top);
    for (size_t i = 0; i < count && i < nodes.size(); i++)
        color[nodes[i]] = pick(rng);
}

// Moves every vertex to the first color below limit that none of its
// neighbors uses; vertices without such a color keep theirs.
static void sweep(const Graph& g, std::vector<int>& work, const std::vector<int>& order,
                  int limit, std::vector<int>& stamp) {
    if (limit <= 0) return;
    if ((int)stamp.size() < limit) stamp.resize(limit, -1);

    for (int u : order) {
        for (int v : g.adj[u]) {
            int c = work[v];
            if (c >= 0 && c < limit) stamp[c] = u;
        }
        for (int c = 0; c < limit; c++) {
            if (stamp[c] != u) { work[u] = c; break; }
        }
    }
}

RefineOutcome refine(const Graph& g, const std::vector<int>& color,
                     const SearchOptions& opt, std::mt19937_64& rng, const Timer& t) {
    if ((int)color.size() != g.n) throw std::invalid_argument("coloring size does not match graph");
    if (!is_proper_coloring(g, color)) throw std::invalid_argument("refine needs a proper coloring");
    if (opt.local_search_iterations < 0) throw std::invalid_argument("negative iteration count");
    if (opt.perturbation_fraction < 0.0 || opt.perturbation_fraction > 1.0)
        throw std::invalid_argument("perturbation fraction must be in [0,1]");

    RefineOutcome res;
    res.color = color;
    res.num_colors = compact_colors(res.color);
    if (g.n == 0) return res;

    std::vector<int> work = res.color;
    std::vector<int> snapshot;
    std::vector<int> order(g.n);
    std::iota(order.begin(), order.end(), 0);
    std::vector<int> stamp(res.num_colors, -1);

    for (int round = 0; round < opt.local_search_iterations; round++) {
        if (t.expired(opt.max_seconds)) {
            res.timed_out = true;
            break;
        }
        res.rounds++;

        std::shuffle(order.begin(), order.end(), rng);
        snapshot = work;
        std::fill(stamp.begin(), stamp.end(), -1);
        sweep(g, work, order, res.num_colors - 1, stamp);

        int k = count_colors(work);
        if (k < res.num_colors && is_proper_coloring(g, work)) {
            res.color = work;
            res.num_colors = compact_colors(res.color);
            work = res.color;
            res.improvements++;
            spdlog::trace("refine: round {} down to {} colors", round, res.num_colors);
            continue;
        }

        work.swap(snapshot);
        perturb(work, opt.perturbation_fraction, rng);
        res.perturbations++;
    }

    spdlog::debug("refine: {} rounds, {} improvements, {} perturbations, {} colors",
                  res.rounds, res.improvements, res.perturbations, res.num_colors);
    return res;
}
