#include "coloring.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <queue>
#include <stdexcept>
#include <vector>

// Vertices not yet placed in an independent set. Removal swaps with the last
// element so membership and removal stay O(1).
struct AvailableSet {
    std::vector<int> items;
    std::vector<int> pos;

    explicit AvailableSet(int n) : items(n), pos(n) {
        for (int i = 0; i < n; i++) { items[i] = i; pos[i] = i; }
    }

    bool empty() const { return items.empty(); }
    bool contains(int u) const { return pos[u] != -1; }

    void remove(int u) {
        int p = pos[u];
        int last = items.back();
        items[p] = last;
        pos[last] = p;
        items.pop_back();
        pos[u] = -1;
    }
};

int sample_vertex(const std::vector<int>& available,
                  const std::vector<double>& weights,
                  std::mt19937_64& rng) {
    if (available.empty()) throw std::invalid_argument("cannot sample from an empty set");

    double total = 0.0;
    for (int u : available) total += weights.at(u);

    if (total <= 0.0) {
        std::uniform_int_distribution<size_t> pick(0, available.size() - 1);
        return available[pick(rng)];
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    double r = dist(rng);
    double acc = 0.0;
    for (int u : available) {
        if (weights[u] <= 0.0) continue;
        acc += weights[u];
        if (r < acc) return u;
    }
    // Rounding can leave r just above the accumulated sum.
    for (size_t i = available.size(); i-- > 0;)
        if (weights[available[i]] > 0.0) return available[i];
    return available.back();
}

static bool touches_set(const Graph& g, int u, const std::vector<char>& in_set) {
    for (int v : g.adj[u])
        if (in_set[v]) return true;
    return false;
}

// BFS over the seed's component. Every visited vertex that is still
// available and has no neighbor in the set joins it; traversal continues
// through rejected and already colored vertices so the set ends up maximal
// within the component.
static std::vector<int> grow_independent_set(const Graph& g, int seed,
                                             AvailableSet& avail,
                                             std::vector<char>& in_set,
                                             std::vector<int>& visited, int mark) {
    std::vector<int> members;
    std::queue<int> frontier;

    members.push_back(seed);
    in_set[seed] = 1;
    avail.remove(seed);
    visited[seed] = mark;
    frontier.push(seed);

    while (!frontier.empty()) {
        int u = frontier.front();
        frontier.pop();
        for (int v : g.adj[u]) {
            if (visited[v] == mark) continue;
            visited[v] = mark;
            frontier.push(v);
            if (!avail.contains(v) || touches_set(g, v, in_set)) continue;
            members.push_back(v);
            in_set[v] = 1;
            avail.remove(v);
        }
    }

    for (int u : members) in_set[u] = 0;
    return members;
}

Construction construct_once(const Graph& g, const std::vector<double>& weights,
                            std::mt19937_64& rng) {
    if ((int)weights.size() != g.n) throw std::invalid_argument("weights size does not match graph");
    for (double w : weights)
        if (!(w >= 0.0) || !std::isfinite(w)) throw std::invalid_argument("vertex weights must be finite and non-negative");

    Construction res;
    res.color.assign(g.n, -1);

    AvailableSet avail(g.n);
    std::vector<char> in_set(g.n, 0);
    std::vector<int> visited(g.n, -1);
    std::vector<int> stamp;
    int sets = 0;

    while (!avail.empty()) {
        int seed = sample_vertex(avail.items, weights, rng);
        auto members = grow_independent_set(g, seed, avail, in_set, visited, sets);
        sets++;

        for (int u : members) {
            // stamp[c] == u + 1 marks color c as taken around u
            stamp.resize((size_t)res.num_colors + 1, 0);
            for (int v : g.adj[u]) {
                int c = res.color[v];
                if (c >= 0) stamp[c] = u + 1;
            }
            int c = 0;
            while (c < res.num_colors && stamp[c] == u + 1) c++;
            if (c == res.num_colors) res.num_colors++;
            res.color[u] = c;
        }
    }

    spdlog::trace("construct_once: {} independent sets, {} colors", sets, res.num_colors);
    return res;
}
