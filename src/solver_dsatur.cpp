#include "coloring.hpp"
#include "timer.hpp"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

// Saturation is kept incrementally: seen[u] marks the colors already present
// around u, sat[u] counts them.
struct SaturationState {
    std::vector<std::vector<char>> seen;
    std::vector<int> sat;

    explicit SaturationState(int n) : seen(n), sat(n, 0) {}

    void notify(int u, int c) {
        auto& s = seen[u];
        if ((int)s.size() <= c) s.resize((size_t)c + 1, 0);
        if (!s[c]) { s[c] = 1; sat[u]++; }
    }
};

// Highest saturation, then highest degree, then lowest index.
static int choose_vertex_dsatur(const Graph& g,
                                const std::vector<int>& color,
                                const SaturationState& st) {
    int best = -1, best_sat = -1, best_deg = -1;

    for (int u = 0; u < g.n; u++) {
        if (color[u] != -1) continue;

        int sat = st.sat[u];
        int deg = g.degree(u);
        if (sat > best_sat || (sat == best_sat && deg > best_deg)) {
            best = u; best_sat = sat; best_deg = deg;
        }
    }
    return best;
}

static int smallest_free_color(const SaturationState& st, int u, int num_colors) {
    const auto& s = st.seen[u];
    for (int c = 0; c < num_colors; c++) {
        if (c >= (int)s.size() || !s[c]) return c;
    }
    return num_colors;
}

static void assign(const Graph& g, std::vector<int>& color, SaturationState& st, int u, int c) {
    color[u] = c;
    for (int v : g.adj[u])
        if (color[v] == -1) st.notify(v, c);
}

ColoringResult color_dsatur(const Graph& g, double max_seconds) {
    ColoringResult res;
    Timer t;

    if (g.n == 0) {
        res.success = true;
        return res;
    }

    res.color.assign(g.n, -1);
    SaturationState st(g.n);

    assign(g, res.color, st, 0, 0);
    res.num_colors = 1;
    res.steps = 1;

    for (int step = 1; step < g.n; step++) {
        if (t.expired(max_seconds)) {
            spdlog::warn("dsatur: budget of {}s exhausted after {} of {} vertices",
                         max_seconds, step, g.n);
            res.success = false;
            res.color.clear();
            res.num_colors = 0;
            res.seconds = t.seconds();
            return res;
        }

        int u = choose_vertex_dsatur(g, res.color, st);
        if (u == -1) break;

        int c = smallest_free_color(st, u, res.num_colors);
        if (c == res.num_colors) res.num_colors++;
        assign(g, res.color, st, u, c);
        res.steps++;
    }

    res.success = true;
    res.seconds = t.seconds();
    spdlog::debug("dsatur: n={} m={} colors={} in {:.4f}s", g.n, g.m(), res.num_colors, res.seconds);
    return res;
}

SolutionSummary solve_dsatur(const Graph& g, double max_seconds) {
    SolutionSummary s;
    s.num_nodes = g.n;
    s.num_edges = g.m();
    s.edge_density = g.edge_density();

    ColoringResult res = color_dsatur(g, max_seconds);
    s.seconds = res.seconds;
    if (!res.success) {
        s.status = SolveStatus::TimedOut;
        s.solved = false;
        return s;
    }

    s.status = SolveStatus::Colored;
    s.solved = true;
    s.coloring = std::move(res.color);
    s.num_colors = res.num_colors;
    return s;
}
