#include "coloring.hpp"

#include <algorithm>
#include <stdexcept>

bool verify_coloring(const Graph& g, const std::vector<int>& color, int k) {
    if ((int)color.size() != g.n) return false;
    for (int u = 0; u < g.n; u++) {
        if (color[u] < 0 || color[u] >= k) return false;
        for (int v : g.adj[u]) {
            if (u < v && color[u] == color[v]) return false;
        }
    }
    return true;
}

bool is_proper_coloring(const Graph& g, const std::vector<int>& color) {
    return verify_coloring(g, color, max_color(color) + 1);
}

int max_color(const std::vector<int>& color) {
    int best = -1;
    for (int c : color) best = std::max(best, c);
    return best;
}

int count_colors(const std::vector<int>& color) {
    std::vector<char> seen(color.size(), 0);
    int k = 0;
    for (int c : color) {
        if (c < 0) continue;
        if ((size_t)c >= seen.size()) seen.resize((size_t)c + 1, 0);
        if (!seen[c]) { seen[c] = 1; k++; }
    }
    return k;
}

bool has_dense_colors(const std::vector<int>& color) {
    for (int c : color) if (c < 0) return false;
    return count_colors(color) == max_color(color) + 1;
}

int compact_colors(std::vector<int>& color) {
    int top = max_color(color);
    std::vector<int> relabel(top + 1, -1);
    for (int c : color) if (c >= 0) relabel[c] = 0;

    int k = 0;
    for (int c = 0; c <= top; c++)
        if (relabel[c] == 0) relabel[c] = k++;

    for (int& c : color)
        if (c >= 0) c = relabel[c];
    return k;
}

Conflicts find_conflicts(const Graph& g, const std::vector<int>& color) {
    if ((int)color.size() != g.n) throw std::invalid_argument("coloring size does not match graph");
    Conflicts res;
    std::vector<char> touched(g.n, 0);
    for (int u = 0; u < g.n; u++) {
        if (color[u] < 0) continue;
        for (int v : g.adj[u]) {
            if (color[u] != color[v]) continue;
            touched[u] = 1;
            if (u < v) res.edges++;
        }
    }
    for (int u = 0; u < g.n; u++)
        if (touched[u]) res.vertices.push_back(u);
    return res;
}

const char* status_name(SolveStatus s) {
    switch (s) {
        case SolveStatus::Colored: return "COLORED";
        case SolveStatus::TimedOut: return "TIMEOUT";
    }
    return "UNKNOWN";
}
