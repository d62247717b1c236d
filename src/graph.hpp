#pragma once
#include <algorithm>
#include <stdexcept>
#include <vector>

struct Graph {
    int n = 0;
    std::vector<std::vector<int>> adj;

    Graph() = default;
    explicit Graph(int n_) : n(n_), adj(n_) {
        if (n_ < 0) throw std::invalid_argument("negative vertex count");
    }

    void add_edge(int u, int v) {
        if (u < 0 || v < 0 || u >= n || v >= n) throw std::out_of_range("bad vertex");
        if (u == v) return;
        adj[u].push_back(v);
        adj[v].push_back(u);
    }

    // Sorts neighbor lists and drops parallel edges.
    void normalize() {
        for (auto& lst : adj) {
            std::sort(lst.begin(), lst.end());
            lst.erase(std::unique(lst.begin(), lst.end()), lst.end());
        }
    }

    int degree(int u) const { return (int)adj[u].size(); }

    int m() const {
        long long sum = 0;
        for (auto& lst : adj) sum += (long long)lst.size();
        return (int)(sum / 2);
    }

    double edge_density() const {
        if (n < 2) return 0.0;
        double max_edges = (double)n * (double)(n - 1) / 2.0;
        return (double)m() / max_edges;
    }
};
