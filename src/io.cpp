#include "io.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

Graph read_graph_edge_list(const std::string& path, bool one_based) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open file: " + path);

    int n = 0, m = 0;
    in >> n >> m;
    if (!in) throw std::runtime_error("Bad header (n m) in file: " + path);

    Graph g(n);
    for (int i = 0; i < m; i++) {
        int u, v;
        in >> u >> v;
        if (!in) throw std::runtime_error("Bad edge line in file: " + path);
        if (one_based) { u--; v--; }
        g.add_edge(u, v);
    }
    g.normalize();
    return g;
}

void write_graph_edge_list(const std::string& path, const Graph& g, bool one_based) {
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot write file: " + path);

    out << g.n << " " << g.m() << "\n";
    for (int u = 0; u < g.n; u++) {
        for (int v : g.adj[u]) {
            if (u < v) {
                int a = one_based ? (u + 1) : u;
                int b = one_based ? (v + 1) : v;
                out << a << " " << b << "\n";
            }
        }
    }
}

Graph read_graph_dimacs(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open file: " + path);

    Graph g;
    bool have_header = false;
    std::string line;
    int lineno = 0;

    while (std::getline(in, line)) {
        lineno++;
        if (line.empty() || line[0] == 'c') continue;

        std::istringstream ss(line);
        std::string tag;
        ss >> tag;
        if (tag == "p") {
            std::string format;
            int n = 0, m = 0;
            ss >> format >> n >> m;
            if (!ss || n < 0) throw std::runtime_error("Bad problem line " + std::to_string(lineno) + " in file: " + path);
            g = Graph(n);
            have_header = true;
        } else if (tag == "e") {
            if (!have_header) throw std::runtime_error("Edge before problem line in file: " + path);
            int u = 0, v = 0;
            ss >> u >> v;
            if (!ss) throw std::runtime_error("Bad edge line " + std::to_string(lineno) + " in file: " + path);
            g.add_edge(u - 1, v - 1);
        }
    }

    if (!have_header) throw std::runtime_error("Missing problem line in file: " + path);
    g.normalize();
    return g;
}

void write_graph_dimacs(const std::string& path, const Graph& g) {
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot write file: " + path);

    out << "p edge " << g.n << " " << g.m() << "\n";
    for (int u = 0; u < g.n; u++)
        for (int v : g.adj[u])
            if (u < v) out << "e " << (u + 1) << " " << (v + 1) << "\n";
}

std::vector<std::pair<std::string, std::string>> list_instances(const std::string& dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) throw std::runtime_error("Instance directory not found: " + dir);

    std::vector<std::pair<std::string, std::string>> out;
    for (auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".col") continue;
        out.emplace_back(entry.path().stem().string(), entry.path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

void write_summary(std::ostream& os, const std::string& name, const SolutionSummary& s, bool print_coloring) {
    std::ios::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();

    os << "graph=" << name
       << " status=" << status_name(s.status)
       << " nodes=" << s.num_nodes
       << " edges=" << s.num_edges
       << " density=" << std::fixed << std::setprecision(3) << s.edge_density;
    if (!s.coloring.empty()) os << " colors=" << s.num_colors;
    os << " time=" << std::setprecision(4) << s.seconds << "s\n";

    os.flags(flags);
    os.precision(precision);

    if (print_coloring) {
        for (size_t u = 0; u < s.coloring.size(); u++)
            os << (u + 1) << " " << s.coloring[u] << "\n";
    }
}
