#include "graph.hpp"
#include "io.hpp"
#include "coloring.hpp"
#include "generate.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def = "") {
    for (int i = 1; i + 1 < argc; i++) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static void usage() {
    std::cerr <<
        "Usage:\n"
        "  heurcolor --mode dsatur     --graph <file> [--format dimacs|edges] [--one_based 0|1] [--max_sec <sec>]\n"
        "  heurcolor --mode incomplete --graph <file> [--format dimacs|edges] [--one_based 0|1] [--max_sec <sec>]\n"
        "      [--trials <t>] [--iters <i>] [--seed <s>]\n"
        "  heurcolor --mode batch --dir <dir> --algo dsatur|incomplete [--threads <t>] [--max_sec <sec>]\n"
        "      [--trials <t>] [--iters <i>] [--seed <s>]\n"
        "\n"
        "  heurcolor --mode gen --type complete  --n <n> --out <file>\n"
        "  heurcolor --mode gen --type cycle     --n <n> --out <file>\n"
        "  heurcolor --mode gen --type star      --leaves <l> --out <file>\n"
        "  heurcolor --mode gen --type grid      --rows <r> --cols <c> --out <file>\n"
        "  heurcolor --mode gen --type random    --n <n> --p <p> --seed <s> --out <file>\n"
        "  heurcolor --mode gen --type bipartite --left <L> --right <R> --p <p> --seed <s> --out <file>\n"
        "\n"
        "  common: [--print 0|1] [--log trace|debug|info|warn|error]\n";
}

static SearchOptions read_options(int argc, char** argv) {
    SearchOptions opt;
    opt.max_seconds = std::stod(get_arg(argc, argv, "--max_sec", "600"));
    opt.trials = std::stoi(get_arg(argc, argv, "--trials", "10"));
    opt.local_search_iterations = std::stoi(get_arg(argc, argv, "--iters", "50"));
    opt.seed = (uint64_t)std::stoull(get_arg(argc, argv, "--seed", "1"));
    return opt;
}

static int run(int argc, char** argv) {
    std::string mode = get_arg(argc, argv, "--mode", "");
    if (mode.empty()) { usage(); return 1; }

    spdlog::set_level(spdlog::level::from_str(get_arg(argc, argv, "--log", "warn")));
    bool print_coloring = (get_arg(argc, argv, "--print", "0") != "0");

    if (mode == "gen") {
        std::string type = get_arg(argc, argv, "--type", "");
        std::string out = get_arg(argc, argv, "--out", "");
        if (type.empty() || out.empty()) { usage(); return 1; }

        Graph gg;
        if (type == "complete") {
            int n = std::stoi(get_arg(argc, argv, "--n", "0"));
            gg = make_complete(n);
        } else if (type == "cycle") {
            int n = std::stoi(get_arg(argc, argv, "--n", "0"));
            gg = make_cycle(n);
        } else if (type == "star") {
            int l = std::stoi(get_arg(argc, argv, "--leaves", "0"));
            gg = make_star(l);
        } else if (type == "grid") {
            int r = std::stoi(get_arg(argc, argv, "--rows", "0"));
            int c = std::stoi(get_arg(argc, argv, "--cols", "0"));
            gg = make_grid(r, c);
        } else if (type == "random") {
            int n = std::stoi(get_arg(argc, argv, "--n", "0"));
            double p = std::stod(get_arg(argc, argv, "--p", "0.0"));
            uint64_t seed = (uint64_t)std::stoull(get_arg(argc, argv, "--seed", "1"));
            gg = make_random_gnp(n, p, seed);
        } else if (type == "bipartite") {
            int L = std::stoi(get_arg(argc, argv, "--left", "0"));
            int R = std::stoi(get_arg(argc, argv, "--right", "0"));
            double p = std::stod(get_arg(argc, argv, "--p", "0.0"));
            uint64_t seed = (uint64_t)std::stoull(get_arg(argc, argv, "--seed", "1"));
            gg = make_bipartite_random(L, R, p, seed);
        } else {
            std::cerr << "Unknown --type: " << type << "\n";
            return 1;
        }

        write_graph_dimacs(out, gg);
        std::cout << "Wrote " << out << " n=" << gg.n << " m=" << gg.m() << "\n";
        return 0;
    }

    SearchOptions opt = read_options(argc, argv);

    if (mode == "batch") {
        std::string dir = get_arg(argc, argv, "--dir", "");
        std::string algo_name = get_arg(argc, argv, "--algo", "incomplete");
        int threads = std::stoi(get_arg(argc, argv, "--threads", "8"));
        if (dir.empty()) { usage(); return 1; }

        Algorithm algo;
        if (algo_name == "dsatur") algo = Algorithm::Dsatur;
        else if (algo_name == "incomplete") algo = Algorithm::Incomplete;
        else { std::cerr << "Unknown --algo: " << algo_name << "\n"; return 1; }

        std::vector<NamedGraph> instances;
        for (auto& entry : list_instances(dir))
            instances.push_back(NamedGraph{entry.first, read_graph_dimacs(entry.second)});
        std::stable_sort(instances.begin(), instances.end(),
                         [](const NamedGraph& a, const NamedGraph& b) { return a.graph.n < b.graph.n; });

        spdlog::info("loaded {} instances from {}", instances.size(), dir);
        auto results = solve_batch(instances, algo, opt, threads);
        for (auto& r : results) write_summary(std::cout, r.name, r.summary, print_coloring);

        BatchStats st = summarize(results);
        std::cout << "total=" << st.total << " solved=" << st.solved
                  << " mean_time=" << st.mean_seconds << "s\n";
        return 0;
    }

    std::string graph_path = get_arg(argc, argv, "--graph", "");
    std::string format = get_arg(argc, argv, "--format", "dimacs");
    bool one_based = (get_arg(argc, argv, "--one_based", "0") != "0");
    if (graph_path.empty()) { usage(); return 1; }

    Graph g;
    if (format == "dimacs") g = read_graph_dimacs(graph_path);
    else if (format == "edges") g = read_graph_edge_list(graph_path, one_based);
    else { std::cerr << "Unknown --format: " << format << "\n"; return 1; }

    SolutionSummary s;
    if (mode == "dsatur") {
        s = solve_dsatur(g, opt.max_seconds);
    } else if (mode == "incomplete") {
        s = solve_incomplete(g, opt);
    } else {
        usage();
        return 1;
    }

    write_summary(std::cout, graph_path, s, print_coloring);
    if (!s.coloring.empty()) std::cout << "verify=" << (verify_coloring(g, s.coloring, s.num_colors) ? "OK" : "FAIL") << "\n";
    return 0;
}

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
