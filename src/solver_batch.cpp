#include "coloring.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

template<typename T>
struct TSQueue {
    std::queue<T> q;
    std::mutex m;

    void push(T v) {
        std::lock_guard<std::mutex> lk(m);
        q.push(std::move(v));
    }

    bool pop(T& out) {
        std::lock_guard<std::mutex> lk(m);
        if (q.empty()) return false;
        out = std::move(q.front());
        q.pop();
        return true;
    }
};

static SolutionSummary solve_one(const Graph& g, Algorithm algo, const SearchOptions& opt) {
    if (algo == Algorithm::Dsatur) return solve_dsatur(g, opt.max_seconds);
    return solve_incomplete(g, opt);
}

std::vector<NamedSummary> solve_batch(const std::vector<NamedGraph>& instances,
                                      Algorithm algo, const SearchOptions& opt, int threads) {
    if (threads < 1) throw std::invalid_argument("at least one worker thread is required");
    check_options(opt);

    std::vector<NamedSummary> results(instances.size());

    TSQueue<size_t> work;
    for (size_t i = 0; i < instances.size(); i++) work.push(i);

    int workers = std::min<int>(threads, std::max<int>(1, (int)instances.size()));
    std::vector<std::thread> pool;
    pool.reserve(workers);

    // Each slot is written by exactly one worker; the graphs are only read.
    for (int i = 0; i < workers; i++) {
        pool.emplace_back([&]() {
            size_t idx;
            while (work.pop(idx)) {
                const NamedGraph& inst = instances[idx];
                SearchOptions local = opt;
                local.seed = opt.seed + idx;

                spdlog::info("solving {} (n={}, m={})", inst.name, inst.graph.n, inst.graph.m());
                results[idx].name = inst.name;
                results[idx].summary = solve_one(inst.graph, algo, local);
            }
        });
    }

    for (auto &th : pool) th.join();
    return results;
}

BatchStats summarize(const std::vector<NamedSummary>& results) {
    BatchStats st;
    st.total = (int)results.size();
    double sum = 0.0;
    for (auto& r : results) {
        if (r.summary.solved) st.solved++;
        sum += r.summary.seconds;
    }
    if (st.total > 0) st.mean_seconds = sum / st.total;
    return st;
}
