#pragma once
#include "graph.hpp"
#include "timer.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

struct ColoringResult {
    bool success = false;
    std::vector<int> color;
    int num_colors = 0;
    long long steps = 0;
    double seconds = 0.0;
};

struct Conflicts {
    int edges = 0;
    std::vector<int> vertices;
};

bool verify_coloring(const Graph& g, const std::vector<int>& color, int k);
bool is_proper_coloring(const Graph& g, const std::vector<int>& color);
int count_colors(const std::vector<int>& color);
int max_color(const std::vector<int>& color);
bool has_dense_colors(const std::vector<int>& color);
int compact_colors(std::vector<int>& color);
Conflicts find_conflicts(const Graph& g, const std::vector<int>& color);

// DSATUR. max_seconds <= 0 disables the budget.
ColoringResult color_dsatur(const Graph& g, double max_seconds = 0.0);

// Probabilistic independent-set construction

struct Construction {
    std::vector<int> color;
    int num_colors = 0;
};

int sample_vertex(const std::vector<int>& available,
                  const std::vector<double>& weights,
                  std::mt19937_64& rng);

Construction construct_once(const Graph& g, const std::vector<double>& weights,
                            std::mt19937_64& rng);

// Adaptive trials and local search

struct SearchOptions {
    int trials = 10;
    double conflict_increment = 0.1;
    int local_search_iterations = 50;
    double perturbation_fraction = 0.2;
    double max_seconds = 600.0;
    uint64_t seed = 1;
};

// Throws std::invalid_argument on out-of-range parameters.
void check_options(const SearchOptions& opt);

std::vector<double> uniform_weights(int n);
void reweight(std::vector<double>& weights, const std::vector<int>& vertices, double increment);

struct SearchOutcome {
    std::vector<int> color;
    int num_colors = 0;
    int trials = 0;
    bool timed_out = false;
};

SearchOutcome search(const Graph& g, const SearchOptions& opt,
                     std::mt19937_64& rng, const Timer& t);

struct RefineOutcome {
    std::vector<int> color;
    int num_colors = 0;
    int rounds = 0;
    int improvements = 0;
    int perturbations = 0;
    bool timed_out = false;
};

void perturb(std::vector<int>& color, double fraction, std::mt19937_64& rng);

RefineOutcome refine(const Graph& g, const std::vector<int>& color,
                     const SearchOptions& opt, std::mt19937_64& rng, const Timer& t);

// Uniform result record for every engine

enum class SolveStatus { Colored, TimedOut };

const char* status_name(SolveStatus s);

struct SolutionSummary {
    SolveStatus status = SolveStatus::TimedOut;
    std::vector<int> coloring;
    int num_colors = 0;
    double seconds = 0.0;
    int num_nodes = 0;
    int num_edges = 0;
    double edge_density = 0.0;
    bool solved = false;
};

SolutionSummary solve_dsatur(const Graph& g, double max_seconds = 0.0);
SolutionSummary solve_incomplete(const Graph& g, const SearchOptions& opt);

// Batch solving over a worker pool

enum class Algorithm { Dsatur, Incomplete };

struct NamedGraph {
    std::string name;
    Graph graph;
};

struct NamedSummary {
    std::string name;
    SolutionSummary summary;
};

struct BatchStats {
    int total = 0;
    int solved = 0;
    double mean_seconds = 0.0;
};

std::vector<NamedSummary> solve_batch(const std::vector<NamedGraph>& instances,
                                      Algorithm algo, const SearchOptions& opt, int threads);

BatchStats summarize(const std::vector<NamedSummary>& results);
