#pragma once
#include "graph.hpp"
#include "coloring.hpp"
#include <ostream>
#include <string>
#include <utility>
#include <vector>

Graph read_graph_edge_list(const std::string& path, bool one_based = false);
void write_graph_edge_list(const std::string& path, const Graph& g, bool one_based = false);

// DIMACS .col: "c" comments, "p edge N M", then "e u v" with 1-based ids.
Graph read_graph_dimacs(const std::string& path);
void write_graph_dimacs(const std::string& path, const Graph& g);

// (name, path) of every .col file in dir, sorted by name.
std::vector<std::pair<std::string, std::string>> list_instances(const std::string& dir);

// One "graph=... status=..." line, then "vertex color" lines (1-based) when
// print_coloring is set. The stream's format state is left as it was.
void write_summary(std::ostream& os, const std::string& name, const SolutionSummary& s, bool print_coloring);
