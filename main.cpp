//
// Created by the causal_adjust developers on 10/19/26.
//
#include "CausalDAG.h"
#include "Errors.h"
#include "utils.h"
#include <cxxopts.hpp>
#include <iostream>

#include "spdlog/sinks/stdout_color_sinks.h"

int main(int argc, char *argv[]) {
    cxxopts::Options options("adjustment-set",
                             "Compute the minimal adjustment set of a causal DAG for given treatments and outcomes");
    auto option_adder = options.add_options();
    option_adder("dag,d", "Causal DAG in DOT format", cxxopts::value<std::string>());
    option_adder("treatments,t", "Comma-separated treatment variables",
                 cxxopts::value<std::vector<std::string>>());
    option_adder("outcomes,o", "Comma-separated outcome variables",
                 cxxopts::value<std::vector<std::string>>());
    option_adder("backdoor-graph", "Also print the proper backdoor graph", cxxopts::value<bool>());
    option_adder("log-level", "trace, debug, info, warn, error (default `info`)",
                 cxxopts::value<std::string>()->default_value("info"));
    option_adder("h,help", "Print usage");

    auto logger = spdlog::stdout_color_mt("stdout_logger");

    NodeNames treatments;
    NodeNames outcomes;
    std::string dag_path;
    bool print_backdoor_graph = false;
    try {
        auto args = options.parse(argc, argv);
        if (args.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        if (!args.count("dag") || !args.count("treatments") || !args.count("outcomes")) {
            logger->error("--dag, --treatments and --outcomes are required");
            std::cerr << options.help() << std::endl;
            return 2;
        }
        logger->set_level(spdlog::level::from_str(args["log-level"].as<std::string>()));
        dag_path = args["dag"].as<std::string>();
        for (auto &name: args["treatments"].as<std::vector<std::string>>()) { treatments.insert(name); }
        for (auto &name: args["outcomes"].as<std::vector<std::string>>()) { outcomes.insert(name); }
        print_backdoor_graph = args.count("backdoor-graph") > 0;
    } catch (const std::exception &e) {
        logger->error("Invalid arguments: {}", e.what());
        return 2;
    }

    try {
        logger->info("Loading causal DAG: {}", dag_path);
        auto start_time = high_resolution_clock::now();
        CausalDAG dag = CausalDAG::from_dot(dag_path);
        logger->info("Loaded {} nodes and {} edges in {}s", dag.get_number_of_nodes(),
                     dag.get_number_of_edges(), measure_time(start_time));
        logger->debug("{}", dag.to_string());

        if (print_backdoor_graph) {
            std::cout << dag.get_proper_backdoor_graph(treatments, outcomes) << std::endl;
        }
        NodeNames adjustment_set = dag.get_minimal_adjustment_set(treatments, outcomes);
        logger->info("Minimal adjustment set: {}", join_names(adjustment_set));
        for (auto &name: adjustment_set) { std::cout << name << std::endl; }
    } catch (const CycleError &e) {
        logger->error("{}", e.what());
        return 1;
    } catch (const UnknownNodeError &e) {
        logger->error("{}", e.what());
        return 1;
    } catch (const NoAdjustmentSetError &e) {
        logger->error("No adjustment set: {}", e.what());
        return 1;
    } catch (const std::runtime_error &e) {
        logger->error("{}", e.what());
        return 1;
    }
    return 0;
}
