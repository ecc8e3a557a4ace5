#include <fdp/constraints/cage.hh>
#include <fdp/exception.hh>
#include <fdp/models/funpuzz.hh>
#include <fdp/propagators.hh>
#include <fdp/search_heuristics.hh>
#include <fdp/solve.hh>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <nlohmann/json.hpp>

using namespace fdp;

using std::atomic;
using std::condition_variable;
using std::cout;
using std::cv_status;
using std::exception;
using std::ifstream;
using std::mutex;
using std::string;
using std::thread;
using std::unique_lock;
using std::vector;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

using fmt::print;

namespace po = boost::program_options;

namespace
{
    // a four by four puzzle, used when no file is given
    const vector<vector<long long>> default_puzzle{
        {4}, {11, 21, 4, 0}, {12, 13, 6, 3}, {14, 24, 2, 1}, {22, 23, 3, 1},
        {31, 32, 41, 9, 0}, {33, 34, 2, 2}, {42, 43, 44, 12, 3}};

    auto read_puzzle(const string & filename) -> vector<vector<long long>>
    {
        ifstream infile{filename};
        if (! infile)
            throw ModelException{fmt::format("error reading from {}", filename)};

        auto data = nlohmann::json::parse(infile);
        if (! data.is_array())
            throw ModelException{fmt::format("expected an array of arrays of integers in {}", filename)};

        return data.get<vector<vector<long long>>>();
    }

    auto build_model(const FunPuzz & puzzle, const string & model, bool all_different_grid) -> FunPuzzModel
    {
        if (model == "binary")
            return binary_ne_grid(puzzle);
        else if (model == "nary")
            return nary_ad_grid(puzzle);
        else if (model == "caged")
            return caged_csp_model(puzzle, all_different_grid ? GridEncoding::AllDifferent : GridEncoding::BinaryNotEquals);
        else
            throw ModelException{fmt::format("unknown model '{}', expected binary, nary, or caged", model)};
    }
}

auto main(int argc, char * argv[]) -> int
{
    po::options_description display_options{"Program options"};
    display_options.add_options()                                                                           //
        ("help", "Display help information")                                                                //
        ("propagator", po::value<string>()->default_value("gac"), "Propagation method: bt, fc, or gac")     //
        ("model", po::value<string>()->default_value("caged"), "Model to solve: binary, nary, or caged")    //
        ("all-different-grid", "Use all-different rather than not-equals for the grid in the caged model") //
        ("variable-order", po::value<string>()->default_value("dom"), "Branching: in-order, dom, or dom-then-deg") //
        ("all", "Find all solutions")                                                                       //
        ("trace", "Trace search to standard error")                                                         //
        ("stats", "Print statistics to standard error")                                                     //
        ("timeout", po::value<unsigned long long>(), "Timeout in ms");

    po::options_description all_options{"All options"};
    all_options.add_options() //
        ("file", po::value<string>(), "JSON puzzle file");

    all_options.add(display_options);

    po::positional_options_description positional_options;
    positional_options
        .add("file", 1);

    po::variables_map options_vars;

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all_options)
                      .positional(positional_options)
                      .run(),
            options_vars);
        po::notify(options_vars);
    }
    catch (const po::error & e) {
        print(stderr, "Error: {}\n", e.what());
        print(stderr, "Try {} --help\n", argv[0]);
        return EXIT_FAILURE;
    }

    if (options_vars.contains("help")) {
        print("Usage: {} [options] [puzzle.json]\n\n", argv[0]);
        display_options.print(cout);
        return EXIT_SUCCESS;
    }

    atomic<bool> abort_flag{false};
    thread timeout_thread;
    mutex timeout_mutex;
    condition_variable timeout_cv;
    bool actually_timed_out = false;

    auto stop_timeout_thread = [&] {
        if (timeout_thread.joinable()) {
            {
                unique_lock<mutex> guard(timeout_mutex);
                abort_flag.store(true);
                timeout_cv.notify_all();
            }
            timeout_thread.join();
        }
    };

    try {
        auto method = parse_propagation_method(options_vars["propagator"].as<string>());
        if (! method)
            throw ModelException{fmt::format("unknown propagator '{}', expected bt, fc, or gac",
                options_vars["propagator"].as<string>())};

        auto puzzle = parse_funpuzz(options_vars.contains("file") ? read_puzzle(options_vars["file"].as<string>()) : default_puzzle);
        auto model = build_model(puzzle, options_vars["model"].as<string>(), options_vars.contains("all-different-grid"));

        auto branch_variable = variable_order::by_name(model.csp, options_vars["variable-order"].as<string>());
        if (! branch_variable)
            throw ModelException{fmt::format("unknown variable order '{}'", options_vars["variable-order"].as<string>())};

        if (options_vars.contains("timeout")) {
            milliseconds limit{options_vars["timeout"].as<unsigned long long>()};

            timeout_thread = thread([limit = limit, &abort_flag, &timeout_mutex, &timeout_cv, &actually_timed_out] {
                auto abort_time = steady_clock::now() + limit;
                {
                    unique_lock<mutex> guard(timeout_mutex);
                    while (! abort_flag.load()) {
                        if (cv_status::timeout == timeout_cv.wait_until(guard, abort_time)) {
                            actually_timed_out = true;
                            break;
                        }
                    }
                }
                abort_flag.store(true);
            });
        }

        bool all = options_vars.contains("all"), trace = options_vars.contains("trace");

        auto stats = solve_with(model.csp, propagator_for(*method),
            SolveCallbacks{
                .solution = [&](const CSP & csp) -> bool {
                    print("solution:\n");
                    for (auto & row : model.grid) {
                        for (auto & v : row)
                            print(" {}", *csp.variable(v).assigned_value());
                        print("\n");
                    }
                    return all;
                },
                .trace = [&](const CSP & csp, unsigned long long depth) -> bool {
                    if (trace)
                        print(stderr, "depth {}: {} unassigned\n", depth, csp.unassigned_variables().size());
                    return true;
                },
                .branch_variable = *branch_variable},
            &abort_flag);

        stop_timeout_thread();

        if (actually_timed_out)
            print(stderr, "timed out\n");
        if (0 == stats.solutions && ! actually_timed_out)
            print("no solution\n");

        if (options_vars.contains("stats"))
            print(stderr, "propagator: {}\n{}", *method, stats);
    }
    catch (const exception & e) {
        print(stderr, "{}: error: {}\n", argv[0], e.what());
        stop_timeout_thread();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
