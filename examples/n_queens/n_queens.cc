#include <fdp/constraints/tabulate.hh>
#include <fdp/csp.hh>
#include <fdp/exception.hh>
#include <fdp/propagators.hh>
#include <fdp/search_heuristics.hh>
#include <fdp/solve.hh>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

using namespace fdp;

using std::atomic;
using std::condition_variable;
using std::cout;
using std::cv_status;
using std::exception;
using std::mutex;
using std::string;
using std::thread;
using std::unique_lock;
using std::vector;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

using fmt::print;

namespace po = boost::program_options;

auto main(int argc, char * argv[]) -> int
{
    po::options_description display_options{"Program options"};
    display_options.add_options()                                                                           //
        ("help", "Display help information")                                                                //
        ("propagator", po::value<string>()->default_value("gac"), "Propagation method: bt, fc, or gac")     //
        ("variable-order", po::value<string>()->default_value("dom"), "Branching: in-order, dom, or dom-then-deg") //
        ("all", "Find all solutions")                                                                       //
        ("trace", "Trace search to standard error")                                                         //
        ("stats", "Print statistics to standard error")                                                     //
        ("timeout", po::value<unsigned long long>(), "Timeout in ms");

    po::options_description all_options{"All options"};
    all_options.add_options() //
        ("size", po::value<int>()->default_value(8), "Size of the problem to solve");

    all_options.add(display_options);

    po::positional_options_description positional_options;
    positional_options
        .add("size", -1);

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
        print("Usage: {} [options] [size]\n\n", argv[0]);
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

        int size = options_vars["size"].as<int>();
        if (size < 1)
            throw ModelException{fmt::format("size must be positive, not {}", size)};

        CSP csp{fmt::format("{} queens", size)};
        vector<VariableID> queens;
        for (int i = 0; i < size; ++i)
            queens.push_back(csp.create_variable(fmt::format("queen{}", i), 0_v, Value{size - 1}));

        for (int i = 0; i < size; ++i)
            for (int j = i + 1; j < size; ++j) {
                Value gap{j - i};
                csp.add_constraint(tabulate(csp, fmt::format("queens {} {}", i, j), {queens[i], queens[j]},
                    [gap](const Tuple & t) { return t[0] != t[1] && t[0] + gap != t[1] && t[0] - gap != t[1]; }));
            }

        auto branch_variable = variable_order::by_name(csp, options_vars["variable-order"].as<string>());
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

        auto stats = solve_with(csp, propagator_for(*method),
            SolveCallbacks{
                .solution = [&](const CSP & s) -> bool {
                    print("solution:");
                    for (auto & q : queens)
                        print(" {}", *s.variable(q).assigned_value());
                    print("\n");
                    return all;
                },
                .trace = [&](const CSP & s, unsigned long long depth) -> bool {
                    if (trace)
                        print(stderr, "depth {}: {} unassigned\n", depth, s.unassigned_variables().size());
                    return true;
                },
                .branch_variable = *branch_variable},
            &abort_flag);

        stop_timeout_thread();

        if (actually_timed_out)
            print(stderr, "timed out\n");

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
