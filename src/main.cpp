#include <iostream>
#include <chrono>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <atomic>
#include <thread>
#include <mutex>
#include <vector>
#include <future>
#include <iomanip>
#include <sstream>
#include <string>
#include "exact-cover/exact_cover.hpp"
#include "algorithm-x/algorithm_x.hpp"
#include "report/report.hpp"

std::mutex results_mutex;

struct ExactCoverResult {
    std::string instance;
    int rows;
    int columns;
    std::string status;
    std::string solution;
    bool valid;
    long long explored_nodes;
    long long backtracks;
    long long time_ms;
};

std::vector<ExactCoverResult> all_results;

void writeResults(const std::string& filename) {
    std::ofstream file(filename);
    file << "Instance,Rows,Columns,Status,Solution,Valid,Explored_Nodes,Backtracks,Time_Ms\n";
    for (const auto& r : all_results) {
        file << r.instance << "," << r.rows << "," << r.columns << ","
            << r.status << "," << r.solution << ","
            << (r.valid ? "Yes" : "No") << ","
            << r.explored_nodes << ","
            << r.backtracks << ","
            << r.time_ms << "\n";
    }
}

ExactCoverResult solveInstance(const std::string& instPath, const std::string& instName) {
    ExactCoverResult r{ instName, -1, -1, "ERROR", "", false, 0, 0, -1 };

    try {
        ExactCover instance(instPath);
        AlgorithmX algorithmX(1800, 0, false);

        auto sol = algorithmX.run(instance);

        r.rows = instance.getNumSets();
        r.columns = instance.getNumElements();
        r.status = AlgorithmX::statusName(algorithmX.getStatus());
        r.solution = formatSolution(sol);
        r.valid = algorithmX.hasSolution() && instance.isExactCover(sol);
        r.explored_nodes = algorithmX.getExploredNodes();
        r.backtracks = algorithmX.getBacktracks();
        r.time_ms = algorithmX.getElapsedMillis();
    }
    catch (const std::exception& e) {
        std::cerr << "Error in " << instName << ": " << e.what() << std::endl;
    }
    return r;
}

void logResult(const ExactCoverResult& r) {
    std::ofstream log(logFileName("logs", r.instance));

    log << "Running Algorithm X on instance: " << r.instance << "\n\n";

    const std::string indent = "    ";

    log << indent
        << std::left
        << std::setw(14) << "Rows"
        << std::setw(10) << "Columns"
        << std::setw(14) << "Status"
        << std::setw(8) << "Valid"
        << std::setw(14) << "Nodes"
        << std::setw(14) << "Backtracks"
        << std::setw(10) << "Time(ms)" << std::endl;

    log << indent << std::string(84, '-') << std::endl;

    log << indent
        << std::left
        << std::setw(14) << r.rows
        << std::setw(10) << r.columns
        << std::setw(14) << r.status
        << std::setw(8) << (r.valid ? "Yes" : "No")
        << std::setw(14) << r.explored_nodes
        << std::setw(14) << r.backtracks
        << std::setw(10) << r.time_ms << std::endl;

    log << "\n" << indent << "Solution: " << (r.solution.empty() ? "(empty)" : r.solution) << std::endl;

    log.close();
}

void runInstance(const std::string& instPath, const std::string& instName) {
    ExactCoverResult r = solveInstance(instPath, instName);

    // Save log file
    logResult(r);

    // Show results on screen
    std::ostringstream out;
    out << "\n=== RESULTS FOR " << instName << " ===" << std::endl;
    out << "Size: " << r.rows << " sets x " << r.columns << " elements" << std::endl;
    out << "Status: " << r.status << (r.valid ? " (verified)" : "") << std::endl;
    if (r.status == "SOLVED") {
        out << "Solution sets: " << (r.solution.empty() ? "(empty cover)" : r.solution) << std::endl;
    }
    else if (r.status == "NO_SOLUTION") {
        out << "No exact cover exists." << std::endl;
    }
    out << "Explored nodes: " << r.explored_nodes << ", backtracks: " << r.backtracks
        << ", time: " << r.time_ms << " ms" << std::endl;

    {
        std::lock_guard<std::mutex> lock(results_mutex);
        std::cout << out.str();
        all_results.push_back(r);
    }
}

void runAllInstances(const std::string& path, const std::vector<std::string>& instances) {
    unsigned int num_threads = std::max(1u, std::thread::hardware_concurrency());
    std::cout << "Using " << num_threads << " thread(s).\n";

    std::atomic<size_t> next(0);
    std::vector<std::future<void>> futures;

    for (unsigned int t = 0; t < num_threads; t++) {
        futures.push_back(std::async(std::launch::async, [&]() {
            while (true) {
                size_t idx = next.fetch_add(1);
                if (idx >= instances.size()) break;

                {
                    std::lock_guard<std::mutex> lock(results_mutex);
                    std::cout << "\nProcessing instance " << (idx + 1) << "/"
                        << instances.size() << ": " << instances[idx] << std::endl;
                }

                runInstance((std::filesystem::path(path) / instances[idx]).string(), instances[idx]);
            }
            }));
    }
    for (auto& f : futures) f.wait();
}

std::vector<std::string> setupInstances(const std::string& path) {
    std::vector<std::string> insts;
    if (!std::filesystem::is_directory(path)) return insts;
    for (auto& e : std::filesystem::directory_iterator(path))
        if (e.is_regular_file()) insts.push_back(e.path().filename().string());
    std::sort(insts.begin(), insts.end());
    return insts;
}

int main(int argc, char* argv[]) {
    std::string path = "instances/";
    bool test = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--single") {
            test = true;
        }
        else {
            path = arg;
        }
    }

    std::filesystem::create_directory("logs");

    auto instances = setupInstances(path);
    if (instances.empty()) {
        std::cerr << "No instances found in " << path << std::endl;
        return 1;
    }

    std::cout << "Instances found: " << instances.size() << std::endl;

    std::string timestamp = std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );

    // Test mode: run only one instance
    if (test) {
        std::string instance = instances[0];
        std::cout << "TEST MODE: Running only one instance: " << instance << std::endl;

        try {
            ExactCover((std::filesystem::path(path) / instance).string()).printProblem();
        }
        catch (const std::exception& e) {
            std::cerr << "Error in " << instance << ": " << e.what() << std::endl;
        }

        runAllInstances(path, { instance });

        std::string results_filename = "logs/exact_cover_test_results_" + timestamp + ".csv";
        writeResults(results_filename);

        std::cout << "\n=== TEST FINISHED ===" << std::endl;
        std::cout << "Results saved to: " << results_filename << std::endl;
        std::cout << "Detailed log: " << logFileName("logs", instance) << std::endl;
    }
    else {
        std::cout << "FULL MODE: Running all " << instances.size() << " instances..." << std::endl;
        runAllInstances(path, instances);

        std::sort(all_results.begin(), all_results.end(),
            [](const ExactCoverResult& a, const ExactCoverResult& b) {
                return a.instance < b.instance;
            });

        std::string results_filename = "logs/exact_cover_results_" + timestamp + ".csv";
        writeResults(results_filename);
        std::cout << "All results saved to: " << results_filename << std::endl;

        auto solved = std::count_if(all_results.begin(), all_results.end(),
            [](const ExactCoverResult& r) { return r.status == "SOLVED"; });
        std::cout << "Solved: " << solved << "/" << all_results.size() << std::endl;
    }

    return 0;
}
