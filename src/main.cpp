#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "config/SimulationConfig.hpp"
#include "core/Simulation.hpp"
#include "fs/FileSystem.hpp"
#include "sync/Semaphore.hpp"
#include "trace/ConsoleTracer.hpp"

namespace {

void banner(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n" << title << "\n"
              << std::string(60, '=') << std::endl;
}

void reportFailure(const std::string& what, const ossim::Status& status) {
    std::cerr << what << " failed: " << ossim::toString(status.error) << ": " << status.message
              << std::endl;
}

void runCpuScenario(const ossim::Simulation& sim) {
    banner("CPU Scheduling");
    std::vector<ossim::ProcessInfo> workload = {
        {1, "P1", 1, 5, 0},
        {2, "P2", 2, 3, 1},
        {3, "P3", 1, 8, 2},
    };
    auto report = sim.scheduleCpu(workload);
    if (!report.ok()) {
        reportFailure("scheduling", report.status());
        return;
    }
    std::cout << "\n--- Scheduling Statistics (" << ossim::toString(report.value->policy) << ") ---\n";
    for (const auto& p : report.value->statistics.processes) {
        std::cout << p.name << ": Waiting=" << p.waiting_time << ", Turnaround=" << p.turnaround_time
                  << "\n";
    }
    std::cout << std::fixed << std::setprecision(2)
              << "\nAverage Waiting Time: " << report.value->statistics.average_waiting
              << "\nAverage Turnaround Time: " << report.value->statistics.average_turnaround
              << std::endl;
}

void printMemory(const ossim::MemoryAllocator& memory) {
    std::cout << "\n--- Memory Layout ---\n";
    for (const auto& e : memory.snapshot()) {
        std::cout << "[" << std::setw(4) << e.start << "-" << std::setw(4) << e.end() << "] "
                  << std::setw(4) << e.size << "KB "
                  << (e.free ? std::string("FREE") : "P" + std::to_string(*e.owner)) << "\n";
    }
}

void runMemoryScenario(ossim::Simulation& sim) {
    banner("Memory Management");
    ossim::MemoryAllocator* memory = sim.memory();
    const std::vector<std::pair<int, std::int64_t>> requests = {{1, 20}, {2, 30}, {3, 15}};
    for (const auto& request : requests) {
        auto address = memory->allocate(request.first, request.second);
        if (!address.ok()) {
            reportFailure("allocation", address.status());
        }
    }
    printMemory(*memory);

    ossim::Status freed = memory->deallocate(2);
    if (!freed.ok()) {
        reportFailure("deallocation", freed);
    }
    printMemory(*memory);

    auto big = memory->allocate(4, 35);
    if (!big.ok()) {
        reportFailure("allocation", big.status());
    }
}

void runPagingScenario(ossim::Simulation& sim) {
    banner("Paging System");
    ossim::PageTable* table = sim.pageTable();
    const std::vector<std::pair<std::int64_t, std::int64_t>> mappings = {{0, 2}, {1, 5}, {2, 1}};
    for (const auto& mapping : mappings) {
        ossim::Status added = table->addMapping(mapping.first, mapping.second);
        if (!added.ok()) {
            reportFailure("page mapping", added);
        }
    }
    for (std::int64_t logical : {0, 7, 10}) {
        auto physical = table->translate(logical);
        if (!physical.ok()) {
            reportFailure("translation of " + std::to_string(logical), physical.status());
        }
    }
}

void runSemaphoreScenario(const ossim::TraceSink& trace) {
    banner("Synchronization - Semaphores");
    ossim::Semaphore sem(1);
    sem.setTraceSink(trace);
    sem.wait(1);
    sem.wait(2);
    sem.signal();
}

void runDeadlockScenario(const ossim::Simulation& sim) {
    banner("Deadlock Detection");
    ossim::ResourceSnapshot snapshot;
    snapshot.allocation = {{0, 1, 0}, {2, 0, 0}, {3, 0, 2}};
    snapshot.max_need = {{7, 5, 3}, {3, 2, 2}, {9, 0, 2}};
    snapshot.available = {3, 3, 2};

    auto report = sim.checkSafety(snapshot);
    if (!report.ok()) {
        reportFailure("safety check", report.status());
        return;
    }
    std::cout << "System is in " << ossim::toString(report.value->verdict) << " state!\n";
    const auto& listed = report.value->verdict == ossim::SafetyVerdict::SAFE
                             ? report.value->safe_sequence
                             : report.value->deadlocked;
    std::cout << (report.value->verdict == ossim::SafetyVerdict::SAFE ? "Safe sequence:"
                                                                      : "Deadlocked processes:");
    for (int p : listed) {
        std::cout << " P" << p;
    }
    std::cout << std::endl;
}

void runFileSystemScenario() {
    banner("File System");
    ossim::FileSystem fs;
    for (const auto& created : {fs.createFile("hello.txt", "Hello, World!"),
                                fs.createFile("readme.md", "# Operating System Project"),
                                fs.createDirectory("documents")}) {
        if (!created.ok()) {
            reportFailure("create", created.status());
        }
    }

    std::cout << "Contents of " << fs.currentPath() << ":\n";
    for (const auto& entry : fs.list()) {
        std::cout << "  [" << (entry.is_directory ? "DIR" : "FILE") << "] " << entry.name
                  << " (size: " << entry.size << " bytes)\n";
    }
    auto content = fs.readFile("hello.txt");
    if (content.ok()) {
        std::cout << "Content of 'hello.txt':\n" << *content.value << std::endl;
    } else {
        reportFailure("read", content.status());
    }
}

void runDiskScenario(const ossim::Simulation& sim) {
    banner("Disk Scheduling");
    const std::vector<int> requests = {98, 183, 37, 122, 14, 124, 65, 67};
    for (bool useScan : {false, true}) {
        std::cout << "\n=== " << (useScan ? "SCAN" : "FCFS") << " Disk Scheduling ===\n"
                  << "Initial head position: " << sim.config().diskHead << "\n";
        auto schedule = sim.scheduleDisk(requests, useScan);
        if (!schedule.ok()) {
            reportFailure("disk scheduling", schedule.status());
            continue;
        }
        std::cout << "Total seek time: " << schedule.value->total_seek << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        ossim::SimulationConfig config;
        if (argc > 1) {
            ossim::Status loaded = config.loadFromFile(argv[1]);
            if (!loaded.ok()) {
                std::cerr << "Failed to load config: " << loaded.message << std::endl;
                return 1;
            }
        }
        config.display(std::cout);

        ossim::ConsoleTracer tracer(std::cout);
        ossim::TraceSink trace = config.trace ? tracer.sink() : ossim::TraceSink();

        ossim::Simulation sim;
        sim.setTraceSink(trace);
        ossim::Status status = sim.initialize(config);
        if (!status.ok()) {
            std::cerr << "Failed to initialize simulation: " << status.message << std::endl;
            return 1;
        }

        runCpuScenario(sim);
        runMemoryScenario(sim);
        runPagingScenario(sim);
        runSemaphoreScenario(trace);
        runDeadlockScenario(sim);
        runFileSystemScenario();
        runDiskScenario(sim);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
