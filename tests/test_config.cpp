#include <sstream>
#include <string>

#include "TestSupport.hpp"
#include "config/SimulationConfig.hpp"

using namespace ossim;
using ossim_test::check;
using ossim_test::checkEqual;

namespace {

Status load(SimulationConfig& config, const std::string& text) {
    std::istringstream in(text);
    return config.loadFromStream(in);
}

void testDefaults() {
    SimulationConfig config;
    check(config.validate().ok(), __LINE__);
    checkEqual(config.totalMemory, 100, __LINE__);
    check(config.scheduler == SchedulingPolicy::FCFS, __LINE__);
    checkEqual(config.diskHead, 53, __LINE__);
}

void testParsesBothSeparators() {
    SimulationConfig config;
    Status status = load(config,
                         "# workload\n"
                         "\n"
                         "total-memory 256\n"
                         "scheduler=\"rr\"\n"
                         "quantum = 4\n"
                         "disk-cylinders 500\n"
                         "disk-head 120\n"
                         "disk-direction left\n"
                         "page-size 8\n"
                         "trace off\n");
    check(status.ok(), __LINE__);
    checkEqual(config.totalMemory, 256, __LINE__);
    check(config.scheduler == SchedulingPolicy::ROUND_ROBIN, __LINE__);
    checkEqual(config.quantum, 4, __LINE__);
    checkEqual(config.diskCylinders, 500, __LINE__);
    checkEqual(config.diskHead, 120, __LINE__);
    check(config.diskDirection == SeekDirection::DECREASING, __LINE__);
    checkEqual(config.pageSize, 8, __LINE__);
    check(!config.trace, __LINE__);
}

void testRejectsBadValuesWithoutPartialUpdate() {
    SimulationConfig config;
    check(load(config, "quantum 0\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(load(config, "quantum 3x\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(load(config, "scheduler lottery\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(load(config, "disk-direction sideways\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(load(config, "colour blue\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(load(config, "total-memory\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(load(config, "disk-head 400\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(load(config, "total-memory 10\ntrace maybe\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    checkEqual(config.totalMemory, 100, __LINE__);
    checkEqual(config.quantum, 2, __LINE__);
}

void testRejectsValuesThatDoNotFitAnInt() {
    SimulationConfig config;
    check(load(config, "quantum 4294967298\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(load(config, "disk-head 4294967296\n").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(load(config, "disk-cylinders -4294967096\n").error == ErrorCode::INVALID_ARGUMENT,
          __LINE__);
    checkEqual(config.quantum, 2, __LINE__);
    checkEqual(config.diskHead, 53, __LINE__);
    checkEqual(config.diskCylinders, 200, __LINE__);

    // total-memory is 64-bit and keeps large values
    check(load(config, "total-memory 4294967296\n").ok(), __LINE__);
    checkEqual(config.totalMemory, 4294967296LL, __LINE__);
}

void testMissingFile() {
    SimulationConfig config;
    check(config.loadFromFile("/nonexistent/ossim.conf").error == ErrorCode::NOT_FOUND, __LINE__);
}

void testDisplayMentionsSettings() {
    SimulationConfig config;
    std::ostringstream out;
    config.display(out);
    check(out.str().find("fcfs") != std::string::npos, __LINE__);
    check(out.str().find("right") != std::string::npos, __LINE__);
}

} // namespace

int main() {
    testDefaults();
    testParsesBothSeparators();
    testRejectsBadValuesWithoutPartialUpdate();
    testRejectsValuesThatDoNotFitAnInt();
    testMissingFile();
    testDisplayMentionsSettings();
    return ossim_test::finish("test_config");
}
