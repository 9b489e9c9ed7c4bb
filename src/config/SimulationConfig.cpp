#include "SimulationConfig.hpp"

#include <fstream>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace ossim {

namespace {

std::string trim(const std::string& s, const char* ws = " \t\r\n") {
    std::size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    std::size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// std::stoll accepts trailing junk, so check the whole token was used.
bool parseInteger(const std::string& text, std::int64_t& out) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool fitsInt(std::int64_t value) {
    return value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
}

Status lineError(int lineNo, const std::string& line, const std::string& why) {
    return Status::failure(ErrorCode::INVALID_ARGUMENT,
                           "config line " + std::to_string(lineNo) + " '" + line + "': " + why);
}

} // namespace

Status SimulationConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return Status::failure(ErrorCode::NOT_FOUND, "cannot open config file: " + filename);
    }
    return loadFromStream(file);
}

Status SimulationConfig::loadFromStream(std::istream& in) {
    SimulationConfig parsed = *this;
    std::string raw;
    int lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::size_t pos = line.find_first_of(" \t=");
        if (pos == std::string::npos) {
            return lineError(lineNo, line, "missing value");
        }
        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1), " \t=");
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (value.empty()) {
            return lineError(lineNo, line, "missing value");
        }

        if (key == "scheduler") {
            auto policy = parseSchedulingPolicy(value);
            if (!policy.ok()) {
                return lineError(lineNo, line, policy.message);
            }
            parsed.scheduler = *policy.value;
        } else if (key == "disk-direction") {
            auto direction = parseSeekDirection(value);
            if (!direction.ok()) {
                return lineError(lineNo, line, direction.message);
            }
            parsed.diskDirection = *direction.value;
        } else if (key == "trace") {
            if (value == "true" || value == "on" || value == "1") {
                parsed.trace = true;
            } else if (value == "false" || value == "off" || value == "0") {
                parsed.trace = false;
            } else {
                return lineError(lineNo, line, "expected true or false");
            }
        } else {
            std::int64_t number = 0;
            if (!parseInteger(value, number)) {
                return lineError(lineNo, line, "not an integer");
            }
            bool intKey = key == "quantum" || key == "disk-cylinders" || key == "disk-head";
            if (intKey && !fitsInt(number)) {
                return lineError(lineNo, line, "out of range");
            }
            if (key == "total-memory") parsed.totalMemory = number;
            else if (key == "quantum") parsed.quantum = static_cast<int>(number);
            else if (key == "disk-cylinders") parsed.diskCylinders = static_cast<int>(number);
            else if (key == "disk-head") parsed.diskHead = static_cast<int>(number);
            else if (key == "page-size") parsed.pageSize = number;
            else return lineError(lineNo, line, "unknown key '" + key + "'");
        }
    }

    Status status = parsed.validate();
    if (status.ok()) {
        *this = parsed;
    }
    return status;
}

Status SimulationConfig::validate() const {
    if (totalMemory <= 0) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "total-memory must be positive");
    }
    if (quantum <= 0) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "quantum must be positive");
    }
    if (diskCylinders <= 0) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "disk-cylinders must be positive");
    }
    if (diskHead < 0 || diskHead >= diskCylinders) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "disk-head must lie in [0, disk-cylinders)");
    }
    if (pageSize <= 0) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "page-size must be positive");
    }
    return Status::success();
}

void SimulationConfig::display(std::ostream& out) const {
    out << "---- Simulation Configuration ----\n";
    out << "Total Memory        : " << totalMemory << " KB\n";
    out << "Scheduler           : " << toString(scheduler) << "\n";
    out << "Quantum             : " << quantum << "\n";
    out << "Disk Cylinders      : " << diskCylinders << "\n";
    out << "Disk Head           : " << diskHead << "\n";
    out << "Disk Direction      : " << toString(diskDirection) << "\n";
    out << "Page Size           : " << pageSize << "\n";
    out << "Trace               : " << (trace ? "on" : "off") << "\n";
    out << "----------------------------------\n";
}

} // namespace ossim
