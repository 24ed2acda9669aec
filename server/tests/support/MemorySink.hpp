#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "monitor/LogSink.hpp"

// Keeps every record in memory for assertions.
class MemorySink : public LogSink {
public:
    void write(const std::string& line) override {
        std::lock_guard<std::mutex> lock(mtx_);
        lines_.push_back(line);
    }

    std::vector<nlohmann::json> records() const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<nlohmann::json> out;
        for (const auto& l : lines_) out.push_back(nlohmann::json::parse(l));
        return out;
    }

    std::vector<nlohmann::json> records(const std::string& channel, const std::string& msg = "") const {
        std::vector<nlohmann::json> out;
        for (auto& r : records()) {
            if (r["channel"] == channel && (msg.empty() || r["msg"] == msg)) out.push_back(r);
        }
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return lines_.size();
    }

private:
    mutable std::mutex mtx_;
    std::vector<std::string> lines_;
};
