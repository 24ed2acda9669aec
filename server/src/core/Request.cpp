#include "core/Request.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <random>

static std::string toBase36(unsigned long long v) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    do {
        out.push_back(digits[v % 36]);
        v /= 36;
    } while (v > 0);
    std::reverse(out.begin(), out.end());
    return out;
}

static const std::string& processPrefix() {
    static const std::string prefix = []() {
        std::random_device rd;
        std::uniform_int_distribution<unsigned long long> dist(36ull * 36 * 36, 36ull * 36 * 36 * 36 - 1);
        return toBase36(dist(rd));
    }();
    return prefix;
}

RequestId RequestId::next() {
    static std::atomic<unsigned long long> counter{0};
    unsigned long long n = counter.fetch_add(1, std::memory_order_relaxed) + 1;
    return RequestId(processPrefix() + "-" + toBase36(n));
}

std::string Request::header(const std::string& name) const {
    auto same = [](const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    };
    for (const auto& h : headers) {
        if (same(h.first, name)) return h.second;
    }
    return "";
}

long long Request::elapsedMs() const {
    using namespace std::chrono;
    auto d = duration_cast<milliseconds>(steady_clock::now() - start).count();
    return d < 0 ? 0 : d;
}
