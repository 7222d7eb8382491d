#include "utils/common.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <random>
#include <sstream>
#include <unistd.h>

namespace coderun::utils {

std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string Trim(const std::string& value) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string MakeUniqueToken(const std::string& prefix) {
    static std::atomic<unsigned long> counter{0};
    thread_local std::mt19937_64 engine{std::random_device{}()};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::ostringstream oss;
    oss << prefix << ::getpid() << "-" << stamp << "-" << counter.fetch_add(1)
        << "-" << std::hex << (engine() & 0xffffffULL);
    return oss.str();
}

}  // namespace coderun::utils
