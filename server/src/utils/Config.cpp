#include "utils/Config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

void warnInvalid(const std::string& key, const json& value) {
    std::cerr << "[Config] Invalid value for '" << key << "': " << value.dump()
              << ", keeping default\n";
}

template <typename T>
void readNumber(const json& j, const std::string& key, T& out, long long min, long long max) {
    auto it = j.find(key);
    if (it == j.end()) return;

    long long v = 0;
    if (it->is_number_integer()) {
        v = it->get<long long>();
    } else if (it->is_string()) {
        try {
            std::size_t used = 0;
            const std::string s = it->get<std::string>();
            v = std::stoll(s, &used);
            if (used != s.size()) {
                warnInvalid(key, *it);
                return;
            }
        } catch (const std::exception&) {
            warnInvalid(key, *it);
            return;
        }
    } else {
        warnInvalid(key, *it);
        return;
    }

    if (v < min || v > max) {
        warnInvalid(key, *it);
        return;
    }
    out = static_cast<T>(v);
}

void readBool(const json& j, const std::string& key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) return;

    if (it->is_boolean()) {
        out = it->get<bool>();
        return;
    }
    if (it->is_string()) {
        std::string s = lower(it->get<std::string>());
        if (s == "true" || s == "yes" || s == "1") { out = true; return; }
        if (s == "false" || s == "no" || s == "0") { out = false; return; }
    }
    warnInvalid(key, *it);
}

void readString(const json& j, const std::string& key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) return;

    if (it->is_string()) {
        out = it->get<std::string>();
    } else {
        warnInvalid(key, *it);
    }
}

std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string item;
    while (std::getline(in, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

const std::vector<std::string> kKnownKeys = {
    "port", "download.threads", "http.compression", "background.threads",
    "bytebuf.allocator", "log.level", "log.async", "log.file", "origins",
    "tls.cert", "tls.key", "fetch.connect.timeout.ms", "fetch.timeout.ms",
    "fetch.acquire.timeout.ms", "fetch.max.redirects", "fetch.max.chunk",
    "fetch.max.body", "user.agent",
};

}  // namespace

Config::Config(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + path);
        }

        json j;
        file >> j;
        if (!j.is_object()) {
            throw std::runtime_error("Config file is not a JSON object: " + path);
        }
        merge(j);

        std::cout << "[Config] Loaded " << path << ": port=" << port
                  << ", download.threads=" << downloadThreads
                  << ", background.threads=" << backgroundThreads
                  << ", origins=" << origins.size()
                  << "\n";

    } catch (const std::exception& e) {
        std::cerr << "[Config] " << e.what() << ", using defaults\n";
    }
}

void Config::merge(const json& j) {
    if (!j.is_object()) return;

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (std::find(kKnownKeys.begin(), kKnownKeys.end(), it.key()) == kKnownKeys.end()) {
            std::cerr << "[Config] Unknown key '" << it.key() << "' ignored\n";
        }
    }

    readNumber(j, "port", port, 0, 65535);
    readNumber(j, "download.threads", downloadThreads, 1, 1024);
    readBool(j, "http.compression", httpCompression);
    readNumber(j, "background.threads", backgroundThreads, 1, 4096);

    auto alloc = j.find("bytebuf.allocator");
    if (alloc != j.end()) {
        std::string a = alloc->is_string() ? lower(alloc->get<std::string>()) : "";
        if (a == "pooled" || a == "unpooled") {
            allocator = a;
        } else {
            warnInvalid("bytebuf.allocator", *alloc);
        }
    }

    auto level = j.find("log.level");
    if (level != j.end()) {
        static const std::vector<std::string> names = {
            "trace", "debug", "info", "warn", "warning", "error", "fatal"};
        std::string l = level->is_string() ? lower(level->get<std::string>()) : "";
        if (std::find(names.begin(), names.end(), l) != names.end()) {
            logLevel = l;
        } else {
            warnInvalid("log.level", *level);
        }
    }
    readBool(j, "log.async", logAsync);
    readString(j, "log.file", logFile);

    auto orig = j.find("origins");
    if (orig != j.end()) {
        std::vector<std::string> list;
        bool ok = true;
        if (orig->is_string()) {
            list = splitList(orig->get<std::string>());
        } else if (orig->is_array()) {
            for (const auto& o : *orig) {
                if (!o.is_string()) { ok = false; break; }
                list.push_back(o.get<std::string>());
            }
        } else {
            ok = false;
        }

        for (auto& o : list) {
            while (!o.empty() && o.back() == '/') o.pop_back();
            if (o.rfind("http://", 0) != 0 && o.rfind("https://", 0) != 0) ok = false;
        }

        if (ok && !list.empty()) {
            origins = list;
        } else {
            warnInvalid("origins", *orig);
        }
    }

    readString(j, "tls.cert", tlsCert);
    readString(j, "tls.key", tlsKey);

    const long long maxLong = std::numeric_limits<long>::max();
    readNumber(j, "fetch.connect.timeout.ms", connectTimeoutMs, 0, maxLong);
    readNumber(j, "fetch.timeout.ms", fetchTimeoutMs, 0, maxLong);
    readNumber(j, "fetch.acquire.timeout.ms", acquireTimeoutMs, 0, maxLong);
    readNumber(j, "fetch.max.redirects", maxRedirects, 0, 100);
    readNumber(j, "fetch.max.chunk", maxChunk, 1, 16 * 1024 * 1024);
    readNumber(j, "fetch.max.body", maxBody, 0, std::numeric_limits<long long>::max());
    readString(j, "user.agent", userAgent);
}

void Config::applyArgs(const std::vector<std::string>& args) {
    json overrides = json::object();

    for (const auto& arg : args) {
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) != 0 || eq == std::string::npos || eq == 2) {
            std::cerr << "[Config] Ignoring argument '" << arg << "', expected --key=value\n";
            continue;
        }

        std::string key = arg.substr(2, eq - 2);
        std::string value = arg.substr(eq + 1);
        if (key == "config") continue;

        // numbers, booleans and arrays keep their JSON type, anything else is a string
        json parsed = json::parse(value, nullptr, false);
        if (parsed.is_discarded() || parsed.is_object()) {
            overrides[key] = value;
        } else {
            overrides[key] = parsed;
        }
    }

    merge(overrides);
}

std::string Config::configPath(const std::vector<std::string>& args, const std::string& fallback) {
    for (const auto& arg : args) {
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return fallback;
}

Config Config::fromCommandLine(int argc, char* argv[], const std::string& defaultPath) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.emplace_back(argv[i]);
    }

    Config cfg(configPath(args, defaultPath));
    cfg.applyArgs(args);
    return cfg;
}
