#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Settings read once at startup: JSON file first, then --key=value overrides.
// Keys are flat and dotted, e.g. "download.threads".
class Config {
public:
    int port = 5956;
    int downloadThreads = 24;
    bool httpCompression = true;
    int backgroundThreads = 40;
    std::string allocator = "pooled";   // pooled | unpooled

    std::string logLevel = "info";
    bool logAsync = false;
    std::string logFile;                 // empty = stdout

    std::vector<std::string> origins{"https://repo1.maven.org/maven2"};

    std::string tlsCert;
    std::string tlsKey;

    long connectTimeoutMs = 10000;
    long fetchTimeoutMs = 0;
    long acquireTimeoutMs = 30000;
    long maxRedirects = 10;
    std::size_t maxChunk = 16384;
    std::size_t maxBody = 0;
    std::string userAgent = "TinyMavenProxy 1.0";

    Config() = default;

    // Missing or unreadable file: defaults, with a warning on stderr.
    explicit Config(const std::string& path);

    // Invalid entries keep their current value, with a warning on stderr.
    void merge(const nlohmann::json& j);

    // "--key=value" overrides; unknown arguments are reported and ignored.
    void applyArgs(const std::vector<std::string>& args);

    bool pooledAllocator() const { return allocator == "pooled"; }
    bool tlsEnabled() const { return !tlsCert.empty() && !tlsKey.empty(); }

    // --config=<path> if given, otherwise fallback
    static std::string configPath(const std::vector<std::string>& args, const std::string& fallback);

    static Config fromCommandLine(int argc, char* argv[], const std::string& defaultPath);
};
