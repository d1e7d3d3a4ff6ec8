/**
 * @file types.cpp
 * @brief Language name parsing and session id generation.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <random>

namespace sandbox_runner {

std::optional<Language> parse_language(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "python" || lowered == "py" || lowered == "python3") {
        return Language::Python;
    }
    if (lowered == "javascript" || lowered == "js" || lowered == "node") {
        return Language::JavaScript;
    }
    if (lowered == "java") return Language::Java;
    if (lowered == "cpp" || lowered == "c++") return Language::Cpp;
    if (lowered == "go" || lowered == "golang") return Language::Go;
    if (lowered == "r") return Language::R;
    return std::nullopt;
}

SessionId generate_session_id() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard lock(mutex);
        hi = engine();
        lo = engine();
    }
    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return SessionId(buf);
}

}  // namespace sandbox_runner
