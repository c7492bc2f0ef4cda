#include "toon/options.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace toon {

ParserOptions ParserOptions::unlimited() {
    constexpr std::size_t inf = std::numeric_limits<std::size_t>::max();
    ParserOptions o;
    o.max_input_size = inf;
    o.max_token_count = inf;
    o.max_string_length = inf;
    o.max_nesting_depth = inf;
    o.max_array_size = inf;
    return o;
}

void ParserOptions::validate() const {
    auto check = [](std::size_t v, const char* name) {
        if (v == 0) throw std::invalid_argument(std::string("ParserOptions::") + name + " must be at least 1");
    };
    check(max_input_size, "max_input_size");
    check(max_token_count, "max_token_count");
    check(max_string_length, "max_string_length");
    check(max_nesting_depth, "max_nesting_depth");
    check(max_array_size, "max_array_size");
}

std::string format_bytes(std::size_t bytes) {
    if (bytes == std::numeric_limits<std::size_t>::max()) return "unlimited";
    char buf[32];
    if (bytes < 1024) std::snprintf(buf, sizeof(buf), "%zu B", bytes);
    else if (bytes < 1024u * 1024u) std::snprintf(buf, sizeof(buf), "%.1f KB", bytes / 1024.0);
    else std::snprintf(buf, sizeof(buf), "%.1f MB", bytes / (1024.0 * 1024.0));
    return buf;
}

std::string ParserOptions::to_string() const {
    auto count = [](std::size_t v) {
        return v == std::numeric_limits<std::size_t>::max() ? std::string("unlimited") : std::to_string(v);
    };
    std::ostringstream os;
    os << "ParserOptions { max_input_size: " << format_bytes(max_input_size)
       << ", max_token_count: " << count(max_token_count)
       << ", max_string_length: " << count(max_string_length)
       << ", max_nesting_depth: " << count(max_nesting_depth)
       << ", max_array_size: " << count(max_array_size) << " }";
    return os.str();
}

ParserOptions options_from_env(ParserOptions base) {
    auto get = [](const char* k) -> const char* { const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    auto apply = [&](const char* name, std::size_t& field) {
        const char* v = get(name);
        if (!v) return;
        if (std::string(v) == "unlimited") { field = std::numeric_limits<std::size_t>::max(); return; }
        char* end = nullptr;
        errno = 0;
        unsigned long long n = std::strtoull(v, &end, 10);
        if (errno != 0 || end == v || *end != '\0' || n == 0 || v[0] == '-') return;
        field = static_cast<std::size_t>(n);
    };
    apply("TOON_MAX_INPUT_SIZE", base.max_input_size);
    apply("TOON_MAX_TOKEN_COUNT", base.max_token_count);
    apply("TOON_MAX_STRING_LENGTH", base.max_string_length);
    apply("TOON_MAX_NESTING_DEPTH", base.max_nesting_depth);
    apply("TOON_MAX_ARRAY_SIZE", base.max_array_size);
    return base;
}

} // namespace toon
