#pragma once
#include <cstddef>
#include <limits>
#include <string>

namespace toon {

// Resource ceilings for a single parse. Plain value type; copy freely across threads.
struct ParserOptions {
    static constexpr std::size_t default_max_input_size = 10u * 1024u * 1024u;
    static constexpr std::size_t default_max_token_count = 1000000;
    static constexpr std::size_t default_max_string_length = 64u * 1024u;
    static constexpr std::size_t default_max_nesting_depth = 100;
    static constexpr std::size_t default_max_array_size = 1000000;

    std::size_t max_input_size = default_max_input_size;
    std::size_t max_token_count = default_max_token_count;
    std::size_t max_string_length = default_max_string_length;
    std::size_t max_nesting_depth = default_max_nesting_depth;
    std::size_t max_array_size = default_max_array_size;

    static ParserOptions defaults() { return ParserOptions{}; }
    static ParserOptions unlimited();

    // Throws std::invalid_argument if any limit is zero.
    void validate() const;

    std::string to_string() const;
};

// Overlay TOON_MAX_* environment variables on `base`.
//   TOON_MAX_INPUT_SIZE, TOON_MAX_TOKEN_COUNT, TOON_MAX_STRING_LENGTH,
//   TOON_MAX_NESTING_DEPTH, TOON_MAX_ARRAY_SIZE
// Each takes a positive integer or "unlimited"; anything else leaves the base value.
ParserOptions options_from_env(ParserOptions base = ParserOptions::defaults());

// "512 B", "64.0 KB", "10.0 MB", "unlimited"
std::string format_bytes(std::size_t bytes);

} // namespace toon
