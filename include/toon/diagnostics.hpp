#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "toon/token.hpp"

namespace toon {

// Raised only for conditions that cannot produce a partial tree (null or oversize source).
struct input_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ToonError {
    std::string code;
    std::string message;
    std::string hint;
    std::size_t position = 0;
    std::size_t length = 0;
    int line = 1;
    int column = 1;
};

// Stable codes. 1xxx lexer, 2xxx structure, 3xxx size validation,
// 4xxx delimiters, 5xxx indentation, 9xxx guards.
namespace codes {
inline constexpr const char* unterminated_string = "TOON1001";
inline constexpr const char* invalid_escape = "TOON1002";
inline constexpr const char* invalid_character = "TOON1003";

inline constexpr const char* expected_property_key = "TOON2001";
inline constexpr const char* expected_colon = "TOON2002";
inline constexpr const char* expected_right_bracket = "TOON2003";
inline constexpr const char* expected_right_brace = "TOON2004";
inline constexpr const char* expected_field_name = "TOON2005";
inline constexpr const char* expected_delimiter = "TOON2006";
inline constexpr const char* unexpected_token = "TOON2007";
inline constexpr const char* unexpected_end = "TOON2008";
inline constexpr const char* empty_document = "TOON2009";

inline constexpr const char* array_size_mismatch = "TOON3001";
inline constexpr const char* table_size_mismatch = "TOON3002";
inline constexpr const char* row_field_mismatch = "TOON3003";

inline constexpr const char* mixed_delimiters = "TOON4001";
inline constexpr const char* marker_misplaced = "TOON4002";

inline constexpr const char* unexpected_indentation = "TOON5001";
inline constexpr const char* inconsistent_indentation = "TOON5002";

inline constexpr const char* no_progress = "TOON9001";
inline constexpr const char* token_limit = "TOON9002";
inline constexpr const char* string_length_limit = "TOON9003";
inline constexpr const char* depth_limit = "TOON9004";
inline constexpr const char* array_size_limit = "TOON9005";
inline constexpr const char* input_too_large = "TOON9006";
inline constexpr const char* null_source = "TOON9007";
inline constexpr const char* invalid_options = "TOON9008";
} // namespace codes

// "lexer", "parser", "validation", "delimiter", "indentation", "internal" or "unknown"
const char* error_category(std::string_view code);

// [TOON2002] Expected ':' after property key (line 2, column 5, position 15, length 2)
std::string to_string(const ToonError& e);

struct ErrorReporter {
    std::vector<ToonError>* errors = nullptr;
    void emit_error(const ToonError& e) { if (errors) errors->push_back(e); }
    ToonError make_error(std::string code, std::string message, std::string hint, const token& at) const {
        return ToonError{std::move(code), std::move(message), std::move(hint), at.offset, at.length, at.line, at.column};
    }
    ToonError make_error(std::string code, std::string message, std::string hint, std::size_t position, std::size_t length,
                         int line, int column) const {
        return ToonError{std::move(code), std::move(message), std::move(hint), position, length, line, column};
    }
    void report(const char* code, std::string message, std::string hint, const token& at) {
        emit_error(make_error(code, std::move(message), std::move(hint), at));
    }
    std::size_t count() const { return errors ? errors->size() : 0; }
};

// Suggested fixes attached to errors.
namespace hints {
std::string array_size_mismatch(std::size_t declared, std::size_t actual);
std::string table_size_mismatch(std::size_t declared, std::size_t actual);
std::string row_field_mismatch(std::size_t expected, std::size_t actual);
std::string missing_colon(std::string_view key);
std::string unterminated_string(char quote);
std::string invalid_escape(char escaped);
std::string unexpected_token(const token& t);
std::string over_indented(std::size_t expected, std::size_t actual);
std::string marker_misplaced();
std::string mixed_delimiters(delimiter active, delimiter found);
std::string limit(std::string_view option);
} // namespace hints

} // namespace toon
