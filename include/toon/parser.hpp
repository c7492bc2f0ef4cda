#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "toon/ast.hpp"
#include "toon/diagnostics.hpp"
#include "toon/options.hpp"
#include "toon/token.hpp"

namespace toon {

// Everything that changes while descending. Owned by one parse_document() call.
struct parse_state {
    std::size_t line = 0;                       // index into the line table
    std::size_t pos = 0;                        // token index within that line
    std::size_t depth = 0;                      // object / list item / table body nesting
    std::vector<delimiter> delimiters{delimiter::comma}; // array scopes; bottom is the document default
};

// Recursive-descent parser over a token stream. Lines are the unit of recovery:
// every failure reports at the offending token and resumes at the next line
// indented no deeper than the construct being parsed.
class Parser {
public:
    Parser(std::string_view source, const token_list& tokens, const ParserOptions& options, ErrorReporter& reporter);

    node_ptr parse_document();

private:
    struct line_info {
        std::size_t begin = 0;  // first token after leading whitespace
        std::size_t end = 0;    // newline or end_of_input token
        std::size_t indent = 0;
        bool blank = true;      // only whitespace and comments
    };

    struct array_header {
        std::size_t declared = 0;
        delimiter delim = delimiter::comma;
        bool has_schema = false;
        std::vector<std::string> schema;
        std::size_t open = 0;   // '[' token
        std::size_t size_token = 0;
        std::size_t next = 0;   // token after the header
    };

    using cell = std::pair<std::size_t, std::size_t>; // token range [first, last)

    void build_lines();

    // line navigation
    bool skip_blank(parse_state& st) const;
    void next_line(parse_state& st) const;
    void skip_block(parse_state& st, std::size_t indent) const;
    void recover(parse_state& st, std::size_t indent) const;
    void guard_progress(parse_state& st, std::size_t before, const char* where);

    // token helpers
    const token& tok(std::size_t i) const { return tokens_[i]; }
    std::size_t skip_ws(std::size_t i, std::size_t end) const;
    std::size_t region_end(std::size_t i, std::size_t end) const;
    bool at_line_end(std::size_t i, std::size_t end) const;
    bool is_delimiter(std::size_t i, delimiter d) const;
    std::optional<delimiter> delimiter_at(std::size_t i) const;
    bool looks_like_key(std::size_t i, std::size_t end) const;

    // constructs
    void parse_block(parse_state& st, std::size_t block_indent, std::vector<node_ptr>& props);
    node_ptr parse_property(parse_state& st, std::size_t indent);
    bool parse_header(parse_state& st, std::size_t i, std::size_t end, array_header& h);
    bool parse_schema(std::size_t i, std::size_t end, array_header& h);
    node_ptr parse_array_body(parse_state& st, const array_header& h, std::size_t indent, const token& anchor);
    node_ptr parse_object_block(parse_state& st, std::size_t parent_indent, const token& anchor);
    node_ptr parse_object_fields(parse_state& st, std::size_t parent_indent, const token& anchor);
    node_ptr parse_inline_array(parse_state& st, const array_header& h, std::size_t indent);
    node_ptr parse_expanded_array(parse_state& st, const array_header& h, std::size_t indent);
    node_ptr parse_table(parse_state& st, const array_header& h, std::size_t indent);
    node_ptr parse_list_item(parse_state& st, std::size_t item_indent);

    // values
    std::vector<cell> split_cells(std::size_t begin, std::size_t end, delimiter d) const;
    node_ptr make_value(std::size_t begin, std::size_t end) const;
    node_ptr make_literal(const token& t) const;

    bool enter(parse_state& st, const token& at);
    void leave(parse_state& st) const { --st.depth; }
    void check_count(const char* code, std::size_t declared, std::size_t actual, const token& at, bool rows);
    void report_indentation(const line_info& ln, std::size_t expected);
    void report_unexpected_end(const char* construct, const token& at);

    source_span span_of(const token& first, const token& last) const;
    source_span point_span(const token& at) const;

    std::string_view src_;
    const token_list& tokens_;
    const ParserOptions& opts_;
    ErrorReporter& rep_;
    std::vector<line_info> lines_;
};

} // namespace toon
