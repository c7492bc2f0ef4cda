// Token model shared by the lexer, the parser and result consumers
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace toon
{

    enum class token_kind
    {
        // value literals
        string,
        number,
        true_literal,
        false_literal,
        null_literal,
        identifier,
        // structural
        colon,
        comma,
        pipe,
        left_bracket,
        right_bracket,
        left_brace,
        right_brace,
        // layout
        newline,
        indent,
        dedent,
        whitespace,
        comment,
        end_of_input,
        invalid
    };

    enum class delimiter
    {
        comma,
        tab,
        pipe
    };

    // One lexeme. `text` is the exact source slice; `value` is the decoded
    // form (escape-processed for quoted strings, identical to text otherwise).
    struct token
    {
        token_kind kind = token_kind::invalid;
        std::string text;
        std::string value;
        int line = 1;
        int column = 1;
        std::size_t offset = 0;
        std::size_t length = 0;
    };

    inline const char *to_string(token_kind k)
    {
        switch (k)
        {
        case token_kind::string:
            return "string";
        case token_kind::number:
            return "number";
        case token_kind::true_literal:
            return "true";
        case token_kind::false_literal:
            return "false";
        case token_kind::null_literal:
            return "null";
        case token_kind::identifier:
            return "identifier";
        case token_kind::colon:
            return "colon";
        case token_kind::comma:
            return "comma";
        case token_kind::pipe:
            return "pipe";
        case token_kind::left_bracket:
            return "left-bracket";
        case token_kind::right_bracket:
            return "right-bracket";
        case token_kind::left_brace:
            return "left-brace";
        case token_kind::right_brace:
            return "right-brace";
        case token_kind::newline:
            return "newline";
        case token_kind::indent:
            return "indent";
        case token_kind::dedent:
            return "dedent";
        case token_kind::whitespace:
            return "whitespace";
        case token_kind::comment:
            return "comment";
        case token_kind::end_of_input:
            return "end-of-input";
        case token_kind::invalid:
            return "invalid";
        }
        return "unknown";
    }

    inline bool is_value_kind(token_kind k)
    {
        return k == token_kind::string || k == token_kind::number || k == token_kind::true_literal ||
               k == token_kind::false_literal || k == token_kind::null_literal || k == token_kind::identifier;
    }
    inline bool is_structural_kind(token_kind k) { return k >= token_kind::colon && k <= token_kind::right_brace; }
    inline bool is_layout_kind(token_kind k) { return k >= token_kind::newline && k <= token_kind::whitespace; }

    inline const char *to_string(delimiter d)
    {
        switch (d)
        {
        case delimiter::comma:
            return "comma";
        case delimiter::tab:
            return "tab";
        case delimiter::pipe:
            return "pipe";
        }
        return "unknown";
    }
    inline char delimiter_char(delimiter d) { return d == delimiter::tab ? '\t' : d == delimiter::pipe ? '|' : ','; }

    // Readable single-line rendering used by traces and test failure output.
    std::string to_string(const token &t);

    using token_list = std::vector<token>;

} // namespace toon
