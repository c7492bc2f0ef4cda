#pragma once
#include <cstddef>
#include <string_view>

#include "toon/diagnostics.hpp"
#include "toon/options.hpp"
#include "toon/token.hpp"

namespace toon {

// Single-pass scanner producing a lossless token stream terminated by end_of_input.
// Lexical problems go to the reporter; scanning never stops early except on the
// token-count ceiling.
class Lexer {
public:
    Lexer(std::string_view source, const ParserOptions& options, ErrorReporter& reporter);

    token_list tokenize();

    bool truncated() const { return truncated_; }

private:
    struct cursor {
        std::size_t p = 0;
        int line = 1;
        int col = 1;
    };

    bool eof() const { return cur_.p >= src_.size(); }
    char peek(std::size_t ahead = 0) const {
        return cur_.p + ahead < src_.size() ? src_[cur_.p + ahead] : '\0';
    }
    char get();

    token next_token();
    token make(token_kind kind, const cursor& start) const;
    token lex_newline(const cursor& start);
    token lex_comment(const cursor& start);
    token lex_quoted(const cursor& start);
    token lex_number_or_word(const cursor& start);
    token lex_word(const cursor& start);
    token classify_word(token t) const;

    bool at_comment_start() const;
    void check_length(const token& t);

    std::string_view src_;
    const ParserOptions& opts_;
    ErrorReporter& rep_;
    cursor cur_;
    bool truncated_ = false;
};

} // namespace toon
