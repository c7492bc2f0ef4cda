// Public entry points: parse, try_parse, tokenize
#pragma once
#include <string_view>
#include <vector>

#include "toon/ast.hpp"
#include "toon/diagnostics.hpp"
#include "toon/options.hpp"
#include "toon/token.hpp"

namespace toon
{

    // Outcome of one parse. The document is always present, possibly partial or empty.
    class ParseResult
    {
    public:
        ParseResult();
        ParseResult(node_ptr doc, std::vector<ToonError> errors, token_list tokens);

        // Empty document carrying a single error; used when parsing could not start.
        static ParseResult failure(ToonError error);

        const node &document() const { return *document_; }
        const node_ptr &document_ptr() const { return document_; }
        const std::vector<ToonError> &errors() const { return errors_; }
        const token_list &tokens() const { return tokens_; }

        // Top-level property nodes, in source order.
        const std::vector<node_ptr> &properties() const { return properties_of(*document_); }

        bool is_success() const { return errors_.empty(); }
        bool has_errors() const { return !errors_.empty(); }

    private:
        node_ptr document_;
        std::vector<ToonError> errors_;
        token_list tokens_;
    };

    // Parse TOON text. Malformed input never throws: problems are collected in
    // the result. Throws input_error for input over options.max_input_size and
    // std::invalid_argument for options with a zero limit.
    ParseResult parse(std::string_view source, const ParserOptions &options = ParserOptions::defaults());

    // As above; a null pointer throws input_error.
    ParseResult parse(const char *source, const ParserOptions &options = ParserOptions::defaults());

    // Returns false only when parsing could not start (null or oversize source,
    // or options with a zero limit); `out` then holds an empty document and one
    // error describing why.
    // A parse that records errors still returns true.
    bool try_parse(std::string_view source, ParseResult &out, const ParserOptions &options = ParserOptions::defaults());
    bool try_parse(const char *source, ParseResult &out, const ParserOptions &options = ParserOptions::defaults());

    // Lexing only. Lexical errors are dropped; use parse() to see them.
    token_list tokenize(std::string_view source, const ParserOptions &options = ParserOptions::defaults());

} // namespace toon
