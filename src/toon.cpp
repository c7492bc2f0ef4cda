#include "toon/toon.hpp"
#include "toon/diagnostics_json.hpp"
#include "toon/lexer.hpp"
#include "toon/parser.hpp"

#include <sstream>
#include <stdexcept>

namespace toon {

ParseResult::ParseResult() : document_(make_node(toon::document{})) {}

ParseResult::ParseResult(node_ptr doc, std::vector<ToonError> errors, token_list tokens)
    : document_(doc ? std::move(doc) : make_node(toon::document{})), errors_(std::move(errors)), tokens_(std::move(tokens)) {}

ParseResult ParseResult::failure(ToonError error) {
    std::vector<ToonError> errors;
    errors.push_back(std::move(error));
    return ParseResult(make_node(toon::document{}), std::move(errors), {});
}

namespace {

void guard_source(std::string_view source, const ParserOptions& options) {
    if (source.size() <= options.max_input_size) return;
    std::ostringstream msg;
    msg << "Input size of " << format_bytes(source.size()) << " exceeds maximum allowed size of "
        << format_bytes(options.max_input_size) << ". Raise ParserOptions::max_input_size to parse larger documents.";
    throw input_error(msg.str());
}

} // namespace

ParseResult parse(std::string_view source, const ParserOptions& options) {
    options.validate();
    guard_source(source, options);

    std::vector<ToonError> errors;
    ErrorReporter reporter{&errors};
    Lexer lexer(source, options, reporter);
    token_list tokens = lexer.tokenize();
    maybe_trace_tokens(tokens);

    Parser parser(source, tokens, options, reporter);
    node_ptr doc = parser.parse_document();

    ParseResult result(std::move(doc), std::move(errors), std::move(tokens));
    maybe_print_json(result);
    return result;
}

ParseResult parse(const char* source, const ParserOptions& options) {
    if (!source) throw input_error("Source text is null");
    return parse(std::string_view(source), options);
}

bool try_parse(std::string_view source, ParseResult& out, const ParserOptions& options) {
    try {
        out = parse(source, options);
        return true;
    } catch (const input_error& e) {
        ErrorReporter reporter;
        out = ParseResult::failure(reporter.make_error(codes::input_too_large, e.what(), hints::limit("max_input_size"), 0, 0, 1, 1));
        return false;
    } catch (const std::invalid_argument& e) {
        ErrorReporter reporter;
        out = ParseResult::failure(reporter.make_error(codes::invalid_options, e.what(), "Every ParserOptions limit must be at least 1", 0, 0, 1, 1));
        return false;
    }
}

bool try_parse(const char* source, ParseResult& out, const ParserOptions& options) {
    if (!source) {
        ErrorReporter reporter;
        out = ParseResult::failure(reporter.make_error(codes::null_source, "Source text is null", "Pass a valid string to parse", 0, 0, 1, 1));
        return false;
    }
    return try_parse(std::string_view(source), out, options);
}

token_list tokenize(std::string_view source, const ParserOptions& options) {
    options.validate();
    guard_source(source, options);
    std::vector<ToonError> discarded;
    ErrorReporter reporter{&discarded};
    Lexer lexer(source, options, reporter);
    token_list tokens = lexer.tokenize();
    maybe_trace_tokens(tokens);
    return tokens;
}

} // namespace toon
