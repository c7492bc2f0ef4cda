#include "toon/lexer.hpp"
#include "toon/grammar.hpp"

#include <sstream>

namespace toon {

namespace {

bool is_space(char c) { return c == ' ' || c == '\t'; }
bool is_eol(char c) { return c == '\n' || c == '\r'; }
bool is_control(char c) {
    auto u = static_cast<unsigned char>(c);
    return (u < 0x20 && c != '\t' && c != '\n' && c != '\r') || u == 0x7F;
}
bool is_structural(char c) {
    switch (c) {
        case ':': case ',': case '|': case '[': case ']': case '{': case '}': return true;
        default: return false;
    }
}
bool is_word_char(char c) {
    return c != '\0' && !is_space(c) && !is_eol(c) && !is_structural(c) && c != '"' && c != '\\' && !is_control(c);
}

// Length of the number literal at the front of `rest`, 0 if none.
std::size_t match_number(std::string_view rest) {
    tao::pegtl::memory_input<> in(rest.data(), rest.data() + rest.size(), "number");
    if (!tao::pegtl::parse<grammar::number>(in)) return 0;
    return static_cast<std::size_t>(in.current() - rest.data());
}

bool has_leading_zero(std::string_view lit) {
    if (!lit.empty() && lit.front() == '-') lit.remove_prefix(1);
    std::size_t digits = 0;
    while (digits < lit.size() && lit[digits] >= '0' && lit[digits] <= '9') ++digits;
    return digits > 1 && lit.front() == '0';
}

} // namespace

std::string to_string(const token& t) {
    std::ostringstream os;
    os << "TOK " << to_string(t.kind) << " '";
    for (char c : t.text) {
        if (c == '\n') os << "\\n";
        else if (c == '\r') os << "\\r";
        else if (c == '\t') os << "\\t";
        else os << c;
    }
    os << "' @" << t.line << ':' << t.column;
    return os.str();
}

Lexer::Lexer(std::string_view source, const ParserOptions& options, ErrorReporter& reporter)
    : src_(source), opts_(options), rep_(reporter) {}

char Lexer::get() {
    if (eof()) return '\0';
    char c = src_[cur_.p++];
    // \r\n counts once, on the \n
    if (c == '\n' || (c == '\r' && peek() != '\n')) { ++cur_.line; cur_.col = 1; }
    else ++cur_.col;
    return c;
}

token Lexer::make(token_kind kind, const cursor& start) const {
    token t;
    t.kind = kind;
    t.text = std::string(src_.substr(start.p, cur_.p - start.p));
    t.value = t.text;
    t.line = start.line;
    t.column = start.col;
    t.offset = start.p;
    t.length = cur_.p - start.p;
    return t;
}

token_list Lexer::tokenize() {
    token_list out;
    while (!eof()) {
        if (out.size() >= opts_.max_token_count) {
            truncated_ = true;
            std::ostringstream msg;
            msg << "Token count exceeds maximum allowed (" << opts_.max_token_count << "); tokenization stopped";
            rep_.emit_error(rep_.make_error(codes::token_limit, msg.str(), hints::limit("max_token_count"), cur_.p, 0,
                                            cur_.line, cur_.col));
            break;
        }
        out.push_back(next_token());
    }
    out.push_back(make(token_kind::end_of_input, cur_));
    return out;
}

bool Lexer::at_comment_start() const {
    bool opener = peek() == '#' || (peek() == '/' && peek(1) == '/');
    if (!opener) return false;
    if (cur_.p == 0) return true;
    char prev = src_[cur_.p - 1];
    return is_space(prev) || is_eol(prev);
}

token Lexer::next_token() {
    cursor start = cur_;
    char c = peek();
    if (is_space(c)) {
        while (is_space(peek())) get();
        return make(token_kind::whitespace, start);
    }
    if (is_eol(c)) return lex_newline(start);
    if (at_comment_start()) return lex_comment(start);
    switch (c) {
        case ':': get(); return make(token_kind::colon, start);
        case ',': get(); return make(token_kind::comma, start);
        case '|': get(); return make(token_kind::pipe, start);
        case '[': get(); return make(token_kind::left_bracket, start);
        case ']': get(); return make(token_kind::right_bracket, start);
        case '{': get(); return make(token_kind::left_brace, start);
        case '}': get(); return make(token_kind::right_brace, start);
        case '"': case '\'': return lex_quoted(start);
        default: break;
    }
    bool digit = c >= '0' && c <= '9';
    if (digit || (c == '-' && peek(1) >= '0' && peek(1) <= '9')) return lex_number_or_word(start);
    if (is_word_char(c)) return lex_word(start);

    get();
    token bad = make(token_kind::invalid, start);
    std::ostringstream msg;
    if (c == '\\') msg << "Unexpected character '\\' outside of a quoted string";
    else msg << "Invalid character (code " << static_cast<int>(static_cast<unsigned char>(c)) << ")";
    rep_.report(codes::invalid_character, msg.str(), "Remove the character or wrap the value in quotes", bad);
    return bad;
}

token Lexer::lex_newline(const cursor& start) {
    if (get() == '\r' && peek() == '\n') get();
    return make(token_kind::newline, start);
}

token Lexer::lex_comment(const cursor& start) {
    while (!eof() && !is_eol(peek())) get();
    return make(token_kind::comment, start);
}

token Lexer::lex_quoted(const cursor& start) {
    char quote = get();
    std::string value;
    bool closed = false;
    while (!eof()) {
        char c = peek();
        if (is_eol(c)) break;
        if (c == quote) { get(); closed = true; break; }
        if (c != '\\') { value += get(); continue; }

        cursor esc = cur_;
        get();
        if (eof() || is_eol(peek())) { value += '\\'; break; }
        char e = get();
        switch (e) {
            case 'n': value += '\n'; break;
            case 'r': value += '\r'; break;
            case 't': value += '\t'; break;
            case '\\': value += '\\'; break;
            case '"': value += '"'; break;
            case '\'': value += '\''; break;
            default: {
                value += '\\';
                value += e;
                std::string msg = "Invalid escape sequence '\\";
                msg += e;
                msg += "' in string";
                rep_.emit_error(rep_.make_error(codes::invalid_escape, msg, hints::invalid_escape(e), esc.p, 2, esc.line, esc.col));
                break;
            }
        }
    }
    token t = make(token_kind::string, start);
    t.value = std::move(value);
    if (!closed) {
        std::ostringstream msg;
        msg << "Unterminated string starting at line " << start.line << ", column " << start.col;
        rep_.report(codes::unterminated_string, msg.str(), hints::unterminated_string(quote), t);
    }
    check_length(t);
    return t;
}

token Lexer::lex_number_or_word(const cursor& start) {
    std::size_t n = match_number(src_.substr(cur_.p));
    for (std::size_t i = 0; i < n; ++i) get();
    // 2024-01-15, 1.2.3, 3rd: the literal runs on into a word
    if (is_word_char(peek()) || peek() == '\'') return lex_word(start);
    token t = make(token_kind::number, start);
    if (has_leading_zero(t.text)) t.kind = token_kind::string;
    return t;
}

token Lexer::lex_word(const cursor& start) {
    while (true) {
        char c = peek();
        if (c == '\'') { get(); continue; }
        if (!is_word_char(c)) break;
        get();
    }
    token t = classify_word(make(token_kind::string, start));
    check_length(t);
    return t;
}

token Lexer::classify_word(token t) const {
    if (t.text == "true") { t.kind = token_kind::true_literal; return t; }
    if (t.text == "false") { t.kind = token_kind::false_literal; return t; }
    if (t.text == "null") { t.kind = token_kind::null_literal; return t; }
    std::size_t q = cur_.p;
    while (q < src_.size() && is_space(src_[q])) ++q;
    if (q < src_.size() && (src_[q] == ':' || src_[q] == '[' || src_[q] == '{')) t.kind = token_kind::identifier;
    return t;
}

void Lexer::check_length(const token& t) {
    std::size_t len = t.value.size();
    if (len <= opts_.max_string_length) return;
    const char* what = t.text.empty() || (t.text.front() != '"' && t.text.front() != '\'')
                           ? (t.kind == token_kind::identifier ? "Identifier length" : "Unquoted string length")
                           : "String length";
    std::ostringstream msg;
    msg << what << " " << len << " exceeds maximum allowed length of " << opts_.max_string_length;
    rep_.report(codes::string_length_limit, msg.str(), hints::limit("max_string_length"), t);
}

} // namespace toon
