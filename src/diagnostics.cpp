#include "toon/diagnostics.hpp"

#include <sstream>

namespace toon {

const char* error_category(std::string_view code) {
    if (code.size() < 5 || code.substr(0, 4) != "TOON") return "unknown";
    switch (code[4]) {
        case '1': return "lexer";
        case '2': return "parser";
        case '3': return "validation";
        case '4': return "delimiter";
        case '5': return "indentation";
        case '9': return "internal";
        default: return "unknown";
    }
}

std::string to_string(const ToonError& e) {
    std::ostringstream os;
    if (!e.code.empty()) os << '[' << e.code << "] ";
    os << e.message << " (line " << e.line << ", column " << e.column << ", position " << e.position << ", length "
       << e.length << ')';
    return os.str();
}

namespace hints {

namespace {
const char* plural(std::size_t n) { return n == 1 ? "" : "s"; }

std::string count_mismatch(std::size_t declared, std::size_t actual, const char* noun, const char* empty_advice) {
    std::ostringstream os;
    if (actual == 0) {
        os << "No " << noun << "s found. " << empty_advice;
    } else if (actual < declared) {
        std::size_t missing = declared - actual;
        os << "Missing " << missing << ' ' << noun << plural(missing) << ". Check for a truncated list or a missing delimiter.";
    } else {
        std::size_t extra = actual - declared;
        os << "Found " << extra << " extra " << noun << plural(extra) << ". Change the declared size [" << declared
           << "] to [" << actual << "] or remove the extra " << noun << plural(extra) << '.';
    }
    return os.str();
}
} // namespace

std::string array_size_mismatch(std::size_t declared, std::size_t actual) {
    return count_mismatch(declared, actual, "element", "Check that the elements follow the header and are indented under it.");
}

std::string table_size_mismatch(std::size_t declared, std::size_t actual) {
    return count_mismatch(declared, actual, "row", "Indent the rows under the table header.");
}

std::string row_field_mismatch(std::size_t expected, std::size_t actual) {
    std::ostringstream os;
    if (actual < expected)
        os << "Row is missing " << expected - actual << " field" << plural(expected - actual)
           << ". Every row needs one value per field in the header.";
    else
        os << "Row has " << actual - expected << " field" << plural(actual - expected)
           << " too many. Quote values that contain the delimiter.";
    return os.str();
}

std::string missing_colon(std::string_view key) {
    if (!key.empty() && key.back() == ';')
        return "Found ';' after the key. Separate key and value with ':'.";
    if (key.find('=') != std::string_view::npos)
        return "Found '=' in the key. Separate key and value with ':'.";
    if (key.empty()) return "Add ':' after the header.";
    std::string out = "Add ':' after the key, as in ";
    out.append(key.data(), key.size());
    out += ": value";
    return out;
}

std::string unterminated_string(char quote) {
    std::string out = "Add a closing ";
    out += quote;
    out += " before the end of the line. Strings cannot span lines; write \\n for a line break.";
    return out;
}

std::string invalid_escape(char escaped) {
    std::string out = "Supported escapes are \\n \\r \\t \\\\ \\\" and \\'. Write \\\\";
    out += escaped;
    out += " for a literal backslash.";
    return out;
}

std::string unexpected_token(const token& t) {
    switch (t.kind) {
        case token_kind::newline:
        case token_kind::end_of_input: return "The line ended early. Complete the construct on this line.";
        case token_kind::colon: return "A key is missing before ':'.";
        case token_kind::left_bracket: return "An array header needs a key, as in items[3]: a,b,c";
        case token_kind::right_bracket:
        case token_kind::right_brace: return "Closing bracket without a matching opening one.";
        case token_kind::comma:
        case token_kind::pipe: return "Delimiters separate array values; a key is expected here.";
        case token_kind::invalid: return "Remove the invalid character or quote the value.";
        default: return "Check the syntax of this line.";
    }
}

std::string over_indented(std::size_t expected, std::size_t actual) {
    std::ostringstream os;
    if (actual > expected)
        os << "Over-indented by " << actual - expected << ". Indent children consistently under their parent.";
    else if (actual < expected)
        os << "Under-indented by " << expected - actual << ". Check which parent this line belongs to.";
    else
        os << "Indentation must match the enclosing block.";
    return os.str();
}

std::string marker_misplaced() {
    return "Put the delimiter marker directly before ']', as in items[3|] or items[3\\t].";
}

std::string mixed_delimiters(delimiter active, delimiter found) {
    std::string out = "This scope uses ";
    out += to_string(active);
    out += "; replace the ";
    out += to_string(found);
    out += " separators or declare the marker in the header.";
    return out;
}

std::string limit(std::string_view option) {
    std::string out = "Raise ParserOptions::";
    out.append(option.data(), option.size());
    out += " if this input is trusted.";
    return out;
}

} // namespace hints

} // namespace toon
