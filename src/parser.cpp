#include "toon/parser.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace toon {

namespace {

bool has_tab(const token& t) { return t.text.find('\t') != std::string::npos; }

bool is_list_marker(const token& t) {
    return (t.kind == token_kind::string || t.kind == token_kind::identifier) && t.text == "-";
}

std::string describe(const token& t) {
    switch (t.kind) {
        case token_kind::newline: return "end of line";
        case token_kind::end_of_input: return "end of input";
        default: return "'" + t.text + "'";
    }
}

source_span extend(source_span s, const source_span& to) {
    if (to.end_offset > s.end_offset) {
        s.end_line = to.end_line;
        s.end_column = to.end_column;
        s.end_offset = to.end_offset;
    }
    return s;
}

source_span span_of_nodes(const source_span& start, const std::vector<node_ptr>& nodes) {
    source_span s = start;
    for (const auto& n : nodes) s = extend(s, n->span);
    return s;
}

} // namespace

Parser::Parser(std::string_view source, const token_list& tokens, const ParserOptions& options, ErrorReporter& reporter)
    : src_(source), tokens_(tokens), opts_(options), rep_(reporter) {
    build_lines();
}

void Parser::build_lines() {
    std::size_t i = 0;
    while (true) {
        line_info ln;
        std::size_t lead = i;
        bool mixed = false;
        if (tok(i).kind == token_kind::whitespace) {
            const std::string& ws = tok(i).text;
            ln.indent = ws.size();
            mixed = ws.find(' ') != std::string::npos && has_tab(tok(i));
            ++i;
        }
        ln.begin = i;
        while (tok(i).kind != token_kind::newline && tok(i).kind != token_kind::end_of_input) {
            if (tok(i).kind != token_kind::whitespace && tok(i).kind != token_kind::comment) ln.blank = false;
            ++i;
        }
        ln.end = i;
        if (mixed && !ln.blank)
            rep_.report(codes::inconsistent_indentation, "Indentation mixes tabs and spaces",
                        "Indent with spaces only, or tabs only, throughout the document", tok(lead));
        lines_.push_back(ln);
        if (tok(i).kind == token_kind::end_of_input) break;
        ++i;
    }
}

// ---- line navigation ----

bool Parser::skip_blank(parse_state& st) const {
    while (st.line < lines_.size() && lines_[st.line].blank) ++st.line;
    return st.line < lines_.size();
}

void Parser::next_line(parse_state& st) const {
    ++st.line;
    if (st.line < lines_.size()) st.pos = lines_[st.line].begin;
}

void Parser::skip_block(parse_state& st, std::size_t indent) const {
    while (st.line < lines_.size() && (lines_[st.line].blank || lines_[st.line].indent > indent)) ++st.line;
    if (st.line < lines_.size()) st.pos = lines_[st.line].begin;
}

void Parser::recover(parse_state& st, std::size_t indent) const {
    next_line(st);
    skip_block(st, indent);
}

void Parser::guard_progress(parse_state& st, std::size_t before, const char* where) {
    if (st.line > before) return;
    std::string msg = "Parser made no progress in ";
    msg += where;
    msg += "; skipping line";
    rep_.report(codes::no_progress, msg, "", tok(lines_[before].begin));
    st.line = before;
    next_line(st);
}

// ---- token helpers ----

std::size_t Parser::skip_ws(std::size_t i, std::size_t end) const {
    while (i < end && tok(i).kind == token_kind::whitespace) ++i;
    return i;
}

std::size_t Parser::region_end(std::size_t i, std::size_t end) const {
    std::size_t j = i;
    while (j < end && tok(j).kind != token_kind::comment) ++j;
    while (j > i && tok(j - 1).kind == token_kind::whitespace) --j;
    return j;
}

bool Parser::at_line_end(std::size_t i, std::size_t end) const {
    return i >= end || tok(i).kind == token_kind::comment;
}

bool Parser::is_delimiter(std::size_t i, delimiter d) const {
    const token& t = tok(i);
    switch (d) {
        case delimiter::comma: return t.kind == token_kind::comma;
        case delimiter::pipe: return t.kind == token_kind::pipe;
        case delimiter::tab: return t.kind == token_kind::whitespace && has_tab(t);
    }
    return false;
}

std::optional<delimiter> Parser::delimiter_at(std::size_t i) const {
    const token& t = tok(i);
    if (t.kind == token_kind::comma) return delimiter::comma;
    if (t.kind == token_kind::pipe) return delimiter::pipe;
    if (t.kind == token_kind::whitespace && has_tab(t)) return delimiter::tab;
    return std::nullopt;
}

bool Parser::looks_like_key(std::size_t i, std::size_t end) const {
    if (i >= end || !is_value_kind(tok(i).kind)) return false;
    std::size_t j = skip_ws(i + 1, end);
    if (j >= end) return false;
    token_kind k = tok(j).kind;
    return k == token_kind::colon || k == token_kind::left_bracket || k == token_kind::left_brace;
}

source_span Parser::span_of(const token& first, const token& last) const {
    source_span s;
    s.start_line = first.line;
    s.start_column = first.column;
    s.start_offset = first.offset;
    s.end_line = last.line;
    s.end_column = last.column + static_cast<int>(last.length);
    s.end_offset = last.offset + last.length;
    return s;
}

source_span Parser::point_span(const token& at) const {
    source_span s;
    s.start_line = s.end_line = at.line;
    s.start_column = s.end_column = at.column;
    s.start_offset = s.end_offset = at.offset;
    return s;
}

// ---- document and blocks ----

node_ptr Parser::parse_document() {
    parse_state st;
    std::vector<node_ptr> props;
    parse_block(st, 0, props);
    if (props.empty() && rep_.count() == 0)
        rep_.report(codes::empty_document, "Document is empty: no properties found",
                    "Add at least one 'key: value' line", tok(0));
    source_span span = props.empty() ? point_span(tok(0)) : span_of_nodes(props.front()->span, props);
    return make_node(document{std::move(props)}, span);
}

void Parser::parse_block(parse_state& st, std::size_t block_indent, std::vector<node_ptr>& props) {
    while (skip_blank(st)) {
        const line_info& ln = lines_[st.line];
        if (ln.indent < block_indent) break;
        std::size_t before = st.line;
        if (ln.indent > block_indent) report_indentation(ln, block_indent);
        st.pos = ln.begin;
        if (node_ptr p = parse_property(st, ln.indent)) props.push_back(std::move(p));
        guard_progress(st, before, "property block");
    }
}

void Parser::report_indentation(const line_info& ln, std::size_t expected) {
    std::ostringstream msg;
    msg << "Unexpected indentation: expected " << expected << " but found " << ln.indent;
    rep_.report(codes::unexpected_indentation, msg.str(), hints::over_indented(expected, ln.indent), tok(ln.begin));
}

void Parser::report_unexpected_end(const char* construct, const token& at) {
    std::string msg = "Unexpected end of input in ";
    msg += construct;
    rep_.report(codes::unexpected_end, msg, "The document ends before the construct is closed. Complete it or remove it.", at);
}

bool Parser::enter(parse_state& st, const token& at) {
    if (st.depth + 1 > opts_.max_nesting_depth) {
        std::ostringstream msg;
        msg << "Maximum nesting depth of " << opts_.max_nesting_depth << " exceeded";
        rep_.report(codes::depth_limit, msg.str(), hints::limit("max_nesting_depth"), at);
        return false;
    }
    ++st.depth;
    return true;
}

// key ( '[' size marker? ']' ( '{' fields '}' )? )? ':' value
node_ptr Parser::parse_property(parse_state& st, std::size_t indent) {
    const std::size_t end = lines_[st.line].end;
    std::size_t i = st.pos;
    const token& key = tok(i);
    if (!is_value_kind(key.kind)) {
        rep_.report(codes::expected_property_key, "Expected property key, found " + describe(key),
                    hints::unexpected_token(key), key);
        recover(st, indent);
        return nullptr;
    }

    array_header h;
    bool is_array = false;
    i = skip_ws(i + 1, end);
    if (i < end && tok(i).kind == token_kind::left_bracket) {
        if (!parse_header(st, i, end, h)) {
            recover(st, indent);
            return nullptr;
        }
        is_array = true;
        i = skip_ws(h.next, end);
        if (i < end && tok(i).kind == token_kind::left_brace) {
            if (!parse_schema(i, end, h)) {
                recover(st, indent);
                return nullptr;
            }
            i = skip_ws(h.next, end);
        }
    } else if (i < end && tok(i).kind == token_kind::left_brace) {
        rep_.report(codes::unexpected_token, "Field list requires an array size, as in " + key.value + "[N]{...}",
                    hints::unexpected_token(tok(i)), tok(i));
        recover(st, indent);
        return nullptr;
    }

    if (i >= end || tok(i).kind != token_kind::colon) {
        rep_.report(codes::expected_colon, "Expected ':' after property key '" + key.value + "'",
                    hints::missing_colon(key.value), tok(i));
        recover(st, indent);
        return nullptr;
    }
    const token& colon = tok(i);
    i = skip_ws(i + 1, end);
    st.pos = i;

    node_ptr value;
    if (is_array) {
        value = parse_array_body(st, h, indent, colon);
    } else if (at_line_end(i, end)) {
        next_line(st);
        value = parse_object_block(st, indent, colon);
    } else {
        value = make_value(i, region_end(i, end));
        next_line(st);
    }
    source_span span = extend(span_of(key, colon), value->span);
    return make_node(property{key.value, std::move(value), indent}, span);
}

// '[' size marker? ']'
bool Parser::parse_header(parse_state& st, std::size_t i, std::size_t end, array_header& h) {
    h.open = i;
    ++i;
    if (i < end && tok(i).kind == token_kind::whitespace && !has_tab(tok(i))) ++i;
    if (i >= end || tok(i).kind != token_kind::number) {
        const token& at = tok(i);
        if (at.kind == token_kind::end_of_input)
            report_unexpected_end("array header", at);
        else if (i < end && delimiter_at(i) && i + 1 < end && tok(i + 1).kind == token_kind::number)
            rep_.report(codes::marker_misplaced, "Delimiter marker must follow the array size", hints::marker_misplaced(), at);
        else
            rep_.report(codes::unexpected_token, "Expected array size after '[', found " + describe(at),
                        hints::unexpected_token(at), at);
        return false;
    }

    const token& size_tok = tok(i);
    const std::string& raw = size_tok.text;
    if (raw.find_first_not_of("0123456789") != std::string::npos) {
        rep_.report(codes::unexpected_token, "Array size must be a non-negative integer, found '" + raw + "'",
                    "Write the element count as a whole number, as in [3]", size_tok);
        return false;
    }
    unsigned long long declared = 0;
    auto res = std::from_chars(raw.data(), raw.data() + raw.size(), declared);
    if (res.ec == std::errc::result_out_of_range || declared > opts_.max_array_size) {
        std::ostringstream msg;
        msg << "Array size " << raw << " exceeds maximum allowed size of " << opts_.max_array_size;
        rep_.report(codes::array_size_limit, msg.str(), hints::limit("max_array_size"), size_tok);
        return false;
    }
    h.declared = static_cast<std::size_t>(declared);
    h.size_token = i;
    ++i;

    std::optional<delimiter> marker;
    if (i < end) {
        if (tok(i).kind == token_kind::pipe) { marker = delimiter::pipe; ++i; }
        else if (tok(i).kind == token_kind::comma) { marker = delimiter::comma; ++i; }
        else if (tok(i).kind == token_kind::whitespace) {
            if (has_tab(tok(i))) marker = delimiter::tab;
            ++i;
        }
    }
    if (i >= end || tok(i).kind != token_kind::right_bracket) {
        const token& at = tok(i);
        if (at.kind == token_kind::end_of_input)
            report_unexpected_end("array header", at);
        else if (i < end && delimiter_at(i))
            rep_.report(codes::marker_misplaced, "Delimiter marker must appear immediately before ']'",
                        hints::marker_misplaced(), at);
        else
            rep_.report(codes::expected_right_bracket, "Expected ']' to close array size, found " + describe(at),
                        hints::unexpected_token(at), at);
        while (i < end && tok(i).kind != token_kind::right_bracket) ++i;
        if (i >= end) return false;
    }
    h.delim = marker ? *marker : st.delimiters.back();
    h.next = i + 1;
    return true;
}

// '{' field (delim field)* delim? '}'
bool Parser::parse_schema(std::size_t i, std::size_t end, array_header& h) {
    const token& open = tok(i);
    auto skip_pad = [&](std::size_t j) {
        while (j < end && tok(j).kind == token_kind::whitespace && !is_delimiter(j, h.delim)) ++j;
        return j;
    };
    bool mixed_reported = false;
    ++i;
    while (true) {
        i = skip_pad(i);
        if (i >= end) {
            if (tok(i).kind == token_kind::end_of_input)
                report_unexpected_end("field list", tok(i));
            else
                rep_.report(codes::expected_right_brace, "Expected '}' to close the field list",
                            "Close the field list with '}' before ':'", tok(i));
            return false;
        }
        const token& field = tok(i);
        if (field.kind == token_kind::right_brace) { ++i; break; }
        if (!is_value_kind(field.kind)) {
            rep_.report(codes::expected_field_name, "Expected field name in table header, found " + describe(field),
                        hints::unexpected_token(field), field);
            while (i < end && tok(i).kind != token_kind::right_brace) ++i;
            if (i >= end) return false;
            ++i;
            break;
        }
        h.schema.push_back(field.value);
        i = skip_pad(i + 1);
        if (i >= end) continue;
        if (tok(i).kind == token_kind::right_brace) continue;
        if (i < end && is_delimiter(i, h.delim)) { ++i; continue; }
        if (auto other = delimiter_at(i)) {
            if (!mixed_reported) {
                std::string msg = "Field list mixes delimiters: expected ";
                msg += to_string(h.delim);
                msg += ", found ";
                msg += to_string(*other);
                rep_.report(codes::mixed_delimiters, msg, hints::mixed_delimiters(h.delim, *other), tok(i));
                mixed_reported = true;
            }
            ++i;
            continue;
        }
        rep_.report(codes::expected_delimiter, "Expected delimiter or '}' after field '" + field.value + "'",
                    std::string("Separate fields with '") + delimiter_char(h.delim) + "'", tok(i));
        while (i < end && tok(i).kind != token_kind::right_brace) ++i;
        if (i >= end) return false;
        ++i;
        break;
    }
    if (h.schema.empty())
        rep_.report(codes::expected_field_name, "Table header declares no fields", "List at least one field name inside '{}'", open);
    h.has_schema = true;
    h.next = i;
    return true;
}

// Opens the header's delimiter scope for the body and closes it afterwards.
node_ptr Parser::parse_array_body(parse_state& st, const array_header& h, std::size_t indent, const token& anchor) {
    const line_info& ln = lines_[st.line];
    bool inline_values = !at_line_end(st.pos, ln.end);
    if (h.has_schema && inline_values) {
        rep_.report(codes::unexpected_token, "Table rows must start on the line after the header",
                    "Move the rows onto indented lines below the header", tok(st.pos));
        recover(st, indent);
        return make_node(table_array{h.declared, h.schema, {}}, span_of(tok(h.open), anchor));
    }
    st.delimiters.push_back(h.delim);
    node_ptr out = h.has_schema    ? parse_table(st, h, indent)
                   : inline_values ? parse_inline_array(st, h, indent)
                                   : parse_expanded_array(st, h, indent);
    st.delimiters.pop_back();
    return out;
}

node_ptr Parser::parse_object_block(parse_state& st, std::size_t parent_indent, const token& anchor) {
    if (!skip_blank(st) || lines_[st.line].indent <= parent_indent) return make_node(object{}, point_span(anchor));
    if (!enter(st, tok(lines_[st.line].begin))) {
        skip_block(st, parent_indent);
        return make_node(null_value{}, point_span(anchor));
    }
    node_ptr out = parse_object_fields(st, parent_indent, anchor);
    leave(st);
    return out;
}

node_ptr Parser::parse_object_fields(parse_state& st, std::size_t parent_indent, const token& anchor) {
    std::vector<node_ptr> props;
    if (skip_blank(st) && lines_[st.line].indent > parent_indent) parse_block(st, lines_[st.line].indent, props);
    source_span span = props.empty() ? point_span(anchor) : span_of_nodes(props.front()->span, props);
    return make_node(object{std::move(props)}, span);
}

// ---- arrays ----

node_ptr Parser::parse_inline_array(parse_state& st, const array_header& h, std::size_t indent) {
    const line_info& header = lines_[st.line];
    std::size_t stop = region_end(st.pos, header.end);
    std::vector<cell> cells = split_cells(st.pos, stop, h.delim);

    if (h.declared > 1 && cells.size() == 1) {
        for (std::size_t j = st.pos; j < stop; ++j) {
            auto other = delimiter_at(j);
            if (other && *other != h.delim && *other != delimiter::tab) {
                std::string msg = "Array declares ";
                msg += to_string(h.delim);
                msg += " as its delimiter but values are separated by ";
                msg += to_string(*other);
                rep_.report(codes::mixed_delimiters, msg, hints::mixed_delimiters(h.delim, *other), tok(j));
                break;
            }
        }
    }

    next_line(st);
    while (skip_blank(st) && lines_[st.line].indent > indent) {
        const line_info& ln = lines_[st.line];
        if (!cells.empty() && cells.back().first == cells.back().second) cells.pop_back();
        std::vector<cell> more = split_cells(ln.begin, region_end(ln.begin, ln.end), h.delim);
        cells.insert(cells.end(), more.begin(), more.end());
        next_line(st);
    }

    std::vector<node_ptr> elements;
    elements.reserve(cells.size());
    for (const cell& c : cells) elements.push_back(make_value(c.first, c.second));

    const token& size_tok = tok(h.size_token);
    if (elements.size() > opts_.max_array_size) {
        std::ostringstream msg;
        msg << "Array size " << elements.size() << " exceeds maximum allowed size of " << opts_.max_array_size;
        rep_.report(codes::array_size_limit, msg.str(), hints::limit("max_array_size"), size_tok);
    }
    check_count(codes::array_size_mismatch, h.declared, elements.size(), size_tok, false);
    source_span span = span_of_nodes(span_of(tok(h.open), tok(h.next - 1)), elements);
    return make_node(array{h.declared, std::move(elements)}, span);
}

node_ptr Parser::parse_expanded_array(parse_state& st, const array_header& h, std::size_t indent) {
    std::vector<node_ptr> elements;
    next_line(st);
    if (skip_blank(st) && lines_[st.line].indent > indent) {
        const std::size_t item_indent = lines_[st.line].indent;
        if (!enter(st, tok(lines_[st.line].begin))) {
            skip_block(st, indent);
            return make_node(array{h.declared, {}}, span_of(tok(h.open), tok(h.next - 1)));
        }
        while (skip_blank(st) && lines_[st.line].indent > indent) {
            const line_info& ln = lines_[st.line];
            std::size_t before = st.line;
            if (ln.indent != item_indent) report_indentation(ln, item_indent);
            st.pos = ln.begin;
            const token& first = tok(ln.begin);
            if (!is_list_marker(first)) {
                rep_.report(codes::unexpected_token, "Expected list item '- ', found " + describe(first),
                            "Start each element of an expanded array with '- '", first);
                recover(st, ln.indent);
            } else if (node_ptr item = parse_list_item(st, ln.indent)) {
                elements.push_back(std::move(item));
            }
            guard_progress(st, before, "expanded array");
        }
        leave(st);
    }

    const token& size_tok = tok(h.size_token);
    if (elements.size() > opts_.max_array_size) {
        std::ostringstream msg;
        msg << "Array size " << elements.size() << " exceeds maximum allowed size of " << opts_.max_array_size;
        rep_.report(codes::array_size_limit, msg.str(), hints::limit("max_array_size"), size_tok);
    }
    check_count(codes::array_size_mismatch, h.declared, elements.size(), size_tok, false);
    source_span span = span_of_nodes(span_of(tok(h.open), tok(h.next - 1)), elements);
    return make_node(array{h.declared, std::move(elements)}, span);
}

// '-' ( nothing | header ':' body | key ':' value fields* | value )
node_ptr Parser::parse_list_item(parse_state& st, std::size_t item_indent) {
    const std::size_t end = lines_[st.line].end;
    const token& dash = tok(st.pos);
    std::size_t i = skip_ws(st.pos + 1, end);

    if (at_line_end(i, end)) {
        next_line(st);
        if (!skip_blank(st) || lines_[st.line].indent <= item_indent) return make_node(object{}, point_span(dash));
        if (!enter(st, dash)) {
            skip_block(st, item_indent);
            return make_node(null_value{}, point_span(dash));
        }
        node_ptr out = parse_object_fields(st, item_indent, dash);
        leave(st);
        return out;
    }

    if (tok(i).kind == token_kind::left_bracket) {
        array_header h;
        if (!parse_header(st, i, end, h)) {
            recover(st, item_indent);
            return nullptr;
        }
        i = skip_ws(h.next, end);
        if (i < end && tok(i).kind == token_kind::left_brace) {
            if (!parse_schema(i, end, h)) {
                recover(st, item_indent);
                return nullptr;
            }
            i = skip_ws(h.next, end);
        }
        if (i >= end || tok(i).kind != token_kind::colon) {
            rep_.report(codes::expected_colon, "Expected ':' after array header, found " + describe(tok(i)),
                        hints::missing_colon(""), tok(i));
            recover(st, item_indent);
            return nullptr;
        }
        const token& colon = tok(i);
        st.pos = skip_ws(i + 1, end);
        return parse_array_body(st, h, item_indent, colon);
    }

    if (looks_like_key(i, end)) {
        // First field shares the '-' line; its own block must sit deeper than the key.
        if (!enter(st, dash)) {
            recover(st, item_indent);
            return make_node(null_value{}, point_span(dash));
        }
        std::vector<node_ptr> props;
        st.pos = i;
        std::size_t field_indent = static_cast<std::size_t>(tok(i).column - 1);
        if (node_ptr first = parse_property(st, field_indent)) props.push_back(std::move(first));
        if (skip_blank(st) && lines_[st.line].indent > item_indent) parse_block(st, lines_[st.line].indent, props);
        leave(st);
        source_span span = span_of_nodes(span_of(dash, dash), props);
        return make_node(object{std::move(props)}, span);
    }

    node_ptr value = make_value(i, region_end(i, end));
    next_line(st);
    return value;
}

node_ptr Parser::parse_table(parse_state& st, const array_header& h, std::size_t indent) {
    std::vector<std::vector<node_ptr>> rows;
    source_span span = span_of(tok(h.open), tok(h.next - 1));
    next_line(st);
    if (skip_blank(st) && lines_[st.line].indent > indent) {
        const std::size_t row_indent = lines_[st.line].indent;
        if (!enter(st, tok(lines_[st.line].begin))) {
            skip_block(st, indent);
            return make_node(table_array{h.declared, h.schema, {}}, span);
        }
        while (skip_blank(st) && lines_[st.line].indent > indent) {
            const line_info& ln = lines_[st.line];
            std::size_t before = st.line;
            if (ln.indent != row_indent) report_indentation(ln, row_indent);
            std::vector<node_ptr> row;
            for (const cell& c : split_cells(ln.begin, region_end(ln.begin, ln.end), h.delim))
                row.push_back(make_value(c.first, c.second));
            if (row.size() != h.schema.size()) {
                std::ostringstream msg;
                msg << "Row has " << row.size() << " field(s) but the table declares " << h.schema.size();
                rep_.report(codes::row_field_mismatch, msg.str(), hints::row_field_mismatch(h.schema.size(), row.size()),
                            tok(ln.begin));
            }
            span = span_of_nodes(span, row);
            rows.push_back(std::move(row));
            next_line(st);
            guard_progress(st, before, "table rows");
        }
        leave(st);
    }

    const token& size_tok = tok(h.size_token);
    if (rows.size() > opts_.max_array_size) {
        std::ostringstream msg;
        msg << "Array size " << rows.size() << " exceeds maximum allowed size of " << opts_.max_array_size;
        rep_.report(codes::array_size_limit, msg.str(), hints::limit("max_array_size"), size_tok);
    }
    check_count(codes::table_size_mismatch, h.declared, rows.size(), size_tok, true);
    return make_node(table_array{h.declared, h.schema, std::move(rows)}, span);
}

void Parser::check_count(const char* code, std::size_t declared, std::size_t actual, const token& at, bool rows) {
    if (declared == actual) return;
    std::ostringstream msg;
    msg << (rows ? "Table size mismatch: declared " : "Array size mismatch: declared ") << declared
        << (rows ? " rows" : "") << ", found " << actual;
    if (actual < declared) msg << " (missing " << declared - actual << ")";
    else msg << " (" << actual - declared << " extra)";
    std::string hint = rows ? hints::table_size_mismatch(declared, actual) : hints::array_size_mismatch(declared, actual);
    rep_.report(code, msg.str(), hint, at);
}

// ---- values ----

std::vector<Parser::cell> Parser::split_cells(std::size_t begin, std::size_t end, delimiter d) const {
    std::vector<cell> out;
    if (begin >= end) return out;
    auto trim = [&](std::size_t a, std::size_t b) {
        while (a < b && tok(a).kind == token_kind::whitespace) ++a;
        while (b > a && tok(b - 1).kind == token_kind::whitespace) --b;
        return cell{a, b};
    };
    std::size_t start = begin;
    for (std::size_t i = begin; i < end; ++i) {
        if (!is_delimiter(i, d)) continue;
        out.push_back(trim(start, i));
        start = i + 1;
    }
    out.push_back(trim(start, end));
    return out;
}

node_ptr Parser::make_value(std::size_t begin, std::size_t end) const {
    if (begin >= end) return make_node(string_value{}, point_span(tok(begin)));
    if (end - begin == 1 && is_value_kind(tok(begin).kind)) return make_literal(tok(begin));
    // Several tokens: keep the source text between the first and last verbatim.
    const token& first = tok(begin);
    const token& last = tok(end - 1);
    std::string raw(src_.substr(first.offset, last.offset + last.length - first.offset));
    return make_node(string_value{raw, raw}, span_of(first, last));
}

node_ptr Parser::make_literal(const token& t) const {
    source_span span = span_of(t, t);
    switch (t.kind) {
        case token_kind::number: {
            bool integral = t.text.find_first_of(".eE") == std::string::npos;
            return make_node(number_value{std::strtod(t.text.c_str(), nullptr), integral, t.text}, span);
        }
        case token_kind::true_literal: return make_node(bool_value{true}, span);
        case token_kind::false_literal: return make_node(bool_value{false}, span);
        case token_kind::null_literal: return make_node(null_value{}, span);
        default: return make_node(string_value{t.value, t.text}, span);
    }
}

} // namespace toon
