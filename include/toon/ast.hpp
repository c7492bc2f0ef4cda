// Position-annotated TOON syntax tree
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toon
{

    // Start is the first character of the construct; end is one past its last character.
    struct source_span
    {
        int start_line = 1, start_column = 1;
        std::size_t start_offset = 0;
        int end_line = 1, end_column = 1;
        std::size_t end_offset = 0;
    };

    struct node;
    using node_ptr = std::shared_ptr<const node>;

    struct document
    {
        std::vector<node_ptr> properties;
    };
    struct property
    {
        std::string key;
        node_ptr value;
        std::size_t indent_level = 0;
    };
    struct object
    {
        std::vector<node_ptr> properties;
    };
    struct array
    {
        std::size_t declared_size = 0;
        std::vector<node_ptr> elements;
    };
    struct table_array
    {
        std::size_t declared_size = 0;
        std::vector<std::string> schema;
        std::vector<std::vector<node_ptr>> rows;
    };
    struct string_value
    {
        std::string value;
        std::string raw;
    };
    struct number_value
    {
        double value = 0.0;
        bool is_integer = false;
        std::string raw;
    };
    struct bool_value
    {
        bool value = false;
    };
    struct null_value
    {
    };

    // Alternative order matches node_kind.
    using node_data = std::variant<document, property, object, array, table_array, string_value, number_value, bool_value,
                                   null_value>;

    struct node
    {
        node_data data;
        source_span span;
    };

    enum class node_kind
    {
        document,
        property,
        object,
        array,
        table_array,
        string,
        number,
        boolean,
        null
    };

    inline node_ptr make_node(node_data d, source_span span = {})
    {
        return std::make_shared<const node>(node{std::move(d), span});
    }

    inline node_kind kind_of(const node &n) { return static_cast<node_kind>(n.data.index()); }
    const char *kind_name(node_kind k);

    inline const document *as_document(const node &n) { return std::get_if<document>(&n.data); }
    inline const property *as_property(const node &n) { return std::get_if<property>(&n.data); }
    inline const object *as_object(const node &n) { return std::get_if<object>(&n.data); }
    inline const array *as_array(const node &n) { return std::get_if<array>(&n.data); }
    inline const table_array *as_table(const node &n) { return std::get_if<table_array>(&n.data); }
    inline const string_value *as_string(const node &n) { return std::get_if<string_value>(&n.data); }
    inline const number_value *as_number(const node &n) { return std::get_if<number_value>(&n.data); }
    inline const bool_value *as_bool(const node &n) { return std::get_if<bool_value>(&n.data); }
    inline bool is_null(const node &n) { return std::holds_alternative<null_value>(n.data); }

    // Property nodes of a document or object; empty for anything else.
    const std::vector<node_ptr> &properties_of(const node &container);

    // Last property named `key` directly inside a document or object.
    std::optional<node_ptr> find_property(const node &container, std::string_view key);

    // Dotted lookup through nested objects: find_path(doc, "server.tls.port").
    std::optional<node_ptr> find_path(const node &root, std::string_view path);

    // Every property reachable from `root` in document order, including those
    // inside array elements and table cells.
    std::vector<node_ptr> all_properties(const node &root);

    // Indented outline of the tree, two spaces per level.
    std::string to_debug_string(const node &n);

} // namespace toon
