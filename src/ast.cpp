#include "toon/ast.hpp"

#include <sstream>

namespace toon
{

    const char *kind_name(node_kind k)
    {
        switch (k)
        {
        case node_kind::document:
            return "Document";
        case node_kind::property:
            return "Property";
        case node_kind::object:
            return "Object";
        case node_kind::array:
            return "Array";
        case node_kind::table_array:
            return "TableArray";
        case node_kind::string:
            return "String";
        case node_kind::number:
            return "Number";
        case node_kind::boolean:
            return "Boolean";
        case node_kind::null:
            return "Null";
        }
        return "Unknown";
    }

    const std::vector<node_ptr> &properties_of(const node &container)
    {
        static const std::vector<node_ptr> none;
        if (auto d = as_document(container))
            return d->properties;
        if (auto o = as_object(container))
            return o->properties;
        return none;
    }

    std::optional<node_ptr> find_property(const node &container, std::string_view key)
    {
        const auto &props = properties_of(container);
        for (auto it = props.rbegin(); it != props.rend(); ++it)
        {
            const property *p = as_property(**it);
            if (p && p->key == key)
                return *it;
        }
        return std::nullopt;
    }

    std::optional<node_ptr> find_path(const node &root, std::string_view path)
    {
        if (path.empty())
            return std::nullopt;
        const node *cur = &root;
        std::optional<node_ptr> found;
        while (true)
        {
            std::size_t dot = path.find('.');
            std::string_view part = path.substr(0, dot);
            found = find_property(*cur, part);
            if (!found)
                return std::nullopt;
            if (dot == std::string_view::npos)
                return found;
            const property *p = as_property(**found);
            if (!p || !p->value)
                return std::nullopt;
            cur = p->value.get();
            path.remove_prefix(dot + 1);
        }
    }

    namespace
    {
        void collect(const node &n, std::vector<node_ptr> &out);

        void collect_list(const std::vector<node_ptr> &nodes, std::vector<node_ptr> &out)
        {
            for (const auto &c : nodes)
            {
                if (!c)
                    continue;
                if (as_property(*c))
                    out.push_back(c);
                collect(*c, out);
            }
        }

        void collect(const node &n, std::vector<node_ptr> &out)
        {
            struct V
            {
                std::vector<node_ptr> &out;
                void operator()(const document &d) const { collect_list(d.properties, out); }
                void operator()(const property &p) const
                {
                    if (p.value)
                        collect(*p.value, out);
                }
                void operator()(const object &o) const { collect_list(o.properties, out); }
                void operator()(const array &a) const { collect_list(a.elements, out); }
                void operator()(const table_array &t) const
                {
                    for (const auto &row : t.rows)
                        collect_list(row, out);
                }
                void operator()(const string_value &) const {}
                void operator()(const number_value &) const {}
                void operator()(const bool_value &) const {}
                void operator()(const null_value &) const {}
            };
            std::visit(V{out}, n.data);
        }

        void write_debug(const node &n, int level, std::ostringstream &os)
        {
            std::string pad(static_cast<std::size_t>(level) * 2, ' ');
            struct V
            {
                int level;
                const std::string &pad;
                std::ostringstream &os;
                void children(const std::vector<node_ptr> &nodes, int at) const
                {
                    for (const auto &c : nodes)
                        if (c)
                            write_debug(*c, at, os);
                }
                void operator()(const document &d) const
                {
                    os << pad << "Document:\n";
                    children(d.properties, level + 1);
                }
                void operator()(const property &p) const
                {
                    os << pad << "Property: " << p.key << '\n';
                    if (p.value)
                        write_debug(*p.value, level + 1, os);
                }
                void operator()(const object &o) const
                {
                    os << pad << "Object:\n";
                    children(o.properties, level + 1);
                }
                void operator()(const array &a) const
                {
                    os << pad << "Array[" << a.declared_size << "]:\n";
                    children(a.elements, level + 1);
                }
                void operator()(const table_array &t) const
                {
                    os << pad << "TableArray[" << t.declared_size << "] {";
                    for (std::size_t i = 0; i < t.schema.size(); ++i)
                        os << (i ? "," : "") << t.schema[i];
                    os << "}:\n";
                    for (const auto &row : t.rows)
                    {
                        os << pad << "  Row:\n";
                        children(row, level + 2);
                    }
                }
                void operator()(const string_value &s) const { os << pad << "String: \"" << s.value << "\"\n"; }
                void operator()(const number_value &n) const { os << pad << "Number: " << n.raw << '\n'; }
                void operator()(const bool_value &b) const { os << pad << "Boolean: " << (b.value ? "true" : "false") << '\n'; }
                void operator()(const null_value &) const { os << pad << "Null\n"; }
            };
            std::visit(V{level, pad, os}, n.data);
        }
    } // namespace

    std::vector<node_ptr> all_properties(const node &root)
    {
        std::vector<node_ptr> out;
        collect(root, out);
        return out;
    }

    std::string to_debug_string(const node &n)
    {
        std::ostringstream os;
        write_debug(n, 0, os);
        return os.str();
    }

} // namespace toon
