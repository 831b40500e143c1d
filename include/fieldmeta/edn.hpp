// Node-based EDN representation used for declarations, with source positions
#pragma once
#include "fieldmeta/errors.hpp"
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <cctype>
#include <map>
#include <cstdint>
#include <cstdlib>
#include <functional>

namespace fieldmeta
{

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct map;
    struct node; // forward declarations

    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, map>;

    struct node
    {
        node_data data;
        std::map<std::string, node_ptr> metadata;
    };

    // Parse exactly one form; trailing content is an error.
    node_ptr parse_one(std::string_view src);

    // Parse every top-level form in src, in order.
    std::vector<node_ptr> parse_all(std::string_view src);

    // Structural deep equality of two nodes. If ignore_metadata is true, metadata maps are ignored.
    bool equal(const node_ptr& a, const node_ptr& b, bool ignore_metadata = true);

    // Deep copy; metadata maps are copied shallowly.
    node_ptr clone(const node_ptr& n);

    namespace detail
    {
        struct reader
        {
            std::string_view d;
            size_t p = 0;
            int line = 1, col = 1;
            int last_line = 1, last_col = 1;
            explicit reader(std::string_view s) : d(s) {}
            bool eof() const { return p >= d.size(); }
            char peek(size_t ahead = 0) const { return p + ahead >= d.size() ? '\0' : d[p + ahead]; }
            char get()
            {
                if (eof())
                    return '\0';
                last_line = line;
                last_col = col;
                char c = d[p++];
                if (c == '\n')
                {
                    ++line;
                    col = 1;
                }
                else
                {
                    ++col;
                }
                return c;
            }
            void skip_ws()
            {
                while (!eof())
                {
                    char c = peek();
                    if (c == ';')
                    {
                        while (!eof() && get() != '\n')
                            continue;
                        continue;
                    }
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == ',')
                    {
                        get();
                        continue;
                    }
                    break;
                }
            }
            [[noreturn]] void fail(const std::string& msg) const { throw parse_error(msg, line, col); }
        };
        inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
        // '|' is a symbol so annotation chains read as ordinary (| lhs value) lists.
        inline bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&' || c == '|'; }
        inline bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '.' || c == '#' || c == ':'; }

        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
        inline node_ptr make_int(int64_t v) { return make_node(node_data{v}); }
        inline void attach_pos(node &n, int sl, int sc, int el, int ec)
        {
            n.metadata["line"] = make_int(sl);
            n.metadata["col"] = make_int(sc);
            n.metadata["end-line"] = make_int(el);
            n.metadata["end-col"] = make_int(ec);
        }

        inline node_ptr parse_value(reader &);

        inline node_ptr parse_collection(reader &r, char end, int sl, int sc)
        {
            std::vector<node_ptr> elems;
            r.skip_ws();
            while (!r.eof() && r.peek() != end)
            {
                elems.push_back(parse_value(r));
                r.skip_ws();
            }
            if (r.get() != end)
                throw parse_error("unterminated collection", sl, sc);
            node_ptr out;
            if (end == ')')
                out = make_node(list{std::move(elems)});
            else if (end == ']')
                out = make_node(vector_t{std::move(elems)});
            else
            {
                if (elems.size() % 2)
                    throw parse_error("map requires even number of forms", sl, sc);
                map m;
                for (size_t i = 0; i < elems.size(); i += 2)
                    m.entries.emplace_back(elems[i], elems[i + 1]);
                out = make_node(std::move(m));
            }
            attach_pos(*out, sl, sc, r.last_line, r.last_col);
            return out;
        }

        inline node_ptr parse_string(reader &r)
        {
            int sl = r.line, sc = r.col;
            r.get(); // opening quote
            std::string out;
            bool closed = false;
            while (!r.eof())
            {
                char c = r.get();
                if (c == '"')
                {
                    closed = true;
                    break;
                }
                if (c == '\\')
                {
                    if (r.eof())
                        r.fail("bad escape");
                    char e = r.get();
                    switch (e)
                    {
                    case 'n':
                        out += '\n';
                        break;
                    case 'r':
                        out += '\r';
                        break;
                    case 't':
                        out += '\t';
                        break;
                    default:
                        out += e;
                        break;
                    }
                }
                else
                    out += c;
            }
            if (!closed)
                throw parse_error("unterminated string", sl, sc);
            auto n = make_node(out);
            attach_pos(*n, sl, sc, r.last_line, r.last_col);
            return n;
        }

        inline node_ptr parse_number(reader &r)
        {
            int sl = r.line, sc = r.col;
            std::string num;
            if (r.peek() == '+' || r.peek() == '-')
                num += r.get();
            bool is_float = false;
            while (is_digit(r.peek()))
                num += r.get();
            if (r.peek() == '.')
            {
                is_float = true;
                num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            if (r.peek() == 'e' || r.peek() == 'E')
            {
                is_float = true;
                num += r.get();
                if (r.peek() == '+' || r.peek() == '-')
                    num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            node_ptr n;
            try
            {
                if (is_float)
                    n = make_node(std::stod(num));
                else
                    n = make_node((int64_t)std::stoll(num));
            }
            catch (const std::logic_error &)
            {
                throw parse_error("invalid number '" + num + "'", sl, sc);
            }
            attach_pos(*n, sl, sc, r.last_line, r.last_col);
            return n;
        }

        inline node_ptr parse_symbol_or_keyword(reader &r)
        {
            int sl = r.line, sc = r.col;
            bool kw = false;
            if (r.peek() == ':')
            {
                r.get();
                // A lone ':' is the typed-field head, e.g. (: a Int).
                if (!is_symbol_char(r.peek()))
                {
                    auto n = make_node(symbol{":"});
                    attach_pos(*n, sl, sc, r.last_line, r.last_col);
                    return n;
                }
                kw = true;
            }
            std::string s;
            while (is_symbol_char(r.peek()))
                s += r.get();
            node_ptr n;
            if (s == "nil" && !kw)
                n = make_node(std::monostate{});
            else if (s == "true" && !kw)
                n = make_node(true);
            else if (s == "false" && !kw)
                n = make_node(false);
            else if (kw)
                n = make_node(keyword{s});
            else
                n = make_node(symbol{s});
            attach_pos(*n, sl, sc, r.last_line, r.last_col);
            return n;
        }

        inline node_ptr parse_value(reader &r)
        {
            r.skip_ws();
            char c = r.peek();
            int sl = r.line, sc = r.col;
            switch (c)
            {
            case '"':
                return parse_string(r);
            case '(':
                r.get();
                return parse_collection(r, ')', sl, sc);
            case '[':
                r.get();
                return parse_collection(r, ']', sl, sc);
            case '{':
                r.get();
                return parse_collection(r, '}', sl, sc);
            default:
                break;
            }
            if (is_digit(c) || ((c == '+' || c == '-') && is_digit(r.peek(1))))
                return parse_number(r);
            if (c == ':' || is_symbol_start(c))
                return parse_symbol_or_keyword(r);
            if (r.eof())
                r.fail("unexpected end of input");
            r.fail(std::string("unexpected character '") + c + "'");
        }

    }

    inline std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("<null>"); }
    // Pretty printer with newlines and indentation for declaration dumps
    inline std::string to_pretty_string(const node &n, int indentWidth = 2);
    inline std::string to_pretty_string(const node_ptr &p, int indentWidth = 2) { return to_pretty_string(*p, indentWidth); }

    inline std::string quote_string(const std::string &s)
    {
        std::string out = "\"";
        for (char c : s)
        {
            switch (c)
            {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
            }
        }
        out += '"';
        return out;
    }

    inline std::string to_string(const node &n)
    {
        struct V
        {
            static std::string join(const std::vector<node_ptr> &elems, char open, char close)
            {
                std::string out(1, open);
                bool first = true;
                for (auto &ch : elems)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(ch);
                }
                out += close;
                return out;
            }
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const
            {
                std::ostringstream oss;
                oss << d;
                std::string s = oss.str();
                // Keep floats distinguishable from integers when printed back.
                if (s.find_first_of(".eEn") == std::string::npos)
                    s += ".0";
                return s;
            }
            std::string operator()(const std::string &s) const { return quote_string(s); }
            std::string operator()(const keyword &k) const { return ':' + k.name; }
            std::string operator()(const symbol &s) const { return s.name; }
            std::string operator()(const list &l) const { return join(l.elems, '(', ')'); }
            std::string operator()(const vector_t &v) const { return join(v.elems, '[', ']'); }
            std::string operator()(const map &m) const
            {
                std::string out = "{";
                bool first = true;
                for (auto &kv : m.entries)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(kv.first) + ' ' + to_string(kv.second);
                }
                out += '}';
                return out;
            }
        };
        return std::visit(V{}, n.data);
    }

    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline list *as_list(node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline bool is_symbol_named(const node_ptr &n, std::string_view name) { return n && is_symbol(*n) && std::get<symbol>(n->data).name == name; }
    // True if n is a list whose head is the symbol `head`.
    inline bool is_form(const node_ptr &n, std::string_view head)
    {
        if (!n)
            return false;
        auto *l = as_list(*n);
        return l && !l->elems.empty() && is_symbol_named(l->elems[0], head);
    }
    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        if (it == n.metadata.end())
            return def;
        auto &nd = *it->second;
        if (std::holds_alternative<int64_t>(nd.data))
            return (int)std::get<int64_t>(nd.data);
        return def;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }

    inline std::string to_pretty_string(const node &n, int indentWidth)
    {
        // Compact single-line forms for short collections; declaration heads
        // (do, struct) always break so each field/override sits on its own line.
        const size_t MAX_INLINE_LEN = 90;
        std::function<std::string(const node &, int)> pp = [&](const node &x, int indent) -> std::string {
            const std::vector<node_ptr> *elems = nullptr;
            char openC = '(', closeC = ')';
            if (auto *l = as_list(x))
                elems = &l->elems;
            else if (is_vector(x))
            {
                elems = &std::get<vector_t>(x.data).elems;
                openC = '[';
                closeC = ']';
            }
            if (!elems)
                return to_string(x);
            if (elems->empty())
                return std::string{openC, closeC};
            bool forceMulti = false, isStruct = false;
            if (openC == '(' && is_symbol(*(*elems)[0]))
            {
                const std::string &head = std::get<symbol>((*elems)[0]->data).name;
                isStruct = head == "struct";
                forceMulti = isStruct || head == "do";
            }
            if (!forceMulti)
            {
                std::string inlineForm = to_string(x);
                if (inlineForm.size() <= MAX_INLINE_LEN)
                    return inlineForm;
            }
            std::string pad(static_cast<size_t>(indent + indentWidth), ' ');
            std::string out(1, openC);
            size_t i = 0;
            for (auto &e : *elems)
            {
                // keep the head (and a struct's name) on the opening line
                if (i == 0 || (isStruct && i == 1))
                    out += (i ? " " : "") + pp(*e, indent + indentWidth);
                else
                    out += '\n' + pad + pp(*e, indent + indentWidth);
                ++i;
            }
            out += closeC;
            return out;
        };
        return pp(n, 0);
    }

    // ------ Factory helpers ------

    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_f64(double v) { return detail::make_node(v); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }
    inline node_ptr n_nil() { return detail::make_node(std::monostate{}); }

    inline node_ptr node_vec() { return detail::make_node(vector_t{}); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs)
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(l));
    }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs)
    {
        vector_t v;
        v.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(v));
    }

    // Generic appender for list/vector nodes
    inline node_ptr &operator<<(node_ptr &c, const node_ptr &n)
    {
        if (!c)
            throw std::invalid_argument("operator<<: null container node");
        if (std::holds_alternative<list>(c->data))
            std::get<list>(c->data).elems.push_back(n);
        else if (std::holds_alternative<vector_t>(c->data))
            std::get<vector_t>(c->data).elems.push_back(n);
        else
            throw std::invalid_argument("operator<<: container is not list/vector");
        return c;
    }

} // namespace fieldmeta
