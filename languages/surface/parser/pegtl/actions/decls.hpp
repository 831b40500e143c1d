#pragma once
#include "../prelude.hpp"
#include "../grammar.hpp"
#include <tao/pegtl.hpp>
#include <stdexcept>

namespace fieldmeta::surface::pegtl_front::actions {
using namespace tao::pegtl;
using fieldmeta::surface::pegtl_front::build_state;

template<typename Rule>
struct action : nothing<Rule> {};

template<typename Input>
inline int line_of(const Input& in){ return static_cast<int>(in.position().line); }
template<typename Input>
inline int col_of(const Input& in){ return static_cast<int>(in.position().column); }

// ---- values ----
template<> struct action< grammar::number_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string s = in.string();
        try {
            node_ptr n = s.find_first_of(".eE") != std::string::npos ? n_f64(std::stod(s)) : n_i64(std::stoll(s));
            st.values.push_back(at_pos(n, line_of(in), col_of(in)));
        } catch(const std::logic_error&) {
            throw tao::pegtl::parse_error("invalid number '" + s + "'", in);
        }
    }
};

template<> struct action< grammar::string_body > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string raw = in.string(), out;
        for(size_t i = 0; i < raw.size(); ++i){
            char c = raw[i];
            if(c == '\\' && i + 1 < raw.size()){
                char e = raw[++i];
                switch(e){ case 'n': out += '\n'; break; case 't': out += '\t'; break; case 'r': out += '\r'; break; default: out += e; break; }
            } else out += c;
        }
        st.values.push_back(at_pos(n_str(std::move(out)), line_of(in), col_of(in)));
    }
};

template<> struct action< grammar::nothing_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.values.push_back(at_pos(n_nil(), line_of(in), col_of(in))); }
};
template<> struct action< grammar::true_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.values.push_back(at_pos(n_bool(true), line_of(in), col_of(in))); }
};
template<> struct action< grammar::false_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.values.push_back(at_pos(n_bool(false), line_of(in), col_of(in))); }
};
// Identifiers, `_` included, stay symbols.
template<> struct action< grammar::ident_value > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.values.push_back(at_pos(n_sym(in.string()), line_of(in), col_of(in))); }
};

template<> struct action< grammar::tuple_open > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.marks.push_back(st.values.size()); }
};
// Tuples lower to vectors.
template<> struct action< grammar::tuple > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto elems = st.pop_to_mark();
        st.values.push_back(at_pos(std::make_shared<node>(node{ vector_t{ std::move(elems) }, {} }), line_of(in), col_of(in)));
    }
};

// ---- types ----
template<> struct action< grammar::type_head > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.marks.push_back(st.values.size());
        st.values.push_back(at_pos(n_sym(in.string()), line_of(in), col_of(in)));
    }
};
// Name{T, U} -> (Name T U); plain Name stays a symbol.
template<> struct action< grammar::type_expr > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto parts = st.pop_to_mark();
        if(parts.size() == 1) st.values.push_back(parts.front());
        else st.values.push_back(at_pos(list_of(std::move(parts)), line_of(in), col_of(in)));
    }
};

// ---- fields ----
template<> struct action< grammar::field_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.field = build_state::field_build{};
        st.field.name = in.string();
        st.field.line = line_of(in);
        st.field.col = col_of(in);
    }
};
template<> struct action< grammar::type_ann > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.field.type = st.pop(); }
};
template<> struct action< grammar::default_ann > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.field.default_value = st.pop(); }
};
template<> struct action< grammar::bar_ann > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.field.bars.push_back(st.pop()); }
};
// a: T = d | v1 | v2  ->  (= (: a T) (| (| d v1) v2))
// a: T | v1 | v2      ->  (| (| (: a T) v1) v2)
template<> struct action< grammar::field > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        auto& f = st.field;
        auto pos = [&](node_ptr n){ return at_pos(std::move(n), f.line, f.col); };
        node_ptr base = pos(n_sym(f.name));
        if(f.type) base = pos(node_list({ n_sym(":"), base, f.type }));
        node_ptr out;
        if(f.default_value){
            node_ptr expr = f.default_value;
            for(auto& b : f.bars) expr = pos(node_list({ n_sym("|"), expr, b }));
            out = pos(node_list({ n_sym("="), base, expr }));
        } else {
            out = base;
            for(auto& b : f.bars) out = pos(node_list({ n_sym("|"), out, b }));
        }
        st.fields.push_back(std::move(out));
    }
};
template<> struct action< grammar::body_open > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.fields.clear(); }
};

// ---- declarations ----
template<> struct action< grammar::struct_decl > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::vector<node_ptr> elems{ n_sym("struct"), st.pop() };
        elems.insert(elems.end(), st.fields.begin(), st.fields.end());
        st.fields.clear();
        st.values.push_back(at_pos(list_of(std::move(elems)), line_of(in), col_of(in)));
    }
};
template<> struct action< grammar::typed_block > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.typed_block = true; }
};
template<> struct action< grammar::struct_item > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.forms.push_back(st.pop()); }
};

template<> struct action< grammar::ext_ref > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.ext_names.push_back(in.string().substr(1)); }
};
template<> struct action< grammar::chain_link > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.ext_names.push_back(in.string().substr(1)); }
};
template<> struct action< grammar::decl_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.decl_name = in.string(); }
};

// @a @b struct T {...} -> (a (b (struct T ...)));  @a T {...} -> (a T ...)
template<> struct action< grammar::ext_item > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto names = std::move(st.ext_names);
        st.ext_names.clear();
        node_ptr form;
        if(st.typed_block){
            st.typed_block = false;
            if(names.size() != 1)
                throw tao::pegtl::parse_error("a typed block takes exactly one extension", in);
            std::vector<node_ptr> elems{ n_sym(names.front()), st.pop() };
            elems.insert(elems.end(), st.fields.begin(), st.fields.end());
            st.fields.clear();
            form = list_of(std::move(elems));
        } else {
            form = st.pop();
            for(auto it = names.rbegin(); it != names.rend(); ++it) form = list_of({ n_sym(*it), form });
        }
        st.forms.push_back(at_pos(form, line_of(in), col_of(in)));
    }
};

template<> struct action< grammar::metadata_item > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto value = st.pop();
        st.forms.push_back(at_pos(node_list({ n_sym("defkind"), n_sym(st.decl_name), value }), line_of(in), col_of(in)));
    }
};

template<> struct action< grammar::chain_item > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto links = node_vec();
        for(auto& l : st.ext_names) links << n_sym(l);
        st.ext_names.clear();
        st.forms.push_back(at_pos(node_list({ n_sym("defchain"), n_sym(st.decl_name), links }), line_of(in), col_of(in)));
    }
};

} // namespace fieldmeta::surface::pegtl_front::actions
