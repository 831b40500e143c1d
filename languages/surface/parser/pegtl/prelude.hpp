#pragma once
#include "fieldmeta/edn.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace fieldmeta::surface::pegtl_front {

// Shared state threaded through the actions. Operands (values and type
// expressions) go on `values`; tuples and parameterised types remember where
// they started in `marks`.
struct build_state {
    struct field_build {
        std::string name;
        int line{-1};
        int col{-1};
        node_ptr type;
        node_ptr default_value;
        std::vector<node_ptr> bars;
    };

    std::vector<node_ptr> values;
    std::vector<size_t> marks;
    field_build field;
    std::vector<node_ptr> fields;
    bool typed_block{false};
    std::vector<std::string> ext_names;
    std::string decl_name;
    std::vector<node_ptr> forms;

    node_ptr pop(){ auto v = values.back(); values.pop_back(); return v; }
    std::vector<node_ptr> pop_to_mark(){
        size_t m = marks.back(); marks.pop_back();
        std::vector<node_ptr> out(values.begin() + static_cast<std::ptrdiff_t>(m), values.end());
        values.resize(m);
        return out;
    }
};

inline node_ptr at_pos(node_ptr n, int line, int col){
    n->metadata["line"] = n_i64(line);
    n->metadata["col"] = n_i64(col);
    return n;
}

inline node_ptr list_of(std::vector<node_ptr> elems){
    return std::make_shared<node>(node{ list{ std::move(elems) }, {} });
}

} // namespace fieldmeta::surface::pegtl_front
