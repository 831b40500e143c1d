#include "fieldmeta/annotation.hpp"
#include <algorithm>

namespace fieldmeta {

namespace {

[[noreturn]] void fail(const char* code, const std::string& msg, const node_ptr& at){
    throw annotation_error(code, msg, at ? line(*at) : -1, at ? col(*at) : -1);
}

bool contains_bar(const node_ptr& n){
    if(!n) return false;
    const std::vector<node_ptr>* elems = nullptr;
    if(auto* l = as_list(*n)) elems = &l->elems;
    else if(is_vector(*n)) elems = &std::get<vector_t>(n->data).elems;
    if(!elems) return false;
    if(is_form(n, "|")) return true;
    for(auto& e : *elems) if(contains_bar(e)) return true;
    return false;
}

// a or (: a T); anything else is not a field name. T may not carry annotations.
bool name_of_target(const node_ptr& t, std::string& out){
    if(!t) return false;
    if(auto* s = as_symbol(*t)){
        if(s->name == kPlaceholder || s->name == "|" || s->name == "=" || s->name == ":") return false;
        out = s->name; return true;
    }
    if(is_form(t, ":")){
        auto& el = as_list(*t)->elems;
        if(el.size() == 3 && el[1] && is_symbol(*el[1])){
            if(contains_bar(el[2])) fail("E0101", "annotation chain inside the type of field " + std::get<symbol>(el[1]->data).name + ": " + to_string(t), t);
            out = std::get<symbol>(el[1]->data).name;
            return true;
        }
    }
    return false;
}

const std::vector<node_ptr>& bar_operands(const node_ptr& bar){
    auto& el = as_list(*bar)->elems;
    if(el.size() != 3) fail("E0100", "annotation '|' expects exactly two operands: " + to_string(bar), bar);
    return el;
}

// Rebuild a list keeping the original form's position metadata.
node_ptr rebuild(const node_ptr& like, std::vector<node_ptr> elems){
    auto out = std::make_shared<node>(node{ list{ std::move(elems) }, like->metadata });
    return out;
}

} // namespace

bool is_placeholder(const node_ptr& value){ return is_symbol_named(value, kPlaceholder); }

std::string field_name(const node_ptr& field){
    std::string name;
    if(name_of_target(field, name)) return name;
    if(is_form(field, "=")){
        auto& el = as_list(*field)->elems;
        if(el.size() != 3 || !name_of_target(el[1], name)) fail("E0102", "default assignment target is not a field name: " + to_string(field), field);
        return name;
    }
    if(is_form(field, "|")){
        node_ptr base = field;
        while(is_form(base, "|")) base = bar_operands(base)[1];
        if(!name_of_target(base, name)) fail("E0101", "annotation chain is not attached to a field name: " + to_string(field), field);
        return name;
    }
    fail("E0101", "not a field declaration: " + to_string(field), field);
}

PeeledField peel_annotation(const node_ptr& field){
    PeeledField out;
    out.name = field_name(field); // validates the shape
    out.field = field;
    if(is_form(field, "=")){
        auto& el = as_list(*field)->elems;
        const node_ptr& rhs = el[2];
        if(!is_form(rhs, "|")) return out; // ordinary default, nothing to consume
        auto& ops = bar_operands(rhs);
        out.value = ops[2];
        out.annotated = true;
        out.field = rebuild(field, { el[0], el[1], ops[1] });
        return out;
    }
    if(is_form(field, "|")){
        auto& ops = bar_operands(field);
        out.value = ops[2];
        out.annotated = true;
        out.field = ops[1];
    }
    return out;
}

bool has_annotation(const node_ptr& field){
    if(is_form(field, "|")) return true;
    if(is_form(field, "=")){
        auto& el = as_list(*field)->elems;
        return el.size() == 3 && is_form(el[2], "|");
    }
    return false;
}

std::vector<node_ptr> annotation_values(const node_ptr& field){
    std::vector<node_ptr> values;
    node_ptr cur = field;
    for(;;){
        auto p = peel_annotation(cur);
        if(!p.annotated) break;
        values.push_back(p.value);
        cur = p.field;
    }
    std::reverse(values.begin(), values.end());
    return values;
}

node_ptr strip_annotations(const node_ptr& field){
    node_ptr cur = field;
    for(;;){
        auto p = peel_annotation(cur);
        if(!p.annotated) return cur;
        cur = p.field;
    }
}

} // namespace fieldmeta
