#include "fieldmeta/extension.hpp"
#include "fieldmeta/annotation.hpp"
#include "fieldmeta/chain.hpp"
#include <cstdio>

namespace fieldmeta {

namespace {

[[noreturn]] void bad_decl(const std::string& msg, const node_ptr& at){
    throw annotation_error("E0103", msg, at ? line(*at) : -1, at ? col(*at) : -1);
}

} // namespace

node_ptr make_override(const std::string& kind, const std::string& type, const std::string& field, const node_ptr& value){
    return node_list({ n_sym("override"), n_sym(kind), n_sym(type), n_sym(field), value });
}

std::vector<node_ptr> emit_overrides(const std::string& kind, const std::string& type,
                                     const std::vector<std::pair<std::string, node_ptr>>& pairs){
    std::vector<node_ptr> out;
    out.reserve(pairs.size());
    for(auto& [field, value] : pairs){
        if(is_placeholder(value)) continue;
        out.push_back(make_override(kind, type, field, value));
    }
    return out;
}

void KindExtension::apply(const std::string& type, std::vector<node_ptr>& fields, std::vector<node_ptr>& overrides) const {
    std::vector<std::pair<std::string, node_ptr>> pairs;
    for(auto& f : fields){
        auto p = peel_annotation(f);
        if(!p.annotated) continue;
        if(trace_) std::fprintf(stderr, "[dbg][expand] %s %s field=%s value=%s\n", kind_.c_str(), type.c_str(), p.name.c_str(), to_string(p.value).c_str());
        pairs.emplace_back(p.name, p.value);
        f = p.field;
    }
    auto emitted = emit_overrides(kind_, type, pairs);
    overrides.insert(overrides.end(), emitted.begin(), emitted.end());
}

std::vector<std::string> ChainExtension::kinds() const {
    std::vector<std::string> out;
    for(auto& l : links_){ auto ks = l->kinds(); out.insert(out.end(), ks.begin(), ks.end()); }
    return out;
}

void ChainExtension::apply(const std::string& type, std::vector<node_ptr>& fields, std::vector<node_ptr>& overrides) const {
    if(trace_){
        auto ks = kinds();
        for(auto& f : fields){
            auto plan = assign_chain(ks, annotation_values(f));
            std::string msg = "[dbg][chain] " + name_ + " " + type + " field=" + field_name(f);
            for(auto& a : plan.assignments) msg += " " + a.link + "=" + (a.value ? to_string(a.value) : std::string("<default>"));
            std::fprintf(stderr, "%s\n", msg.c_str());
        }
    }
    for(auto it = links_.rbegin(); it != links_.rend(); ++it) (*it)->apply(type, fields, overrides);
}

std::string type_head_name(const node_ptr& head){
    if(head && is_symbol(*head)) return std::get<symbol>(head->data).name;
    if(head && is_list(*head)){
        auto& el = as_list(*head)->elems;
        if(!el.empty()) return type_head_name(el[0]);
    }
    bad_decl("declaration needs a type name, got " + to_string(head), head);
}

node_ptr expand_bare(const Extension& ext, Transformer& tx, const node_ptr& decl){
    auto expanded = tx.expand(decl);
    node_ptr structForm;
    std::vector<node_ptr> carried;
    if(is_form(expanded, "struct")){
        structForm = expanded;
    } else if(is_form(expanded, "do")){
        auto& el = as_list(*expanded)->elems;
        for(size_t i = 1; i < el.size(); ++i){
            if(!structForm && is_form(el[i], "struct")) structForm = el[i];
            else carried.push_back(el[i]);
        }
    }
    if(!structForm) bad_decl(ext.name() + " expects a (struct ...) declaration, got " + to_string(decl), decl);

    auto& sel = as_list(*structForm)->elems;
    if(sel.size() < 2) bad_decl("struct declaration needs a type name", structForm);
    std::string type = type_head_name(sel[1]);
    std::vector<node_ptr> fields(sel.begin() + 2, sel.end());
    std::vector<node_ptr> overrides;
    ext.apply(type, fields, overrides);

    list cleaned;
    cleaned.elems.push_back(sel[0]);
    cleaned.elems.push_back(sel[1]);
    cleaned.elems.insert(cleaned.elems.end(), fields.begin(), fields.end());
    list out;
    out.elems.push_back(n_sym("do"));
    out.elems.push_back(std::make_shared<node>(node{ std::move(cleaned), structForm->metadata }));
    out.elems.insert(out.elems.end(), carried.begin(), carried.end());
    out.elems.insert(out.elems.end(), overrides.begin(), overrides.end());
    return std::make_shared<node>(node{ std::move(out), {} });
}

node_ptr expand_typed(const Extension& ext, const list& form){
    auto& el = form.elems;
    std::string type = type_head_name(el[1]);
    std::vector<node_ptr> fields(el.begin() + 2, el.end());
    std::vector<node_ptr> overrides;
    ext.apply(type, fields, overrides);
    list out;
    out.elems.push_back(n_sym("do"));
    out.elems.insert(out.elems.end(), overrides.begin(), overrides.end());
    return std::make_shared<node>(node{ std::move(out), {} });
}

void install_extension(Transformer& tx, ExtensionPtr ext){
    std::string name = ext->name();
    tx.add_macro(std::move(name), [&tx, ext](const list& form) -> std::optional<node_ptr> {
        auto& el = form.elems;
        if(el.size() < 2) bad_decl(ext->name() + " expects a declaration", el[0]);
        // A lone list argument is a declaration, possibly wrapped by other
        // extensions; otherwise el[1] is a type, plain or parameterised.
        if(el.size() == 2 && is_list(*el[1])) return expand_bare(*ext, tx, el[1]);
        if(is_form(el[1], "struct")) bad_decl(ext->name() + " takes a single (struct ...) declaration or a type name followed by fields", el[0]);
        return expand_typed(*ext, form);
    });
}

} // namespace fieldmeta
