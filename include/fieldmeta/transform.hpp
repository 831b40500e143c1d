#pragma once
#include "edn.hpp"
#include <unordered_map>
#include <functional>
#include <optional>

namespace fieldmeta {

// Two-phase driver over declaration forms:
// 1. Macro expansion (symbol -> macro function) rewriting list forms. Every
//    metadata kind and chain installs its syntax extensions here.
// 2. Visiting the expanded tree (symbol -> visitor); the load phase uses this
//    to register (struct ...) and (override ...) forms.
//
// Macros: signature std::optional<node_ptr>(const list& form)
//   Return std::nullopt if not applicable (allows arity-based conditional expansion).
//   Returned value is recursively expanded again (so macros can expand to macros).
// Visitors: signature void(node&, list& form, const symbol& head)
//   Invoked after full macro expansion on each list whose head symbol has a registered visitor.

class Transformer {
public:
    using MacroFn = std::function<std::optional<node_ptr>(const list&)>;
    using ListVisitorFn = std::function<void(node&, list&, const symbol& head)>;
    using FallbackListVisitorFn = std::function<void(node&, list&)>;

    Transformer& add_macro(std::string name, MacroFn fn){
        macros_[std::move(name)] = std::move(fn); return *this;
    }

    Transformer& add_visitor(std::string name, ListVisitorFn fn){
        visitors_[std::move(name)] = std::move(fn); return *this;
    }
    Transformer& on_unmatched_list(FallbackListVisitorFn fn){ unmatched_list_ = std::move(fn); return *this; }

    // Expand macros (returns a deep-copied expanded value separate from input)
    node_ptr expand(const node_ptr& n){ return expand_impl(n); }

    // Traverse pre-expanded value (no expansion during traversal)
    void traverse(const node_ptr& n){ traverse_impl(n); }

private:
    std::unordered_map<std::string, MacroFn> macros_;
    std::unordered_map<std::string, ListVisitorFn> visitors_;
    FallbackListVisitorFn unmatched_list_{};

    node_ptr expand_impl(const node_ptr& n){
        if(std::holds_alternative<vector_t>(n->data)){
            auto copy = std::make_shared<node>(); copy->metadata = n->metadata;
            vector_t v; for(auto& c: std::get<vector_t>(n->data).elems) v.elems.push_back(expand_impl(c));
            copy->data = std::move(v); return copy;
        }
        if(!std::holds_alternative<list>(n->data)) return n; // atoms and maps are literal
        auto current = clone(n);
        bool changed = true;
        while(changed){
            changed = false;
            auto& l = std::get<list>(current->data);
            if(!l.elems.empty() && std::holds_alternative<symbol>(l.elems[0]->data)){
                auto it = macros_.find(std::get<symbol>(l.elems[0]->data).name);
                if(it != macros_.end()){
                    auto maybe = it->second(l);
                    if(maybe){
                        auto replaced = expand_impl(*maybe); // expand inside result
                        if(std::holds_alternative<list>(replaced->data)){
                            current = replaced; changed = true; continue;
                        } else return replaced;
                    }
                }
            }
        }
        auto& l = std::get<list>(current->data);
        for(auto& ch : l.elems) ch = expand_impl(ch);
        return current;
    }

    void traverse_impl(const node_ptr& n){
        if(std::holds_alternative<list>(n->data)){
            auto& l = std::get<list>(n->data);
            if(!l.elems.empty() && std::holds_alternative<symbol>(l.elems[0]->data)){
                auto head = std::get<symbol>(l.elems[0]->data);
                auto it = visitors_.find(head.name);
                if(it != visitors_.end()){ it->second(*n, l, head); return; } // visitors own their subtree
                if(unmatched_list_) unmatched_list_(*n, l);
            } else if(unmatched_list_) unmatched_list_(*n, l);
            for(auto& ch : l.elems) traverse_impl(ch);
            return;
        }
        if(std::holds_alternative<vector_t>(n->data)){
            for(auto& ch : std::get<vector_t>(n->data).elems) traverse_impl(ch);
        }
    }
};

} // namespace fieldmeta
