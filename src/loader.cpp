#include "fieldmeta/loader.hpp"
#include "fieldmeta/annotation.hpp"
#include "fieldmeta/builtin_kinds.hpp"
#include "fieldmeta/diagnostics_json.hpp"
#include <cstdio>
#include <cstdlib>
#include <unordered_set>

namespace fieldmeta {

// Reads process env vars and constructs a LoaderEnv.
LoaderEnv detect_env(){
    LoaderEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    // Tracing
    if (const char* v = get("FIELDMETA_DEBUG_EXPAND")) e.debugExpand = (std::string(v) == "1");
    if (const char* v = get("FIELDMETA_DEBUG_LOAD")) e.debugLoad = (std::string(v) == "1");

    // Diagnostics JSON on stderr
    if (const char* v = get("FIELDMETA_DIAG_JSON")) e.diagJson = (std::string(v) == "1");

    // Standard kinds at construction
    if (const char* v = get("FIELDMETA_BUILTIN_KINDS")) e.builtinKinds = (std::string(v) == "1");

    return e;
}

namespace {

// Form heads the loader and the expander interpret themselves.
const char* const kReservedNames[] = { "do", "struct", "override", "defkind", "defchain", "|", "=", ":", "_" };

void reject_reserved(const std::string& name){
    for(auto* r : kReservedNames)
        if(name == r) throw chain_error("E0204", "`" + name + "` is a reserved form name and cannot name an extension");
}

std::string hint_for(const std::string& code){
    if(code == "E0001") return "check brackets and string quoting";
    if(code == "E0100") return "write each annotation as `field | value`";
    if(code == "E0101" || code == "E0102") return "annotate a field name or `name: Type`";
    if(code == "E0103") return "write (ext (struct Name field...)) or (ext Type field...)";
    if(code == "E0104") return "apply one extension per annotation layer, or drop the extra value";
    if(code == "E0105") return "rename or remove the repeated field";
    if(code == "E0200") return "define the extension before the chain that uses it";
    if(code == "E0201") return "list at least one link: (defchain name [kind...])";
    if(code == "E0202") return "write (defkind name default) or (defchain name [link...])";
    if(code == "E0203") return "pick an unused extension name";
    if(code == "E0204") return "pick a name other than do, struct, override, defkind, defchain, |, =, : or _";
    if(code == "E0300") return "define kinds and load declarations before freeze()";
    return "";
}

std::string symbol_arg(const std::vector<node_ptr>& el, size_t i, const char* what, const node_ptr& form){
    if(i >= el.size() || !el[i] || !is_symbol(*el[i]))
        throw chain_error("E0202", std::string(what) + " expects a symbol at position " + std::to_string(i) + ": " + to_string(form), line(*form), col(*form));
    return std::get<symbol>(el[i]->data).name;
}

} // namespace

TypeInfo parse_declaration(const node& decl){
    auto* l = as_list(decl);
    if(!l || l->elems.size() < 2 || !is_symbol_named(l->elems[0], "struct"))
        throw annotation_error("E0103", "expected (struct Name field...), got " + to_string(decl), line(decl), col(decl));
    auto& el = l->elems;
    TypeInfo info;
    info.name = type_head_name(el[1]);
    std::unordered_set<std::string> seen;
    for(size_t i = 2; i < el.size(); ++i){
        const node_ptr& f = el[i];
        if(has_annotation(f))
            throw annotation_error("E0104", "field " + field_name(f) + " of " + info.name + " still carries an annotation no extension consumed: " + to_string(f), line(*f), col(*f));
        FieldInfo fi;
        fi.name = field_name(f);
        node_ptr target = f;
        if(is_form(f, "=")){
            target = as_list(*f)->elems[1];
            fi.default_value = as_list(*f)->elems[2];
        }
        if(is_form(target, ":")) fi.type = as_list(*target)->elems[2];
        if(!seen.insert(fi.name).second)
            throw annotation_error("E0105", "duplicate field " + fi.name + " in " + info.name, line(*f), col(*f));
        info.fields.push_back(std::move(fi));
    }
    info.declaration = std::make_shared<node>(decl);
    return info;
}

Loader::Loader(LoaderEnv env) : env_(env) {
    if(env_.builtinKinds) register_builtin_kinds(*this);
}

void Loader::register_extension(ExtensionPtr ext){
    auto name = ext->name();
    install_extension(tx_, ext);
    extensions_[name] = std::move(ext);
}

void Loader::define_kind_impl(const std::string& name, DefaultFn fn, node_ptr default_expr){
    reject_reserved(name);
    if(has_extension(name)) throw chain_error("E0203", "extension " + name + " is already defined");
    registry_.add_kind(name, std::move(fn), std::move(default_expr));
    register_extension(std::make_shared<KindExtension>(name, env_.debugExpand));
}

Accessor Loader::define_kind(const std::string& name, node_ptr default_expr){
    if(!default_expr) default_expr = n_nil();
    node_ptr expr = default_expr;
    define_kind_impl(name, [expr](const std::string&, const std::string&){ return clone(expr); }, expr);
    return Accessor(registry_, name);
}

Accessor Loader::define_kind(const std::string& name, DefaultFn default_fn){
    define_kind_impl(name, std::move(default_fn), nullptr);
    return Accessor(registry_, name);
}

void Loader::define_chain(const std::string& name, const std::vector<std::string>& links){
    if(registry_.frozen()) throw registry_error("define_chain: registry is frozen");
    reject_reserved(name);
    if(has_extension(name)) throw chain_error("E0203", "extension " + name + " is already defined");
    if(links.empty()) throw chain_error("E0201", "chain " + name + " needs at least one link");
    std::vector<ExtensionPtr> resolved;
    resolved.reserve(links.size());
    for(auto& l : links){
        auto it = extensions_.find(l);
        if(it == extensions_.end()) throw chain_error("E0200", "chain " + name + " references undefined extension " + l);
        resolved.push_back(it->second);
    }
    register_extension(std::make_shared<ChainExtension>(name, std::move(resolved), env_.debugExpand));
}

const Extension& Loader::extension(const std::string& name) const {
    auto it = extensions_.find(name);
    if(it == extensions_.end()) throw std::out_of_range("unknown extension " + name);
    return *it->second;
}

Accessor Loader::accessor(const std::string& kind) const {
    (void)registry_.kind(kind); // throws for non-kinds
    return Accessor(registry_, kind);
}

node_ptr Loader::expand(const node_ptr& form){ return tx_.expand(form); }

void Loader::handle_defkind(const node_ptr& form){
    auto& el = as_list(*form)->elems;
    if(el.size() != 2 && el.size() != 3)
        throw chain_error("E0202", "expected (defkind name default), got " + to_string(form), line(*form), col(*form));
    std::string name = symbol_arg(el, 1, "defkind", form);
    define_kind(name, el.size() == 3 ? el[2] : n_nil());
}

void Loader::handle_defchain(const node_ptr& form){
    auto& el = as_list(*form)->elems;
    std::string name = symbol_arg(el, 1, "defchain", form);
    std::vector<std::string> links;
    if(el.size() == 3 && is_vector(*el[2])){
        auto& v = std::get<vector_t>(el[2]->data).elems;
        for(size_t i = 0; i < v.size(); ++i) links.push_back(symbol_arg(v, i, "defchain link", form));
    } else {
        for(size_t i = 2; i < el.size(); ++i) links.push_back(symbol_arg(el, i, "defchain", form));
    }
    try {
        define_chain(name, links);
    } catch(const chain_error& e){
        throw chain_error(e.code, e.what(), line(*form), col(*form));
    }
}

void Loader::commit(const node_ptr& expanded){
    if(!is_list(*expanded))
        throw annotation_error("E0103", "unrecognized top-level form " + to_string(expanded), line(*expanded), col(*expanded));

    // Stage everything first so a failing form registers nothing.
    std::vector<TypeInfo> types;
    std::vector<OverrideBinding> binds;
    Transformer collect;
    collect.add_visitor("struct", [&](node& n, list&, const symbol&){ types.push_back(parse_declaration(n)); });
    collect.add_visitor("override", [&](node& n, list& l, const symbol&){
        auto& el = l.elems;
        auto sym = [&](size_t i){ return i < el.size() && is_symbol(*el[i]) ? std::get<symbol>(el[i]->data).name : std::string(); };
        if(el.size() != 5 || sym(1).empty() || sym(2).empty() || sym(3).empty())
            throw annotation_error("E0103", "expected (override kind type field value), got " + to_string(n), line(n), col(n));
        if(!registry_.has_kind(sym(1)))
            throw annotation_error("E0103", "override for unknown metadata kind " + sym(1), line(n), col(n));
        binds.push_back(OverrideBinding{ sym(1), sym(2), sym(3), el[4] });
    });
    collect.on_unmatched_list([](node& n, list& l){
        if(!l.elems.empty() && is_symbol_named(l.elems[0], "do")) return;
        throw annotation_error("E0103", "unrecognized declaration form " + to_string(n), line(n), col(n));
    });
    collect.traverse(expanded);

    for(auto& t : types){
        if(env_.debugLoad) std::fprintf(stderr, "[dbg][load] type %s fields=%zu\n", t.name.c_str(), t.fields.size());
        registry_.declare_type(std::move(t));
    }
    for(auto& b : binds){
        if(env_.debugLoad) std::fprintf(stderr, "[dbg][load] bind %s %s.%s = %s\n", b.kind.c_str(), b.type.c_str(), b.field.c_str(), to_string(b.value).c_str());
        registry_.bind(b.kind, b.type, b.field, b.value);
    }
}

node_ptr Loader::load(const node_ptr& form){
    if(is_form(form, "defkind")){ handle_defkind(form); return form; }
    if(is_form(form, "defchain")){ handle_defchain(form); return form; }
    if(registry_.frozen()) throw registry_error("load: registry is frozen; declarations must be loaded before freeze()");
    auto expanded = tx_.expand(form);
    commit(expanded);
    return expanded;
}

LoadResult Loader::load_forms(const std::vector<node_ptr>& forms){
    LoadResult r;
    for(auto& f : forms){
        try {
            r.expanded.push_back(load(f));
        } catch(const error& e){
            r.success = false;
            Diagnostic d{ e.code, e.what(), hint_for(e.code), e.line, e.col };
            if(d.line < 0){ d.line = line(*f); d.col = col(*f); }
            r.diagnostics.push_back(std::move(d));
        }
    }
    maybe_print_json(r, env_);
    return r;
}

LoadResult Loader::load_source(std::string_view src){
    std::vector<node_ptr> forms;
    try {
        forms = parse_all(src);
    } catch(const parse_error& e){
        LoadResult r;
        r.success = false;
        r.diagnostics.push_back(Diagnostic{ e.code, e.what(), hint_for(e.code), e.line, e.col });
        maybe_print_json(r, env_);
        return r;
    }
    return load_forms(forms);
}

} // namespace fieldmeta
