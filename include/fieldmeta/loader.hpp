// loader.hpp - single-threaded load phase: extension definitions, expansion, registration
#pragma once
#include "fieldmeta/edn.hpp"
#include "fieldmeta/transform.hpp"
#include "fieldmeta/extension.hpp"
#include "fieldmeta/registry.hpp"
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fieldmeta {

struct LoaderEnv {
    bool debugExpand = false;   // FIELDMETA_DEBUG_EXPAND
    bool debugLoad = false;     // FIELDMETA_DEBUG_LOAD
    bool diagJson = false;      // FIELDMETA_DIAG_JSON
    bool builtinKinds = false;  // FIELDMETA_BUILTIN_KINDS
};

// Read loader configuration from the process environment.
LoaderEnv detect_env();

struct Diagnostic { std::string code; std::string message; std::string hint; int line=-1; int col=-1; };

struct LoadResult {
    bool success = true;
    std::vector<Diagnostic> diagnostics;
    std::vector<node_ptr> expanded; // one entry per successfully processed top-level form
};

class Loader {
public:
    explicit Loader(LoaderEnv env = detect_env());
    Loader(const Loader&) = delete;
    Loader& operator=(const Loader&) = delete;

    // Registers a kind and installs its bare and typed extensions. The
    // expression default is deep-copied on every unoverridden lookup.
    Accessor define_kind(const std::string& name, node_ptr default_expr);
    Accessor define_kind(const std::string& name, DefaultFn default_fn);

    // Composes existing extensions (kinds or chains) into one.
    void define_chain(const std::string& name, const std::vector<std::string>& links);

    bool has_extension(const std::string& name) const { return extensions_.count(name) != 0; }
    const Extension& extension(const std::string& name) const;
    Accessor accessor(const std::string& kind) const;

    // Macro expansion only; nothing is registered.
    node_ptr expand(const node_ptr& form);

    // Process one top-level form: (defkind ...), (defchain ...), or a
    // declaration. Declarations are expanded, validated and only then
    // registered, so a failing form leaves the registry untouched.
    node_ptr load(const node_ptr& form);

    // load() every form, recording a Diagnostic per failing form and continuing.
    LoadResult load_forms(const std::vector<node_ptr>& forms);
    LoadResult load_source(std::string_view src);

    // End of the load phase; the registry rejects mutation afterwards.
    void freeze() { registry_.freeze(); }

    Registry& registry() { return registry_; }
    const Registry& registry() const { return registry_; }
    const LoaderEnv& env() const { return env_; }

private:
    void define_kind_impl(const std::string& name, DefaultFn fn, node_ptr default_expr);
    void register_extension(ExtensionPtr ext);
    void handle_defkind(const node_ptr& form);
    void handle_defchain(const node_ptr& form);
    void commit(const node_ptr& expanded);

    LoaderEnv env_;
    Registry registry_;
    Transformer tx_;
    std::map<std::string, ExtensionPtr> extensions_;
};

// Validate a cleaned (struct ...) form and turn it into a TypeInfo.
// Throws annotation_error for residual annotations (E0104) or duplicate fields (E0105).
TypeInfo parse_declaration(const node& decl);

} // namespace fieldmeta
