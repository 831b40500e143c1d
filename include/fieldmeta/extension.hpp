// extension.hpp - syntax extensions: one per metadata kind, plus composed chains
#pragma once
#include "fieldmeta/edn.hpp"
#include "fieldmeta/transform.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fieldmeta {

// (override kind type field value)
node_ptr make_override(const std::string& kind, const std::string& type, const std::string& field, const node_ptr& value);

// One (override ...) form per (field, value) pair whose value is not the placeholder.
std::vector<node_ptr> emit_overrides(const std::string& kind, const std::string& type,
                                     const std::vector<std::pair<std::string, node_ptr>>& pairs);

class Extension {
public:
    virtual ~Extension() = default;
    virtual const std::string& name() const = 0;
    // Kinds bound by one application, in listed order.
    virtual std::vector<std::string> kinds() const = 0;
    // Rewrite the field list of `type` in place, peeling one chain layer per
    // kind, and append the resulting (override ...) forms.
    virtual void apply(const std::string& type, std::vector<node_ptr>& fields, std::vector<node_ptr>& overrides) const = 0;
};

using ExtensionPtr = std::shared_ptr<const Extension>;

class KindExtension : public Extension {
public:
    KindExtension(std::string kind, bool trace = false) : kind_(std::move(kind)), trace_(trace) {}
    const std::string& name() const override { return kind_; }
    std::vector<std::string> kinds() const override { return { kind_ }; }
    void apply(const std::string& type, std::vector<node_ptr>& fields, std::vector<node_ptr>& overrides) const override;
private:
    std::string kind_;
    bool trace_;
};

// Applies its links in reverse listed order; see assign_chain for the resulting
// value-to-kind correspondence.
class ChainExtension : public Extension {
public:
    ChainExtension(std::string name, std::vector<ExtensionPtr> links, bool trace = false)
        : name_(std::move(name)), links_(std::move(links)), trace_(trace) {}
    const std::string& name() const override { return name_; }
    std::vector<std::string> kinds() const override;
    void apply(const std::string& type, std::vector<node_ptr>& fields, std::vector<node_ptr>& overrides) const override;
    const std::vector<ExtensionPtr>& links() const { return links_; }
private:
    std::string name_;
    std::vector<ExtensionPtr> links_;
    bool trace_;
};

// Base symbol of a declared type head: Model or (Model T) -> "Model".
std::string type_head_name(const node_ptr& head);

// Bare form: `decl` is a (struct ...) form, possibly wrapped by inner
// extensions; inner extensions expand first. Emits
// (do (struct Name cleaned...) inner-overrides... overrides...).
node_ptr expand_bare(const Extension& ext, Transformer& tx, const node_ptr& decl);

// Typed form (ext Type field...): emits (do overrides...) only.
node_ptr expand_typed(const Extension& ext, const list& form);

// Install the macro named ext->name() that dispatches to the two forms above.
void install_extension(Transformer& tx, ExtensionPtr ext);

} // namespace fieldmeta
