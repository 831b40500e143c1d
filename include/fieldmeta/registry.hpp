// registry.hpp - per-kind override tables, declared record types and accessors
#pragma once
#include "fieldmeta/edn.hpp"
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fieldmeta {

// Produces a kind's value for (type, field) when no override exists. Called
// on every unoverridden lookup; results are never cached.
using DefaultFn = std::function<node_ptr(const std::string& type, const std::string& field)>;

struct MetadataKind {
    std::string name;
    DefaultFn default_fn;
    node_ptr default_expr; // null for function-backed defaults
};

struct FieldInfo { std::string name; node_ptr type; node_ptr default_value; };

struct TypeInfo {
    std::string name;
    std::vector<FieldInfo> fields;  // declared order
    node_ptr declaration;           // cleaned (struct ...) form
    const FieldInfo* find(const std::string& field) const {
        for(auto& f : fields) if(f.name == field) return &f;
        return nullptr;
    }
};

struct OverrideBinding { std::string kind; std::string type; std::string field; node_ptr value; };

// A value of a declared record type. Metadata never lives here; only the
// ordinary field values do.
class Record {
public:
    Record(const TypeInfo& info, std::vector<node_ptr> values);
    const std::string& type_name() const { return type_; }
    const node_ptr& get(const std::string& field) const;
    void set(const std::string& field, node_ptr value);
    size_t size() const { return values_.size(); }
private:
    size_t index_of(const std::string& field) const;
    std::string type_;
    std::vector<std::string> names_;
    std::vector<node_ptr> values_;
};

// Customization point for Accessor::of: overload for host types in their own namespace.
inline const std::string& type_name_of(const Record& r){ return r.type_name(); }

class Registry {
public:
    enum class Phase { loading, frozen };

    // ---- load phase (throw registry_error once frozen) ----
    const MetadataKind& add_kind(std::string name, DefaultFn fn, node_ptr default_expr = nullptr);
    void declare_type(TypeInfo info);
    // Append/replace: one binding per (type, field, kind).
    void bind(const std::string& kind, const std::string& type, const std::string& field, node_ptr value);
    void freeze(){ phase_ = Phase::frozen; }

    Phase phase() const { return phase_; }
    bool frozen() const { return phase_ == Phase::frozen; }

    // ---- lookups ----
    bool has_kind(const std::string& name) const { return kinds_.count(name) != 0; }
    const MetadataKind& kind(const std::string& name) const;
    const TypeInfo* find_type(const std::string& name) const;
    const TypeInfo& type(const std::string& name) const;

    // Exact (type, field, kind) override if present, else the kind default.
    // Unknown fields of a declared type throw std::out_of_range.
    node_ptr get(const std::string& kind, const std::string& type, const std::string& field) const;
    // get() for every field of a declared type, in declared order.
    std::vector<node_ptr> all(const std::string& kind, const std::string& type) const;
    // The raw binding or null; no default fallback.
    node_ptr find_binding(const std::string& kind, const std::string& type, const std::string& field) const;
    // Bindings of one kind ordered by (type, field).
    std::vector<OverrideBinding> bindings(const std::string& kind) const;

    const std::vector<std::string>& kind_names() const { return kind_order_; }
    const std::vector<std::string>& type_names() const { return type_order_; }

    // Positional construction; missing trailing values fall back to ordinary defaults.
    Record make_record(const std::string& type, std::vector<node_ptr> args = {}) const;

private:
    void require_loading(const char* op) const;

    using FieldKey = std::pair<std::string, std::string>; // (type, field)
    Phase phase_ = Phase::loading;
    std::map<std::string, MetadataKind> kinds_;
    std::vector<std::string> kind_order_;
    std::map<std::string, TypeInfo> types_;
    std::vector<std::string> type_order_;
    std::map<std::string, std::map<FieldKey, node_ptr>> tables_;
};

// The accessor family of one kind.
class Accessor {
public:
    Accessor(const Registry& reg, std::string kind) : reg_(&reg), kind_(std::move(kind)) {}
    const std::string& kind() const { return kind_; }

    node_ptr operator()(const std::string& type, const std::string& field) const { return reg_->get(kind_, type, field); }
    std::vector<node_ptr> operator()(const std::string& type) const { return reg_->all(kind_, type); }

    template <typename Instance>
    node_ptr of(const Instance& x, const std::string& field) const { return (*this)(std::string(type_name_of(x)), field); }
    template <typename Instance>
    std::vector<node_ptr> of(const Instance& x) const { return (*this)(std::string(type_name_of(x))); }

private:
    const Registry* reg_;
    std::string kind_;
};

} // namespace fieldmeta
