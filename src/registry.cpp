#include "fieldmeta/registry.hpp"
#include <stdexcept>

namespace fieldmeta {

Record::Record(const TypeInfo& info, std::vector<node_ptr> values) : type_(info.name), values_(std::move(values)) {
    names_.reserve(info.fields.size());
    for(auto& f : info.fields) names_.push_back(f.name);
    if(values_.size() != names_.size())
        throw std::invalid_argument("record of " + type_ + " needs " + std::to_string(names_.size()) + " values, got " + std::to_string(values_.size()));
}

size_t Record::index_of(const std::string& field) const {
    for(size_t i = 0; i < names_.size(); ++i) if(names_[i] == field) return i;
    throw std::out_of_range("type " + type_ + " has no field " + field);
}

const node_ptr& Record::get(const std::string& field) const { return values_[index_of(field)]; }
void Record::set(const std::string& field, node_ptr value){ values_[index_of(field)] = std::move(value); }

void Registry::require_loading(const char* op) const {
    if(frozen()) throw registry_error(std::string(op) + ": registry is frozen; metadata can only change during the load phase");
}

const MetadataKind& Registry::add_kind(std::string name, DefaultFn fn, node_ptr default_expr){
    require_loading("add_kind");
    if(!fn) throw std::invalid_argument("kind " + name + " needs a default");
    if(!kinds_.count(name)) kind_order_.push_back(name);
    auto& k = kinds_[name];
    k = MetadataKind{ name, std::move(fn), std::move(default_expr) };
    tables_[name]; // materialize an empty table
    return k;
}

void Registry::declare_type(TypeInfo info){
    require_loading("declare_type");
    if(!types_.count(info.name)) type_order_.push_back(info.name);
    auto key = info.name;
    types_[key] = std::move(info);
}

void Registry::bind(const std::string& kind, const std::string& type, const std::string& field, node_ptr value){
    require_loading("bind");
    auto it = tables_.find(kind);
    if(it == tables_.end()) throw std::out_of_range("unknown metadata kind " + kind);
    it->second[FieldKey{type, field}] = std::move(value);
}

const MetadataKind& Registry::kind(const std::string& name) const {
    auto it = kinds_.find(name);
    if(it == kinds_.end()) throw std::out_of_range("unknown metadata kind " + name);
    return it->second;
}

const TypeInfo* Registry::find_type(const std::string& name) const {
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : &it->second;
}

const TypeInfo& Registry::type(const std::string& name) const {
    if(auto* t = find_type(name)) return *t;
    throw std::out_of_range("unknown type " + name);
}

node_ptr Registry::find_binding(const std::string& kind, const std::string& type, const std::string& field) const {
    auto it = tables_.find(kind);
    if(it == tables_.end()) return nullptr;
    auto b = it->second.find(FieldKey{type, field});
    return b == it->second.end() ? nullptr : b->second;
}

node_ptr Registry::get(const std::string& kind, const std::string& type, const std::string& field) const {
    const MetadataKind& k = this->kind(kind);
    if(auto* t = find_type(type); t && !t->find(field))
        throw std::out_of_range("type " + type + " has no field " + field);
    if(auto v = find_binding(kind, type, field)) return clone(v);
    return k.default_fn(type, field);
}

std::vector<node_ptr> Registry::all(const std::string& kind, const std::string& type) const {
    const TypeInfo& t = this->type(type);
    std::vector<node_ptr> out;
    out.reserve(t.fields.size());
    for(auto& f : t.fields) out.push_back(get(kind, type, f.name));
    return out;
}

std::vector<OverrideBinding> Registry::bindings(const std::string& kind) const {
    std::vector<OverrideBinding> out;
    auto it = tables_.find(kind);
    if(it == tables_.end()) return out;
    for(auto& [key, value] : it->second) out.push_back(OverrideBinding{ kind, key.first, key.second, value });
    return out;
}

Record Registry::make_record(const std::string& type, std::vector<node_ptr> args) const {
    const TypeInfo& t = this->type(type);
    if(args.size() > t.fields.size())
        throw std::invalid_argument("too many values for " + type);
    for(size_t i = args.size(); i < t.fields.size(); ++i){
        auto& f = t.fields[i];
        if(!f.default_value) throw std::invalid_argument("no value for field " + f.name + " of " + type + " and no default");
        args.push_back(clone(f.default_value));
    }
    return Record(t, std::move(args));
}

} // namespace fieldmeta
