#include "fieldmeta/builtin_kinds.hpp"
#include "fieldmeta/loader.hpp"

namespace fieldmeta {

namespace {

// A null default_src means the default is the field's own name.
struct BuiltinKind { const char* name; const char* default_src; };

const BuiltinKind kBuiltins[] = {
    { "default",     "nil" },
    { "units",       "1" },
    { "prior",       "nil" },
    { "description", "\"\"" },
    { "limits",      "[1e-7 1.0]" }, // just above zero so a log transform stays finite
    { "bounds",      "[1e-7 1.0]" },
    { "label",       nullptr },
    { "logscaled",   "false" },
    { "flattenable", "true" },
    { "plottable",   "true" },
    { "selectable",  "Nothing" },
};

} // namespace

const std::vector<std::string>& builtin_kind_names(){
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for(auto& k : kBuiltins) out.push_back(k.name);
        return out;
    }();
    return names;
}

void register_builtin_kinds(Loader& loader){
    for(auto& k : kBuiltins){
        if(k.default_src) loader.define_kind(k.name, parse_one(k.default_src));
        else loader.define_kind(k.name, [](const std::string&, const std::string& field){ return n_str(field); });
    }
}

} // namespace fieldmeta
