// Model parameters example: kinds, a chain, a typed block and accessor reads.
#include <iostream>
#include <string>
#include "fieldmeta/loader.hpp"

using namespace fieldmeta;

namespace sim {
// A host type the accessors can read through type_name_of.
struct Decay { double rate = 0.2; double halfLife = 3.5; };
inline std::string type_name_of(const Decay&){ return "Decay"; }
}

int main(){
    const char* src = R"EDN(
        (defkind default nil)
        (defkind bounds [1e-7 1.0])
        (defkind units 1)
        (defchain param [default bounds units])

        (param (struct Decay
          (= (: rate Float64) (| (| (| 0.2 0.25) [0.0 1.0]) "1/d"))
          (| (| (| (: halfLife Float64) 3.5) _) _)))

        (units Decay (| halfLife d))
    )EDN";

    LoaderEnv env{};
    Loader loader(env);
    auto res = loader.load_source(src);
    if(!res.success){
        for(const auto& d : res.diagnostics) std::cerr << d.code << ": " << d.message << "\n";
        return 1;
    }
    loader.freeze();
    for(const auto& f : res.expanded) std::cout << to_pretty_string(f) << "\n";

    auto bounds = loader.accessor("bounds");
    auto units = loader.accessor("units");
    sim::Decay d;
    std::cout << "bounds(rate) = " << to_string(bounds.of(d, "rate")) << "\n";
    std::cout << "units(Decay) =";
    for(const auto& u : units.of(d)) std::cout << " " << to_string(u);
    std::cout << "\n";
    return 0;
}
