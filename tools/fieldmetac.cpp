#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "fieldmeta/loader.hpp"
#include "fieldmeta/builtin_kinds.hpp"
#include "fieldmeta/diagnostics_json.hpp"
#include "../languages/surface/parser/parser.hpp"

using namespace fieldmeta;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

static void usage(){
    std::cerr << "usage: fieldmetac <schema-file> [--surface] [--builtin] [--get kind type field]... [--all kind type]...\n";
}

static void report(const LoadResult& r, const std::string& file){
    for(auto& d : r.diagnostics){
        std::cerr << file << ":" << d.line << ":" << d.col << ": " << d.code << ": " << d.message << "\n";
        if(!d.hint.empty()) std::cerr << "  hint: " << d.hint << "\n";
    }
}

int main(int argc, char** argv){
    if(argc<2){ usage(); return 1; }
    std::string file = argv[1];
    bool surfaceSyntax = file.size() > 3 && file.compare(file.size()-3, 3, ".fm") == 0;
    LoaderEnv env = detect_env();
    struct Query { bool all; std::string kind, type, field; };
    std::vector<Query> queries;
    for(int i=2;i<argc;++i){
        std::string a = argv[i];
        if(a=="--surface") surfaceSyntax = true;
        else if(a=="--builtin") env.builtinKinds = true;
        else if(a=="--get" && i+3<argc){ queries.push_back({false, argv[i+1], argv[i+2], argv[i+3]}); i+=3; }
        else if(a=="--all" && i+2<argc){ queries.push_back({true, argv[i+1], argv[i+2], ""}); i+=2; }
        else { usage(); return 1; }
    }
    std::ifstream probe(file);
    if(!probe){ std::cerr << "failed to read file " << file << "\n"; return 1; }
    std::string src = read_file(file);

    Loader loader(env);
    LoadResult res;
    if(surfaceSyntax){
        surface::Parser parser;
        auto pr = parser.parse_string(src, file);
        if(!pr.success){
            res.success = false;
            res.diagnostics.push_back(Diagnostic{ "E0001", pr.error_message, "", pr.line, pr.column });
            maybe_print_json(res, env);
        } else {
            res = loader.load_forms(pr.forms);
        }
    } else {
        res = loader.load_source(src);
    }
    if(!res.success){ report(res, file); return 2; }
    loader.freeze();

    if(queries.empty()){
        for(auto& f : res.expanded) std::cout << to_pretty_string(f) << "\n";
        return 0;
    }
    try {
        for(auto& q : queries){
            if(q.all){
                auto values = loader.accessor(q.kind)(q.type);
                std::cout << q.kind << " " << q.type << " =";
                for(auto& v : values) std::cout << " " << to_string(v);
                std::cout << "\n";
            } else {
                std::cout << q.kind << " " << q.type << "." << q.field << " = " << to_string(loader.accessor(q.kind)(q.type, q.field)) << "\n";
            }
        }
    } catch(const std::out_of_range& e){
        std::cerr << "lookup failed: " << e.what() << "\n";
        return 3;
    }
    return 0;
}
