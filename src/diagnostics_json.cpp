#include "fieldmeta/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace fieldmeta {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostics_to_json(const LoadResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")
      <<",\"forms\":"<<r.expanded.size()
      <<",\"errors\":[";
    for(size_t i=0;i<r.diagnostics.size(); ++i){
        const auto &d=r.diagnostics[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const LoadResult& r, const LoaderEnv& env){
    if(!env.diagJson) return;
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace fieldmeta
