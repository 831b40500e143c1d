#include "parser.hpp"
#include "pegtl/prelude.hpp"
#include "pegtl/grammar.hpp"
#include "pegtl/actions/decls.hpp"
#include <tao/pegtl.hpp>

namespace fieldmeta::surface {
using namespace fieldmeta::surface::pegtl_front;
using namespace fieldmeta::surface::pegtl_front::grammar;
using namespace fieldmeta::surface::pegtl_front::actions;

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    ParseResult r; r.success = false;
    try {
        // Strip UTF-8 BOM if present
        std::string src_copy(src);
        if(src_copy.size() >= 3 && static_cast<unsigned char>(src_copy[0]) == 0xEF && static_cast<unsigned char>(src_copy[1]) == 0xBB && static_cast<unsigned char>(src_copy[2]) == 0xBF){
            src_copy.erase(0, 3);
        }
        tao::pegtl::memory_input in(src_copy, std::string(filename));
        build_state st;
        tao::pegtl::parse< module_rule, action >(in, st);
        r.success = true;
        r.forms = std::move(st.forms);
        return r;
    } catch (const tao::pegtl::parse_error& e) {
        r.success = false;
        r.error_message = e.what();
        if(!e.positions().empty()){
            const auto& p = e.positions().front();
            r.line = static_cast<int>(p.line);
            r.column = static_cast<int>(p.column);
        }
        return r;
    }
}

} // namespace fieldmeta::surface
