#pragma once
#include "fieldmeta/edn.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fieldmeta::surface {

struct ParseResult {
    bool success{false};
    std::vector<node_ptr> forms; // lowered top-level forms, in source order
    std::string error_message;   // If !success, human-readable message
    int line{0};
    int column{0};
};

class Parser {
public:
    // Parse schema surface text and lower it to declaration forms:
    //   @metadata name value              -> (defkind name value)
    //   @chain name @a @b                 -> (defchain name [a b])
    //   @a @b struct T { fields }         -> (a (b (struct T fields...)))
    //   @a T { fields }                   -> (a T fields...)
    //   struct T { fields }               -> (struct T fields...)
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;
};

} // namespace fieldmeta::surface
