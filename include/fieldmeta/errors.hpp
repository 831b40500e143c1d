// Exception hierarchy for declaration-time failures.
#pragma once
#include <stdexcept>
#include <string>

namespace fieldmeta {

// Every declaration-time failure carries a stable code (E0xxx) and, when the
// offending form came from the reader, its source position.
struct error : std::runtime_error {
    std::string code;
    int line = -1;
    int col = -1;
    error(std::string c, const std::string& msg, int l = -1, int cl = -1)
        : std::runtime_error(msg), code(std::move(c)), line(l), col(cl) {}
};

struct parse_error : error {
    explicit parse_error(const std::string& msg, int l = -1, int cl = -1) : error("E0001", msg, l, cl) {}
};

// Malformed annotated declaration (Annotation Parser / load-phase shape checks).
struct annotation_error : error {
    using error::error;
};

// Extension definition failures (defkind / defchain).
struct chain_error : error {
    using error::error;
};

// Mutation attempted after Registry::freeze().
struct registry_error : error {
    explicit registry_error(const std::string& msg) : error("E0300", msg) {}
};

} // namespace fieldmeta
