// annotation.hpp - field declaration shapes and one-layer annotation peeling
#pragma once
#include "fieldmeta/edn.hpp"
#include <string>
#include <vector>

namespace fieldmeta {

// Field declaration forms:
//   a                      bare field
//   (: a T)                typed field
//   (= target expr)        field with an ordinary default; target is a or (: a T)
//   (| lhs value)          annotated field, chains nest on the left:
//                          (| (| (: a T) 1) 2) is `a: T | 1 | 2`
// With an ordinary default the chain lives on the right of `=`:
//   (= (: a T) (| (| 1 4) 9)) is `a: T = 1 | 4 | 9`.

// The reserved placeholder `_`: "no override at this position".
inline constexpr const char* kPlaceholder = "_";
bool is_placeholder(const node_ptr& value);

struct PeeledField {
    std::string name;
    node_ptr value;         // consumed chain value; null when !annotated
    bool annotated = false;
    node_ptr field;         // rewritten declaration, one layer thinner
    bool placeholder() const { return annotated && is_placeholder(value); }
};

// Base name of a field declaration of any of the shapes above.
std::string field_name(const node_ptr& field);

// Consume the outermost (rightmost written) chain value of one field.
// Non-annotated fields come back unchanged with annotated == false.
// Throws annotation_error for `|` forms that match neither surface shape.
PeeledField peel_annotation(const node_ptr& field);

// True if the field still carries at least one chain value.
bool has_annotation(const node_ptr& field);

// All chain values of a field, left to right as written.
std::vector<node_ptr> annotation_values(const node_ptr& field);

// The field with every annotation layer removed.
node_ptr strip_annotations(const node_ptr& field);

} // namespace fieldmeta
