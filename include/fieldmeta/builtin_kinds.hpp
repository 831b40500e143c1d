// builtin_kinds.hpp - the standard metadata kinds shipped with the library
#pragma once
#include <string>
#include <vector>

namespace fieldmeta {

class Loader;

// Names of the standard kinds, in registration order.
const std::vector<std::string>& builtin_kind_names();

// Define every standard kind on `loader`. Throws chain_error (E0203) if one of
// the names is already taken.
void register_builtin_kinds(Loader& loader);

} // namespace fieldmeta
