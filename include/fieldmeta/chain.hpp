// chain.hpp - positional correspondence between chain links and written values
#pragma once
#include "fieldmeta/edn.hpp"
#include <string>
#include <vector>

namespace fieldmeta {

struct ChainAssignment {
    std::string link;
    node_ptr value; // null: no value left for this link, its default stays in force
};

struct ChainPlan {
    std::vector<ChainAssignment> assignments; // in listed link order
    std::vector<node_ptr> residual;           // written values no link consumed, left to right
};

// A chain runs its links in reverse listed order and every run peels the
// rightmost remaining value. The last listed link therefore takes the
// rightmost value and, when counts match, link i takes written value i.
// With fewer values than links the leading links get nothing; with more,
// the leftmost extra values are left behind as residual.
ChainPlan assign_chain(const std::vector<std::string>& links, const std::vector<node_ptr>& written_values);

} // namespace fieldmeta
