#include "fieldmeta/chain.hpp"

namespace fieldmeta {

ChainPlan assign_chain(const std::vector<std::string>& links, const std::vector<node_ptr>& written_values){
    ChainPlan plan;
    plan.assignments.resize(links.size());
    std::vector<node_ptr> remaining = written_values;
    for(size_t i = links.size(); i-- > 0;){
        plan.assignments[i].link = links[i];
        if(remaining.empty()) continue;
        plan.assignments[i].value = remaining.back();
        remaining.pop_back();
    }
    plan.residual = std::move(remaining);
    return plan;
}

} // namespace fieldmeta
