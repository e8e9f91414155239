#include "grouping.hpp"
#include "utils.hpp"
#include <algorithm>
#include <string>

namespace ssa {

torch::Tensor ValidatedGrouping::indices(const std::string& name) const {
    auto it = groups_.find(name);
    if (it == groups_.end()) {
        throw SsaError("No such group: " + name);
    }
    const std::vector<int64_t>& idx = it->second;
    return torch::tensor(at::ArrayRef<int64_t>(idx), utils::index_options());
}

ValidatedGrouping group(const Decomposition& decomposition, const GroupSpec& spec) {
    int64_t d = decomposition.rank();
    std::map<std::string, std::vector<int64_t>> checked;

    for (auto const& [name, members] : spec) {
        std::vector<int64_t> zero_based;
        zero_based.reserve(members.size());

        for (int64_t index : members) {
            if (index < 1 || index > d) {
                throw IndexOutOfRange("Group '" + name + "': index " + std::to_string(index) +
                                      " outside [1, " + std::to_string(d) + "]");
            }
            // Set semantics: a repeated index would be counted twice
            if (std::find(zero_based.begin(), zero_based.end(), index - 1) == zero_based.end()) {
                zero_based.push_back(index - 1);
            }
        }
        checked.emplace(name, std::move(zero_based));
    }

    return ValidatedGrouping(d, std::move(checked));
}

std::vector<int64_t> residual_indices(const Decomposition& decomposition, const GroupSpec& spec) {
    ValidatedGrouping grouping = group(decomposition, spec);

    std::vector<bool> used(static_cast<size_t>(grouping.rank()), false);
    for (auto const& entry : grouping.groups()) {
        for (int64_t c : entry.second) used[static_cast<size_t>(c)] = true;
    }

    std::vector<int64_t> residual;
    for (int64_t c = 0; c < grouping.rank(); ++c) {
        if (!used[static_cast<size_t>(c)]) residual.push_back(c + 1);
    }
    return residual;
}

}
