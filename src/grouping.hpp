#pragma once
#include <torch/torch.h>
#include <map>
#include <string>
#include <vector>

#include "decomposition.hpp"

namespace ssa {

// Group name -> 1-based eigentriple indices
using GroupSpec = std::map<std::string, std::vector<int64_t>>;

class ValidatedGrouping;

ValidatedGrouping group(const Decomposition& decomposition, const GroupSpec& spec);

// A GroupSpec checked against a decomposition of rank d. Indices are stored
// 0-based, deduplicated, in first-occurrence order. Only group() builds one.
class ValidatedGrouping {
public:
    int64_t rank() const { return rank_; }
    const std::map<std::string, std::vector<int64_t>>& groups() const { return groups_; }

    // 0-based indices of one group as a kLong tensor, for index_select
    torch::Tensor indices(const std::string& name) const;

private:
    friend ValidatedGrouping group(const Decomposition& decomposition, const GroupSpec& spec);

    ValidatedGrouping(int64_t rank, std::map<std::string, std::vector<int64_t>> groups)
        : rank_(rank), groups_(std::move(groups)) {}

    int64_t rank_;
    std::map<std::string, std::vector<int64_t>> groups_;
};

// group(): check every index lies in [1, d]. Throws IndexOutOfRange naming
// the group and the offending index. Groups may overlap.

// 1-based indices used by no group, ascending. Nothing calls this implicitly.
std::vector<int64_t> residual_indices(const Decomposition& decomposition, const GroupSpec& spec);

}
