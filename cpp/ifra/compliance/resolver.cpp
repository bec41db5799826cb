#include "ifra/compliance/resolver.hpp"

#include <set>

namespace ifra {

ConstituentKind classify_constituent(const ReferenceData& data, std::string_view key) {
  ConstituentKind k;
  k.mapped_standard = data.is_mapped(key);
  k.decomposable = data.is_decomposable(key);
  return k;
}

Resolution ContributionResolver::resolve(std::string_view material_key, double concentration) const {
  Resolution out;

  const ContributionRecord* root = data_.find_contribution(material_key);
  if (!root) return out;

  struct WorkItem {
    const ContributionRecord* record;
    double concentration;
    int depth;
  };

  std::vector<WorkItem> stack;
  stack.push_back(WorkItem{root, concentration, 0});
  std::set<std::string> truncated;

  while (!stack.empty()) {
    const WorkItem item = stack.back();
    stack.pop_back();

    for (const auto& c : item.record->constituents) {
      const double absolute = item.concentration * (c.percent / 100.0);
      const ConstituentKind kind = classify_constituent(data_, c.key);

      if (kind.mapped_standard || kind.leaf()) {
        out.contributions[c.key] += absolute;
      }
      if (kind.decomposable) {
        if (item.depth + 1 <= max_depth_) {
          stack.push_back(WorkItem{data_.find_contribution(c.key), absolute, item.depth + 1});
        } else {
          truncated.insert(c.key);
        }
      }
    }
  }

  out.truncated.assign(truncated.begin(), truncated.end());
  return out;
}

} // namespace ifra
