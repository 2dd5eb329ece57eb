#include "replay_planner.hpp"

#include <algorithm>
#include <map>

#include "internal/util/errors.hpp"

namespace pgshadow::replay {

ReplayPlan PlanBatch(std::vector<model::ChangeRecord> records) {
  std::sort(records.begin(), records.end(),
            [](const model::ChangeRecord& a, const model::ChangeRecord& b) { return a.seq < b.seq; });

  ReplayPlan plan;
  plan.consumed = records.size();

  // key -> index of its latest record
  std::map<std::string, std::size_t> latest;
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& r = records[i];
    plan.max_seq  = std::max(plan.max_seq, r.seq);

    if (r.op == model::ChangeOp::kTruncate) {
      plan.truncate = true;
      latest.clear();
      continue;
    }
    latest[r.key] = i;
  }

  // keep seq order so the statements read naturally in server logs
  std::vector<std::size_t> order;
  order.reserve(latest.size());
  for (const auto& [key, index] : latest) order.push_back(index);
  std::sort(order.begin(), order.end());

  for (auto index : order) {
    const auto& r = records[index];
    if (r.op == model::ChangeOp::kDelete) {
      plan.delete_keys.push_back(r.key);
      continue;
    }
    if (!r.row_image) {
      throw util::ValidationError("change record " + std::to_string(r.seq) + " has no row image");
    }
    plan.upsert_images.push_back(*r.row_image);
  }
  return plan;
}

std::string JsonArrayOf(const std::vector<std::string>& elements) {
  std::string out = "[";
  for (std::size_t i = 0; i < elements.size(); ++i) {
    if (i > 0) out += ",";
    out += elements[i];
  }
  return out + "]";
}

} // namespace pgshadow::replay
