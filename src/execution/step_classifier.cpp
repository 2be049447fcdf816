#include <courier/execution/step_classifier.hpp>
#include <courier/schema/selector.hpp>

using namespace courier::schema;

namespace courier::execution {

classified_steps classify(const std::vector<step_t>& steps) {
  auto result = classified_steps{};
  result.summaries.reserve(steps.size());
  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto& step = steps[i];
    auto selector = selector_of(step.transaction.data);
    result.summaries.push_back(
        step_summary{.index = i, .kind = step.kind, .selector = selector});
    if (step.transaction.data.empty() || !selector) {
      continue;
    }
    if (*selector == kApproveSelector && !result.approval) {
      result.approval = indexed_step{.index = i, .step = step};
    } else if (*selector == kTransferSelector && !result.transfer) {
      result.transfer = indexed_step{.index = i, .step = step};
    }
  }
  return result;
}

}  // namespace courier::execution
