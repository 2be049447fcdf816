#pragma once

#include <courier/schema/primitives.hpp>
#include <courier/schema/step.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace courier::execution {

struct indexed_step final {
  std::size_t index{};
  courier::schema::step_t step;
};

/// Diagnostic view of one scanned step.
struct step_summary final {
  std::size_t index{};
  std::string kind;
  std::optional<courier::schema::selector_t> selector;
};

struct classified_steps final {
  std::optional<indexed_step> approval;
  std::optional<indexed_step> transfer;
  std::vector<step_summary> summaries;
};

/// Locate the approval and transfer calls of one route by selector.
///
/// The first approval-shaped and the first transfer-shaped step win; later
/// matches are ignored. A second approval ahead of the transfer step is
/// therefore never submitted. Steps with empty call data are not
/// classified. Every step is summarized regardless.
classified_steps classify(const std::vector<courier::schema::step_t>& steps);

}  // namespace courier::execution
