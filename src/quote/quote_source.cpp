#include <courier/common/error.hpp>
#include <courier/quote/quote_source.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

using namespace courier::schema;

namespace courier::quote {

std::vector<route_t> select_routes(std::vector<route_t> routes,
                                   const std::string& prefix) {
  auto selected = std::vector<route_t>{};
  selected.reserve(routes.size());
  for (auto& route : routes) {
    if (route.id.starts_with(prefix)) {
      selected.push_back(std::move(route));
    } else {
      spdlog::debug("Ignoring route '{}'", route.id);
    }
  }
  if (selected.empty()) {
    throw courier::common::no_matching_route_error{
        fmt::format("no route matches prefix '{}' among {} quoted route(s)",
                    prefix, routes.size())};
  }
  spdlog::info("Selected {} of {} route(s) with prefix '{}'", selected.size(),
               routes.size(), prefix);
  return selected;
}

}  // namespace courier::quote
