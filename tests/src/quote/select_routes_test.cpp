#include <gtest/gtest.h>
#include <courier/common/error.hpp>
#include <courier/quote/quote_source.hpp>
#include <courier/testing/common.hpp>

using courier::testing::make_route;

TEST(select_routes, keeps_prefixed_routes_in_order) {
  auto routes = std::vector<courier::schema::route_t>{
      make_route("stargate/v2/taxi", {}), make_route("aori/v1", {}),
      make_route("stargate/v2/bus", {}), make_route("xstargate/", {})};

  auto selected = courier::quote::select_routes(routes, "stargate/");

  ASSERT_EQ(selected.size(), 2u);
  EXPECT_EQ(selected[0].id, "stargate/v2/taxi");
  EXPECT_EQ(selected[1].id, "stargate/v2/bus");
}

TEST(select_routes, no_match_is_an_error) {
  auto routes =
      std::vector<courier::schema::route_t>{make_route("aori/v1", {})};
  EXPECT_THROW(courier::quote::select_routes(routes, "stargate/"),
               courier::common::no_matching_route_error);
  EXPECT_THROW(courier::quote::select_routes({}, "stargate/"),
               courier::common::no_matching_route_error);
}
