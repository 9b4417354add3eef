#include <catch2/catch_all.hpp>
#include <quiver/filter_eval.hpp>
#include <quiver/filter_expr.hpp>

using namespace quiver;

TEST_CASE("filter eval basic semantics", "[filter]"){
  Attributes a1{{"color", std::string("red")}, {"shape", std::string("circle")}, {"price", 9.99}};
  Attributes a2{{"color", std::string("blue")}, {"price", 5.0}};

  filter_expr t_red{ term{"color", std::string("red")} };
  filter_expr t_blue{ term{"color", std::string("blue")} };
  filter_expr r_mid{ range{"price", 6.0, 10.0} };
  filter_expr both{ filter_expr::and_t{ {t_red, r_mid} } };
  filter_expr any{ filter_expr::or_t{ {t_red, t_blue} } };
  filter_expr none{ filter_expr::not_t{ {t_red, t_blue} } };
  filter_expr empty_and{ filter_expr::and_t{ { } } };
  filter_expr empty_or{ filter_expr::or_t{ { } } };
  filter_expr empty_not{ filter_expr::not_t{ { } } };

  REQUIRE(filter_eval::matches(t_red, a1));
  REQUIRE_FALSE(filter_eval::matches(t_red, a2));
  REQUIRE(filter_eval::matches(r_mid, a1));
  REQUIRE_FALSE(filter_eval::matches(r_mid, a2));
  REQUIRE(filter_eval::matches(both, a1));
  REQUIRE(filter_eval::matches(any, a1));
  REQUIRE_FALSE(filter_eval::matches(none, a1));
  REQUIRE(filter_eval::matches(empty_and, a2));
  REQUIRE_FALSE(filter_eval::matches(empty_or, a2));
  REQUIRE(filter_eval::matches(empty_not, a2));
}

TEST_CASE("filter terms compare typed values", "[filter]"){
  Attributes attrs{{"year", std::int64_t{2021}}, {"score", 0.5}, {"active", true}, {"name", std::string("2021")}};

  REQUIRE(filter_eval::matches(filter_expr{ term{"year", std::int64_t{2021}} }, attrs));
  REQUIRE(filter_eval::matches(filter_expr{ term{"year", 2021.0} }, attrs));
  REQUIRE_FALSE(filter_eval::matches(filter_expr{ term{"year", std::string("2021")} }, attrs));
  REQUIRE(filter_eval::matches(filter_expr{ term{"active", true} }, attrs));
  REQUIRE_FALSE(filter_eval::matches(filter_expr{ term{"active", false} }, attrs));
  REQUIRE(filter_eval::matches(filter_expr{ term{"name", std::string("2021")} }, attrs));

  // Missing fields and non-numeric values never satisfy a range.
  REQUIRE_FALSE(filter_eval::matches(filter_expr{ range{"missing", 0.0, 1.0} }, attrs));
  REQUIRE_FALSE(filter_eval::matches(filter_expr{ range{"name", 0.0, 5000.0} }, attrs));
  REQUIRE(filter_eval::matches(filter_expr{ range{"year", 2021.0, 2021.0} }, attrs));
  REQUIRE(filter_eval::matches(filter_expr{ range{"score", 0.0, 0.5} }, attrs));
}

TEST_CASE("apply_filter keeps matching ids in order", "[filter]"){
  Attributes red{{"color", std::string("red")}};
  Attributes blue{{"color", std::string("blue")}};
  std::vector<filter_eval::id_view> recs{ {1, &red}, {2, &blue}, {3, &red} };

  filter_expr t_red{ term{"color", std::string("red")} };
  REQUIRE(filter_eval::apply_filter(&t_red, recs) == std::vector<std::uint64_t>{1, 3});
  REQUIRE(filter_eval::apply_filter(nullptr, recs) == std::vector<std::uint64_t>{1, 2, 3});
}
