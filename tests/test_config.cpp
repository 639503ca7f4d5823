#include "gtest/gtest.h"

#include "fluxed/config.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

using namespace fluxed;

TEST(RunParams, Defaults) {
    RunParams p;
    EXPECT_EQ(p.mode, "match");
    EXPECT_EQ(p.source_dist, "normal2d");
    EXPECT_EQ(p.target_dist, "linear1d");
    EXPECT_EQ(p.seed, 15u);

    MatchOptions o = p.match_options();
    EXPECT_DOUBLE_EQ(o.minimize.gtol, 1e-5);
    EXPECT_EQ(o.minimize.max_iterations, 15000);
    EXPECT_EQ(o.restarts, 0);
}

TEST(RunParams, SetParam) {
    RunParams p;
    EXPECT_TRUE(p.set_param("ftol", "1e-9"));
    EXPECT_TRUE(p.set_param("restarts", "4"));
    EXPECT_TRUE(p.set_param("seed", "99"));
    EXPECT_TRUE(p.set_param("disp", "true"));
    EXPECT_TRUE(p.set_param("target_shape", "box:3x3"));
    EXPECT_DOUBLE_EQ(p.ftol, 1e-9);
    EXPECT_EQ(p.restarts, 4);
    EXPECT_EQ(p.seed, 99u);
    EXPECT_TRUE(p.disp);
    EXPECT_EQ(p.target_shape, "box:3x3");

    MatchOptions o = p.match_options();
    EXPECT_DOUBLE_EQ(o.minimize.ftol, 1e-9);
    EXPECT_TRUE(o.minimize.disp);
    EXPECT_EQ(o.restarts, 4);
    EXPECT_EQ(o.seed, 99u);

    EXPECT_FALSE(p.set_param("no_such_key", "1"));
    EXPECT_THROW(p.set_param("restarts", "four"), std::invalid_argument);
    EXPECT_THROW(p.set_param("restarts", "4.5"), std::invalid_argument);
    EXPECT_THROW(p.set_param("gtol", "1e-5x"), std::invalid_argument);
    EXPECT_THROW(p.set_param("mode", "fit"), std::invalid_argument);
    EXPECT_TRUE(p.set_param("mode", "flux"));
    EXPECT_EQ(p.mode, "flux");
}

TEST(RunParams, LoadsBundledExample) {
    RunParams p;
    std::string dir = FLUXED_CONFIG_DIR;
    ASSERT_TRUE(p.load_from_file(dir + "/donut_to_cube.params"));
    EXPECT_EQ(p.mode, "match");
    EXPECT_EQ(p.source_shape, "donut7.shape");
    EXPECT_EQ(p.target_shape, "box:5x5x5");
    EXPECT_EQ(p.fit_params, "slope, intercept");
    EXPECT_DOUBLE_EQ(p.ftol, 1e-9);
    EXPECT_EQ(p.base_dir, dir);
    EXPECT_EQ(p.resolve_path(p.source_shape), dir + "/donut7.shape");
    EXPECT_EQ(p.resolve_path(p.target_shape), "box:5x5x5");
    EXPECT_EQ(p.resolve_path("/abs/shape"), "/abs/shape");
}

TEST(RunParams, LoadWarnsOnUnknownAndFailsOnBadValues) {
    std::string path = testing::TempDir() + "fluxed_bad.params";
    {
        std::ofstream f(path);
        f << "# header\n"
          << "colour = blue\n"
          << "restarts = 2\n";
    }
    RunParams p;
    testing::internal::CaptureStderr();
    EXPECT_TRUE(p.load_from_file(path));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("colour"), std::string::npos) << err;
    EXPECT_EQ(p.restarts, 2);

    {
        std::ofstream f(path);
        f << "restarts = many\n";
    }
    testing::internal::CaptureStderr();
    EXPECT_FALSE(p.load_from_file(path));
    testing::internal::GetCapturedStderr();

    testing::internal::CaptureStderr();
    EXPECT_FALSE(p.load_from_file(path + ".missing"));
    testing::internal::GetCapturedStderr();
}

TEST(Parsers, Doubles) {
    EXPECT_DOUBLE_EQ(parse_double(" 2.5 "), 2.5);
    EXPECT_TRUE(std::isinf(parse_double("inf")));
    EXPECT_LT(parse_double("-inf"), 0.0);
    EXPECT_THROW(parse_double("abc"), std::invalid_argument);
    EXPECT_THROW(parse_double("1.0.0"), std::invalid_argument);
    EXPECT_THROW(parse_double(""), std::invalid_argument);

    EXPECT_EQ(parse_doubles("0.0, 1.0"), (std::vector<double>{0.0, 1.0}));
    EXPECT_TRUE(parse_doubles("  ").empty());
    EXPECT_THROW(parse_doubles("1,,2"), std::invalid_argument);
}

TEST(Parsers, NamesAndAxes) {
    EXPECT_EQ(parse_names("slope, intercept"), (std::vector<std::string>{"slope", "intercept"}));
    EXPECT_THROW(parse_names("slope,"), std::invalid_argument);

    EXPECT_EQ(parse_axes("2"), (std::vector<std::size_t>{2}));
    EXPECT_EQ(parse_axes("1, 0"), (std::vector<std::size_t>{1, 0}));
    EXPECT_TRUE(parse_axes("").empty());
    EXPECT_THROW(parse_axes("-1"), std::invalid_argument);
    EXPECT_THROW(parse_axes("1.5"), std::invalid_argument);
    EXPECT_THROW(parse_axes("inf"), std::invalid_argument);
}

TEST(Parsers, Parameters) {
    ParameterList p = parse_parameters("mean_x=1.5, mean_y = 4.5");
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0].first, "mean_x");
    EXPECT_DOUBLE_EQ(p[0].second, 1.5);
    EXPECT_EQ(p[1].first, "mean_y");
    EXPECT_DOUBLE_EQ(p[1].second, 4.5);

    EXPECT_TRUE(parse_parameters("").empty());
    EXPECT_THROW(parse_parameters("mean_x"), std::invalid_argument);
    EXPECT_THROW(parse_parameters("=1"), std::invalid_argument);
}

TEST(Parsers, Bounds) {
    std::vector<Bound> b = parse_bounds("0.001:none; -10.0:10.0; :5; None:");
    ASSERT_EQ(b.size(), 4u);
    EXPECT_DOUBLE_EQ(b[0].lower, 0.001);
    EXPECT_TRUE(std::isinf(b[0].upper));
    EXPECT_DOUBLE_EQ(b[1].lower, -10.0);
    EXPECT_DOUBLE_EQ(b[1].upper, 10.0);
    EXPECT_EQ(b[2].lower, -std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(b[2].upper, 5.0);
    EXPECT_TRUE(std::isinf(b[3].lower));
    EXPECT_TRUE(std::isinf(b[3].upper));

    EXPECT_TRUE(parse_bounds("").empty());
    EXPECT_THROW(parse_bounds("1"), std::invalid_argument);
    EXPECT_THROW(parse_bounds("2:1"), std::invalid_argument);
}

TEST(Parsers, Coordinates) {
    Coordinates c = parse_coordinates("index; linspace:100:200; arange:1:0.5; values:7,8",
                                      {3, 5, 4, 2});
    ASSERT_EQ(c.size(), 4u);
    EXPECT_EQ(c[0], (Axis{0, 1, 2}));
    EXPECT_DOUBLE_EQ(c[1][1], 125.0);
    EXPECT_DOUBLE_EQ(c[1][4], 200.0);
    EXPECT_EQ(c[2], (Axis{1.0, 1.5, 2.0, 2.5}));
    EXPECT_EQ(c[3], (Axis{7, 8}));

    EXPECT_TRUE(parse_coordinates("", {3}).empty());
    EXPECT_THROW(parse_coordinates("index", {3, 3}), std::invalid_argument);
    EXPECT_THROW(parse_coordinates("values:1,2", {3}), std::invalid_argument);
    EXPECT_THROW(parse_coordinates("logspace:1:2", {3}), std::invalid_argument);
    EXPECT_THROW(parse_coordinates("linspace:1", {3}), std::invalid_argument);
}
