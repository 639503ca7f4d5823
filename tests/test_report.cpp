#include "gtest/gtest.h"

#include "fluxed/report.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace fluxed;

TEST(Report, FormatParameters) {
    EXPECT_EQ(format_parameters({{"slope", 2.0}, {"intercept", 0.5}}), "slope=2;intercept=0.5");
    EXPECT_EQ(format_parameters({}), "");
}

TEST(Report, ShapeSummary) {
    std::ostringstream os;
    print_shape_summary(os, "target", NdShape::hollow_box({5, 5, 5}));
    EXPECT_EQ(os.str(),
              "target: dims=3 extents=5x5x5 border=98 enclosed=27 regions=1 closed=yes\n");
}

TEST(Report, MatchResultMentionsParameters) {
    MatchResult r;
    r.success = true;
    r.message = "CONVERGENCE: NORM_OF_PROJECTED_GRADIENT_<=_PGTOL";
    r.parameters = {{"value", 1.25}};
    std::ostringstream os;
    print_match_result(os, r);
    EXPECT_NE(os.str().find("success=true"), std::string::npos) << os.str();
    EXPECT_NE(os.str().find("parameters: value=1.25"), std::string::npos) << os.str();
}

TEST(Report, CsvWritesHeaderOnce) {
    std::string path = testing::TempDir() + "fluxed_results.csv";
    std::remove(path.c_str());

    MatchResult m;
    m.success = true;
    m.final_flux = 32.0;
    m.iterations = 3;
    m.evaluations = 11;
    m.parameters = {{"value", 1.5}};

    ResultRow flux_row;
    flux_row.mode = "flux";
    flux_row.source_shape = "donut7.shape";
    flux_row.source_flux = 16.0;

    ResultRow match_row = flux_row;
    match_row.mode = "match";
    match_row.target_shape = "box:5x5x5";
    match_row.target_dist = "uniform";
    match_row.match = &m;

    ASSERT_TRUE(append_result_csv(path, flux_row));
    ASSERT_TRUE(append_result_csv(path, match_row));

    std::ifstream f(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(f, line)) lines.push_back(line);
    f.close();
    std::remove(path.c_str());

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].rfind("mode,source_shape,", 0), 0u);
    EXPECT_EQ(lines[1], "flux,donut7.shape,,,16,,,,,,");
    EXPECT_EQ(lines[2], "match,donut7.shape,box:5x5x5,uniform,16,32,0,1,3,11,value=1.5");
}
