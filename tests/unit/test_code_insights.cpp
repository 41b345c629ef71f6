// test_code_insights.cpp - Unit tests for advisory analysis

#include <catch2/catch_test_macros.hpp>
#include <codebox/code_insights.h>

#include <algorithm>

using namespace codebox;

TEST_CASE("Code Insights - Analysis", "[insights]") {
    SECTION("Counts lines and weighted keywords") {
        auto analysis = AnalyzeCode("for i in range(3):\n    if i:\n        print(i)");
        REQUIRE(analysis.lines == 3);
        REQUIRE(analysis.complexity_score == 3);  // for(2) + if(1)
    }

    SECTION("plt.show() is pointed out") {
        auto analysis = AnalyzeCode("import matplotlib.pyplot as plt\nplt.plot([1])\nplt.show()");
        REQUIRE(std::any_of(analysis.suggestions.begin(), analysis.suggestions.end(),
                            [](const std::string& s) { return s.find("plt.show()") != std::string::npos; }));
    }
}

TEST_CASE("Code Insights - Tips", "[insights]") {
    REQUIRE_FALSE(GetExecutionTips("import pandas as pd").empty());
    REQUIRE(GetExecutionTips("print(1)").empty());
}
