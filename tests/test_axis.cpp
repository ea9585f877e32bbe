//=============================================================================
// tests/test_axis.cpp - Concrete axis types and generic attribute access
//=============================================================================

#include "histax_test_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>

using namespace histax;
using namespace histax::testing;

//=============================================================================
// Regular
//=============================================================================

TEST(RegularAxis, SizeAndExtent) {
    axis::Regular a(10, 0.0, 1.0);
    EXPECT_EQ(a.size(), 10);
    EXPECT_EQ(a.extent(), 12);

    axis::Regular no_flow(10, 0.0, 1.0, {false, false});
    EXPECT_EQ(no_flow.extent(), 10);

    axis::Regular under_only(10, 0.0, 1.0, {true, false});
    EXPECT_EQ(under_only.extent(), 11);
}

TEST(RegularAxis, EdgesCentersWidths) {
    axis::Regular a(4, 0.0, 2.0);

    EXPECT_EQ(a.edges(), (std::vector<double>{0.0, 0.5, 1.0, 1.5, 2.0}));
    EXPECT_EQ(a.centers(), (std::vector<double>{0.25, 0.75, 1.25, 1.75}));
    EXPECT_EQ(a.widths(), (std::vector<double>{0.5, 0.5, 0.5, 0.5}));
}

TEST(RegularAxis, ValueInterpolatesAndSaturates) {
    axis::Regular a(4, 0.0, 2.0);
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_DOUBLE_EQ(AsDouble(a.value(0.5)), 0.25);
    EXPECT_DOUBLE_EQ(AsDouble(a.value(4)), 2.0);
    EXPECT_EQ(AsDouble(a.value(-1)), -inf);
    EXPECT_EQ(AsDouble(a.value(5)), inf);
}

TEST(RegularAxis, BinIsInterval) {
    axis::Regular a(4, 0.0, 2.0);

    EXPECT_EQ(std::get<Interval>(a.bin(1)), (Interval{0.5, 1.0}));
    EXPECT_EQ(std::get<Interval>(a.bin(-1)).upper, 0.0);
    EXPECT_THROW(a.bin(5), IndexError);

    axis::Regular no_flow(4, 0.0, 2.0, {false, false});
    EXPECT_THROW(no_flow.bin(-1), IndexError);
    EXPECT_THROW(no_flow.bin(4), IndexError);
}

TEST(RegularAxis, IndexMapsFlowBins) {
    axis::Regular a(4, 0.0, 2.0);

    EXPECT_EQ(a.index(make_coordinate(0.0)), 0);
    EXPECT_EQ(a.index(make_coordinate(1.9)), 3);
    EXPECT_EQ(a.index(make_coordinate(-0.1)), -1);
    EXPECT_EQ(a.index(make_coordinate(2.0)), 4);
    EXPECT_EQ(a.index(make_coordinate(std::nan(""))), 4);
    EXPECT_THROW(a.index(make_coordinate("x")), TypeError);
}

TEST(RegularAxis, RejectsBadConstruction) {
    EXPECT_THROW(axis::Regular(0, 0.0, 1.0), ValueError);
    EXPECT_THROW(axis::Regular(3, 1.0, 1.0), ValueError);
    EXPECT_THROW(
        axis::Regular(3, 0.0, std::numeric_limits<double>::infinity()),
        ValueError);
}

TEST(RegularAxis, Repr) {
    axis::Regular a(3, 0.0, 3.0);
    EXPECT_EQ(a.repr(), "Regular(3, 0, 3)");

    a.set_label("x");
    EXPECT_EQ(a.repr(), "Regular(3, 0, 3, label='x')");

    axis::Regular b(2, 0.0, 1.0, {true, false});
    EXPECT_EQ(b.repr(), "Regular(2, 0, 1, overflow=False)");
}

//=============================================================================
// Variable
//=============================================================================

TEST(VariableAxis, NonUniformBins) {
    axis::Variable a({0.0, 1.0, 3.0, 6.0});

    EXPECT_EQ(a.size(), 3);
    EXPECT_EQ(a.widths(), (std::vector<double>{1.0, 2.0, 3.0}));
    EXPECT_EQ(a.centers(), (std::vector<double>{0.5, 2.0, 4.5}));
    EXPECT_DOUBLE_EQ(AsDouble(a.value(1.5)), 2.0);
    EXPECT_DOUBLE_EQ(AsDouble(a.value(3)), 6.0);
    EXPECT_EQ(std::get<Interval>(a.bin(2)), (Interval{3.0, 6.0}));
}

TEST(VariableAxis, ValueOfNaNIsNaN) {
    axis::Variable a({0.0, 1.0, 3.0});
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_TRUE(std::isnan(AsDouble(a.value(nan))));

    AxesTuple axes{std::make_shared<axis::Regular>(2, 0.0, 1.0),
                   std::make_shared<axis::Variable>(
                       std::vector<double>{0.0, 1.0, 3.0})};
    auto v = axes.value(nan, nan);
    EXPECT_TRUE(std::isnan(AsDouble(v[0])));
    EXPECT_TRUE(std::isnan(AsDouble(v[1])));
}

TEST(VariableAxis, Index) {
    axis::Variable a({0.0, 1.0, 3.0, 6.0});

    EXPECT_EQ(a.index(make_coordinate(-1.0)), -1);
    EXPECT_EQ(a.index(make_coordinate(0.0)), 0);
    EXPECT_EQ(a.index(make_coordinate(2.5)), 1);
    EXPECT_EQ(a.index(make_coordinate(6.0)), 3);
    EXPECT_EQ(a.index(make_coordinate(100)), 3);
}

TEST(VariableAxis, RejectsBadEdges) {
    EXPECT_THROW(axis::Variable({1.0}), ValueError);
    EXPECT_THROW(axis::Variable({0.0, 2.0, 1.0}), ValueError);
    EXPECT_THROW(axis::Variable({0.0, 0.0}), ValueError);
}

//=============================================================================
// Integer
//=============================================================================

TEST(IntegerAxis, OneBinPerInteger) {
    axis::Integer a(-2, 3);

    EXPECT_EQ(a.size(), 5);
    EXPECT_EQ(a.extent(), 7);
    EXPECT_EQ(a.widths(), (std::vector<double>(5, 1.0)));
    EXPECT_DOUBLE_EQ(AsDouble(a.value(0)), -2.0);
    EXPECT_EQ(std::get<int64_t>(a.bin(4)), 2);
}

TEST(IntegerAxis, Index) {
    axis::Integer a(-2, 3);

    EXPECT_EQ(a.index(make_coordinate(-2)), 0);
    EXPECT_EQ(a.index(make_coordinate(0.7)), 2);
    EXPECT_EQ(a.index(make_coordinate(-3)), -1);
    EXPECT_EQ(a.index(make_coordinate(3)), 5);
    EXPECT_THROW(axis::Integer(1, 1), ValueError);
}

TEST(IntegerAxis, RejectsSpanWiderThanInt) {
    const int lo = std::numeric_limits<int>::min();
    const int hi = std::numeric_limits<int>::max();

    EXPECT_THROW(axis::Integer(lo, hi), ValueError);
    EXPECT_THROW(axis::Integer(-1, hi), ValueError);

    axis::Integer top(hi - 3, hi);
    EXPECT_EQ(top.size(), 3);
    EXPECT_EQ(top.extent(), 5);
    EXPECT_EQ(top.edges().back(), static_cast<double>(hi));
}

//=============================================================================
// Category
//=============================================================================

TEST(CategoryAxis, StringCategories) {
    axis::StrCategory a({"red", "green", "blue"});

    EXPECT_EQ(a.kind(), "StrCategory");
    EXPECT_EQ(a.size(), 3);
    EXPECT_EQ(a.extent(), 4);
    EXPECT_FALSE(a.underflow());
    EXPECT_EQ(std::get<std::string>(a.value(1)), "green");
    EXPECT_EQ(std::get<std::string>(a.bin(2)), "blue");
    EXPECT_EQ(a.index(make_coordinate("blue")), 2);
    EXPECT_EQ(a.index(make_coordinate("purple")), 3);
    EXPECT_THROW(a.index(make_coordinate(1)), TypeError);
    EXPECT_THROW(a.value(3), IndexError);
    EXPECT_EQ(a.repr(), "StrCategory(['red', 'green', 'blue'])");
}

TEST(CategoryAxis, IntCategories) {
    axis::IntCategory a({7, 3, 11}, false);

    EXPECT_EQ(a.kind(), "IntCategory");
    EXPECT_EQ(a.extent(), 3);
    EXPECT_EQ(a.edges(), (std::vector<double>{0, 1, 2, 3}));
    EXPECT_DOUBLE_EQ(AsDouble(a.value(2)), 11.0);
    EXPECT_EQ(std::get<int64_t>(a.bin(0)), 7);
    EXPECT_EQ(a.index(make_coordinate(3)), 1);
    EXPECT_EQ(a.index(make_coordinate(4)), 3);
    EXPECT_EQ(a.repr(), "IntCategory([7, 3, 11], overflow=False)");
}

TEST(CategoryAxis, RejectsDuplicates) {
    EXPECT_THROW(axis::StrCategory({"a", "a"}), ValueError);
    EXPECT_THROW(axis::IntCategory({1, 2, 1}), ValueError);
}

//=============================================================================
// Generic attributes
//=============================================================================

TEST(AxisAttributes, BuiltinsAreReadable) {
    axis::Regular a(3, 0.0, 3.0);

    EXPECT_EQ(std::get<int64_t>(a.get_attribute("size")), 3);
    EXPECT_EQ(std::get<int64_t>(a.get_attribute("extent")), 5);
    EXPECT_EQ(std::get<std::string>(a.get_attribute("kind")), "Regular");
    EXPECT_TRUE(std::get<bool>(a.get_attribute("overflow")));
    EXPECT_EQ(std::get<std::vector<double>>(a.get_attribute("centers")),
              (std::vector<double>{0.5, 1.5, 2.5}));
}

TEST(AxisAttributes, BuiltinsAreReadOnly) {
    axis::Regular a(3, 0.0, 3.0);
    EXPECT_THROW(a.set_attribute("size", AttributeValue(int64_t{4})),
                 AttributeError);
    EXPECT_EQ(a.size(), 3);
}

TEST(AxisAttributes, MetadataRoundTrip) {
    axis::Integer a(0, 4);

    EXPECT_EQ(std::get<std::string>(a.get_attribute("label")), "");
    EXPECT_FALSE(a.has_attribute("unit"));
    EXPECT_THROW(a.get_attribute("unit"), AttributeError);

    a.set_attribute("unit", AttributeValue(std::string("GeV")));
    a.set_attribute("label", AttributeValue(std::string("energy")));

    EXPECT_TRUE(a.has_attribute("unit"));
    EXPECT_EQ(std::get<std::string>(a.get_attribute("unit")), "GeV");
    EXPECT_EQ(a.label(), "energy");
    EXPECT_EQ(a.metadata().size(), 2u);
}

TEST(AxisAttributes, AttributeNamesIncludeMetadata) {
    axis::Integer a(0, 4);
    a.set_attribute("unit", AttributeValue(std::string("GeV")));

    auto names = a.attribute_names();
    EXPECT_NE(std::find(names.begin(), names.end(), "label"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "unit"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "edges"), names.end());
}

TEST(AxisAttributes, ToStringRendersEveryKind) {
    EXPECT_EQ(to_string(AttributeValue()), "None");
    EXPECT_EQ(to_string(AttributeValue(true)), "True");
    EXPECT_EQ(to_string(AttributeValue(std::string("x"))), "'x'");
    EXPECT_EQ(to_string(AttributeValue(std::vector<double>{1, 2.5})),
              "[1, 2.5]");
    EXPECT_EQ(to_string(BinValue(Interval{0, 1})), "(0, 1)");
    EXPECT_EQ(to_string(make_coordinate("a")), "'a'");
}
