//=============================================================================
// tests/test_axes_tuple.cpp - Vectorized access to a histogram's axes
//=============================================================================

#include "histax_test_utils.hpp"
#include <memory>

using namespace histax;
using namespace histax::testing;

namespace {

// Polymorphic stand-in for something that is not an axis
struct NotAnAxis {
    virtual ~NotAnAxis() = default;
};

struct AxisLike : NotAnAxis, axis::Integer {
    AxisLike() : axis::Integer(0, 2) {}
};

} // namespace

//=============================================================================
// Construction
//=============================================================================

TEST(AxesTuple, EmptyIsValid) {
    AxesTuple axes;
    EXPECT_EQ(axes.ndim(), 0u);
    EXPECT_TRUE(axes.size().empty());
    EXPECT_TRUE(axes.centers().empty());
    EXPECT_TRUE(axes.value().empty());
    EXPECT_EQ(axes.repr(), "AxesTuple()");
}

TEST(AxesTuple, NullMemberIsRejected) {
    std::vector<std::shared_ptr<Axis>> members = {
        std::make_shared<axis::Regular>(3, 0.0, 1.0), nullptr};
    EXPECT_THROW(AxesTuple{members}, TypeError);
}

TEST(AxesTuple, FromValidatesEveryCandidate) {
    std::vector<std::shared_ptr<NotAnAxis>> candidates = {
        std::make_shared<AxisLike>(), std::make_shared<NotAnAxis>()};
    try {
        AxesTuple::from(candidates);
        FAIL() << "expected TypeError";
    } catch (const TypeError &e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("position 1"), std::string::npos) << msg;
#if defined(__GNUG__)
        EXPECT_NE(msg.find("NotAnAxis"), std::string::npos) << msg;
        EXPECT_EQ(msg.find("N12_GLOBAL"), std::string::npos) << msg;
#endif
    }

    candidates.pop_back();
    auto axes = AxesTuple::from(candidates);
    ASSERT_EQ(axes.ndim(), 1u);
    EXPECT_EQ(axes[0]->kind(), "Integer");
}

TEST(AxesTuple, SharesAxesWithCaller) {
    auto x = std::make_shared<axis::Regular>(3, 0.0, 3.0);
    AxesTuple axes{x};

    EXPECT_EQ(axes[0].get(), x.get());
    x->set_label("shared");
    EXPECT_EQ(axes[0]->label(), "shared");
}

//=============================================================================
// Vectorized properties
//=============================================================================

TEST(AxesTuple, SizeAndExtent) {
    auto axes = MakeRegularPair();

    EXPECT_EQ(axes.size(), (std::vector<int>{3, 2}));
    EXPECT_EQ(axes.extent(), (std::vector<int>{4, 3}));

    AxesTuple mixed{std::make_shared<axis::Regular>(3, 0.0, 1.0),
                    std::make_shared<axis::StrCategory>(
                        std::vector<std::string>{"a", "b"}, true)};
    EXPECT_EQ(mixed.size(), (std::vector<int>{3, 2}));
    EXPECT_EQ(mixed.extent(), (std::vector<int>{5, 3}));
}

TEST(AxesTuple, CentersAreSparseGrid) {
    auto axes = MakeRegularPair();
    auto centers = axes.centers();

    ASSERT_EQ(centers.size(), 2u);
    EXPECT_TRUE(centers[0].is_sparse());
    EXPECT_TRUE(centers[1].is_sparse());
    ExpectArrayEquals(centers[0], {3, 1}, {0.5, 1.5, 2.5});
    ExpectArrayEquals(centers[1], {1, 2}, {0.25, 0.75});
}

TEST(AxesTuple, BroadcastCentersGiveDenseGrid) {
    auto dense = MakeRegularPair().centers().broadcast();

    ASSERT_EQ(dense.size(), 2u);
    ExpectArrayEquals(dense[0], {3, 2}, {0.5, 0.5, 1.5, 1.5, 2.5, 2.5});
    ExpectArrayEquals(dense[1], {3, 2}, {0.25, 0.75, 0.25, 0.75, 0.25, 0.75});
}

TEST(AxesTuple, EdgesAndWidths) {
    auto axes = MakeRegularPair();

    auto edges = axes.edges();
    ExpectArrayEquals(edges[0], {4, 1}, {0, 1, 2, 3});
    ExpectArrayEquals(edges[1], {1, 3}, {0, 0.5, 1});

    auto widths = axes.widths();
    ExpectArrayEquals(widths[0], {3, 1}, {1, 1, 1});
    ExpectArrayEquals(widths[1], {1, 2}, {0.5, 0.5});
}

TEST(AxesTuple, ThreeAxisGridShapes) {
    AxesTuple axes{std::make_shared<axis::Regular>(4, 0.0, 1.0),
                   std::make_shared<axis::Variable>(
                       std::vector<double>{0.0, 1.0, 3.0}),
                   std::make_shared<axis::Integer>(0, 5)};
    auto centers = axes.centers();

    ASSERT_EQ(centers.size(), 3u);
    EXPECT_EQ(centers[0].shape(), (Shape{4, 1, 1}));
    EXPECT_EQ(centers[1].shape(), (Shape{1, 2, 1}));
    EXPECT_EQ(centers[2].shape(), (Shape{1, 1, 5}));
    EXPECT_EQ(centers.broadcast_shape(), (Shape{4, 2, 5}));

    for (const auto &a : centers.broadcast()) {
        EXPECT_EQ(a.shape(), (Shape{4, 2, 5}));
    }
}

TEST(AxesTuple, EnsembleSumOverCenters) {
    auto centers = MakeRegularPair().centers();
    // (0.5 + 1.5 + 2.5) * 2 + (0.25 + 0.75) * 3
    EXPECT_DOUBLE_EQ(centers.sum(), 12.0);
    EXPECT_DOUBLE_EQ(centers.max(), 2.5);
}

TEST(AxesTuple, TwoAxisHistogramWalkthrough) {
    auto axes = MakeRegularPair();

    EXPECT_EQ(axes.size(), (std::vector<int>{3, 2}));
    EXPECT_EQ(axes.extent(), (std::vector<int>{4, 3}));

    auto centers = axes.centers();
    EXPECT_EQ(centers[0].shape(), (Shape{3, 1}));
    EXPECT_EQ(centers[1].shape(), (Shape{1, 2}));
    for (const auto &a : centers.broadcast()) {
        EXPECT_EQ(a.shape(), (Shape{3, 2}));
    }

    auto v = axes.value(1, 0);
    EXPECT_DOUBLE_EQ(AsDouble(v[0]), AsDouble(axes[0]->value(1)));
    EXPECT_DOUBLE_EQ(AsDouble(v[1]), AsDouble(axes[1]->value(0)));
}

//=============================================================================
// Per-axis queries
//=============================================================================

TEST(AxesTuple, ValueTakesOneIndexPerAxis) {
    auto axes = MakeRegularPair();
    auto v = axes.value(1, 0);

    ASSERT_EQ(v.size(), 2u);
    EXPECT_DOUBLE_EQ(AsDouble(v[0]), 1.0);
    EXPECT_DOUBLE_EQ(AsDouble(v[1]), 0.0);

    auto mid = axes.value(std::vector<double>{0.5, 1.5});
    EXPECT_DOUBLE_EQ(AsDouble(mid[0]), 0.5);
    EXPECT_DOUBLE_EQ(AsDouble(mid[1]), 0.75);
}

TEST(AxesTuple, BinTakesOneIndexPerAxis) {
    auto axes = MakeRegularPair();
    auto bins = axes.bin(2, 1);

    ASSERT_EQ(bins.size(), 2u);
    auto x = std::get<Interval>(bins[0]);
    auto y = std::get<Interval>(bins[1]);
    EXPECT_DOUBLE_EQ(x.lower, 2.0);
    EXPECT_DOUBLE_EQ(x.upper, 3.0);
    EXPECT_DOUBLE_EQ(y.lower, 0.5);
    EXPECT_DOUBLE_EQ(y.upper, 1.0);
}

TEST(AxesTuple, IndexAcceptsMixedCoordinates) {
    AxesTuple axes{std::make_shared<axis::Regular>(3, 0.0, 3.0),
                   std::make_shared<axis::StrCategory>(
                       std::vector<std::string>{"a", "b"})};

    EXPECT_EQ(axes.index(1.5, "b"), (std::vector<int>{1, 1}));
    EXPECT_EQ(axes.index(-1, "zzz"), (std::vector<int>{-1, 2}));
    EXPECT_THROW(axes.index("b", 1.5), TypeError);
}

TEST(AxesTuple, ArityIsEnforced) {
    auto axes = MakeRegularPair();

    EXPECT_THROW(axes.value(1), ArityError);
    EXPECT_THROW(axes.value(1, 2, 3), ArityError);
    EXPECT_THROW(axes.bin(0), ArityError);
    EXPECT_THROW(axes.index(0.5, 0.5, 0.5), ArityError);
    EXPECT_THROW(axes.index(std::vector<Coordinate>{}), ArityError);
}

TEST(AxesTuple, ArityErrorIsAnIndexErrorNamingTheCount) {
    auto axes = MakeRegularPair();
    try {
        axes.value(1);
        FAIL() << "expected ArityError";
    } catch (const IndexError &e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("number of axes"), std::string::npos) << msg;
        EXPECT_NE(msg.find("expected 2"), std::string::npos) << msg;
    }
}

//=============================================================================
// Sequence access
//=============================================================================

TEST(AxesTuple, SingleIndexReturnsBareAxis) {
    auto axes = MakeRegularPair();

    EXPECT_EQ(axes[1]->size(), 2);
    EXPECT_EQ(axes.at(-1).get(), axes[1].get());
    EXPECT_THROW(axes[2], IndexError);
    EXPECT_THROW(axes.at(-3), IndexError);
}

TEST(AxesTuple, SliceReturnsAxesTuple) {
    auto axes = MakeRegularPair();

    AxesTuple tail = axes[Slice(1, std::nullopt)];
    ASSERT_EQ(tail.ndim(), 1u);
    EXPECT_EQ(tail[0].get(), axes[1].get());
    EXPECT_EQ(tail.size(), (std::vector<int>{2}));

    AxesTuple reversed = axes[Slice(std::nullopt, std::nullopt, -1)];
    EXPECT_EQ(reversed.size(), (std::vector<int>{2, 3}));

    EXPECT_TRUE(axes[Slice()] == axes);
    EXPECT_TRUE(axes[Slice(5, 9)].empty());
    EXPECT_THROW(axes[Slice(0, 2, 0)], IndexError);
}

TEST(AxesTuple, IterationVisitsAxesInOrder) {
    auto axes = MakeRegularPair();
    std::vector<int> sizes;
    for (const auto &axis : axes) {
        sizes.push_back(axis->size());
    }
    EXPECT_EQ(sizes, (std::vector<int>{3, 2}));
}

//=============================================================================
// Generic forwarding
//=============================================================================

TEST(AxesTuple, GetMemberReadsEveryAxis) {
    auto axes = MakeRegularPair();

    auto kinds = axes.get_member("kind");
    ASSERT_EQ(kinds.size(), 2u);
    EXPECT_EQ(std::get<std::string>(kinds[0]), "Regular");

    auto labels = axes.get_member("label");
    EXPECT_EQ(std::get<std::string>(labels[1]), "");

    EXPECT_THROW(axes.get_member("no_such_attribute"), AttributeError);
}

TEST(AxesTuple, SetMemberRoundTrip) {
    auto axes = MakeRegularPair();
    std::vector<AttributeValue> labels = {AttributeValue(std::string("x")),
                                          AttributeValue(std::string("y"))};

    axes.set_member("label", labels);

    EXPECT_EQ(axes.get_member("label"), labels);
    EXPECT_EQ(axes[0]->label(), "x");
    EXPECT_EQ(axes[1]->label(), "y");
}

TEST(AxesTuple, SetMemberChecksArityBeforeWriting) {
    auto axes = MakeRegularPair();
    std::vector<AttributeValue> one = {AttributeValue(std::string("x"))};

    EXPECT_THROW(axes.set_member("label", one), ArityError);
    EXPECT_EQ(axes[0]->label(), "");
    EXPECT_FALSE(axes[0]->metadata().count("label"));
}

TEST(AxesTuple, SetMemberCannotOverwriteBuiltins) {
    auto axes = MakeRegularPair();
    std::vector<AttributeValue> sizes = {AttributeValue(int64_t{1}),
                                         AttributeValue(int64_t{1})};
    EXPECT_THROW(axes.set_member("size", sizes), AttributeError);
    EXPECT_EQ(axes.size(), (std::vector<int>{3, 2}));
}

TEST(AxesTuple, Repr) {
    auto axes = MakeRegularPair();
    EXPECT_EQ(axes.repr(),
              "AxesTuple(\n  Regular(3, 0, 3, underflow=False),\n"
              "  Regular(2, 0, 1, underflow=False)\n)");
}
