#include <histax/histax.hpp>
#include <iostream>
#include <memory>

using namespace histax;

int main() {
    // The axes of a 2-D histogram: 3 regular bins in x, 2 in y
    AxesTuple axes{std::make_shared<axis::Regular>(3, 0.0, 3.0),
                   std::make_shared<axis::Regular>(2, 0.0, 1.0)};
    axes.set_member("label", {AttributeValue(std::string("x")),
                              AttributeValue(std::string("y"))});
    std::cout << axes.repr() << std::endl;

    // Sparse grids cost sum(sizes) doubles until explicitly broadcast
    trace::enable();
    auto centers = axes.centers();
    std::cout << centers.repr() << std::endl;

    auto dense = centers.broadcast();
    std::cout << "x centers:\n" << dense[0].str() << std::endl;
    std::cout << "y centers:\n" << dense[1].str() << std::endl;

    // Reductions act on the broadcast ensemble
    std::cout << "sum of all centers: " << centers.sum() << std::endl;

    // Per-axis queries take one argument per axis
    auto v = axes.value(1, 0);
    std::cout << "value(1, 0) = (" << to_string(v[0]) << ", "
              << to_string(v[1]) << ")" << std::endl;
    auto idx = axes.index(2.5, 0.7);
    std::cout << "index(2.5, 0.7) = (" << idx[0] << ", " << idx[1] << ")"
              << std::endl;

    try {
        axes.value(1);
    } catch (const ArityError &e) {
        std::cout << e.what() << std::endl;
    }

    std::cout << trace::dump();
    std::cout << cpu_info::simd_info_string() << std::endl;
    return 0;
}
