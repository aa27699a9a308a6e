// examples/row_reduce.cpp — Gauss-Jordan elimination on persistent arrays
// - Solves A x = b by reducing the augmented matrix [A | b]
// - Every step returns a new version; the input matrix is printed unchanged at the end
// - Usage: row_reduce [seed]   (random 4x4 system when a seed is given)

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "pv/all.hpp"

static double at(const pv::NestedArray& m, std::size_t i, std::size_t j) {
    return pv::to_double(pv::get_2d(m, i, j));
}

static pv::NestedArray reduce(pv::NestedArray m) {
    const std::size_t rows = pv::dimension_count(m, 0);
    const std::size_t cols = pv::dimension_count(m, 1);
    std::size_t r = 0;
    for (std::size_t c = 0; c + 1 < cols && r < rows; ++c) {
        // partial pivoting
        std::size_t piv = r;
        for (std::size_t i = r + 1; i < rows; ++i)
            if (std::fabs(at(m, i, c)) > std::fabs(at(m, piv, c))) piv = i;
        if (std::fabs(at(m, piv, c)) < 1e-12) continue;
        if (piv != r) m = pv::swap_rows(m, piv, r);
        m = pv::multiply_row(m, r, pv::Value(1.0 / at(m, r, c)));
        for (std::size_t i = 0; i < rows; ++i) {
            if (i == r) continue;
            const double f = at(m, i, c);
            if (f != 0.0) m = pv::add_row(m, i, r, pv::Value(-f));
        }
        ++r;
    }
    return m;
}

int main(int argc, char** argv) {
    try {
        pv::NestedArray a;
        if (argc > 1) {
            const uint64_t seed = std::strtoull(argv[1], nullptr, 10);
            a = pv::as_nested(pv::sample_uniform(pv::Shape{4, 5}, seed));
        } else {
            a = pv::as_nested(pv::construct_matrix(std::vector<std::vector<double>>{
                {2, 1, -1, 8},
                {-3, -1, 2, -11},
                {-2, 1, 2, -3},
            }));
        }

        std::cout << "augmented: " << a << "\n";
        pv::NestedArray r = reduce(a);
        std::cout << "reduced:   " << r << "\n";

        const std::size_t n = pv::dimension_count(r, 0);
        const std::size_t last = pv::dimension_count(r, 1) - 1;
        for (std::size_t i = 0; i < n; ++i)
            std::printf("x%zu = %.6f\n", i, at(r, i, last));

        std::cout << "input still: " << a << "\n";
    } catch (const std::exception& e) {
        std::cerr << "row_reduce: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
