#include<cmath>
#include<limits>

#include<torch/torch.h>

#include"../../include/Model/modelUtils.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    torch::Tensor blockDiagonalMask(std::pair<int64_t, int64_t> blockShape,
                                    int64_t nBlocks,
                                    torch::TensorOptions options)
    {
        auto [rows, cols] = blockShape;
        auto mask = torch::zeros({rows * nBlocks, cols * nBlocks}, options);
        for (int64_t block = 0; block < nBlocks; ++block)
        {
            mask.slice(0, block * rows, (block + 1) * rows)
                .slice(1, block * cols, (block + 1) * cols)
                .fill_(1);
        }
        return mask;
    }

    torch::Tensor blockLowerMask(std::pair<int64_t, int64_t> blockShape,
                                 int64_t nBlocks,
                                 torch::TensorOptions options)
    {
        auto [rows, cols] = blockShape;
        auto mask = torch::zeros({rows * nBlocks, cols * nBlocks}, options);
        for (int64_t block = 0; block < nBlocks; ++block)
        {
            // Every block row below the diagonal block of this block column.
            mask.slice(0, (block + 1) * rows)
                .slice(1, block * cols, (block + 1) * cols)
                .fill_(1);
        }
        return mask;
    }

    torch::Tensor glorotUniform(const Key &key, int64_t rows, int64_t cols, torch::TensorOptions options)
    {
        auto limit = std::sqrt(6.0 / static_cast<double>(rows + cols));
        auto unit = torch::rand({rows, cols}, key.generator(), options);
        return (2 * unit - 1) * limit;
    }

    /**
     * @brief Log-domain matrix product.
     *
     * **Mathematical Representation:**
     *
     * Let a = max_k x[i, k] (per row) and b = max_k y[k, j] (per column). Then
     *
     *   log Σ_k exp(x[i, k] + y[k, j]) = log Σ_k exp(x[i, k] - a) exp(y[k, j] - b) + a + b
     *
     * and every exponent on the right hand side is at most zero, so nothing overflows.
     * Entries equal to -inf contribute exp(-inf) = 0, which lets callers encode
     * structural zeros of a Jacobian.
     */
    torch::Tensor logMatMulExp(const torch::Tensor &x, const torch::Tensor &y)
    {
        auto xShift = std::get<0>(x.max(-1, true)).detach();
        auto yShift = std::get<0>(y.max(-2, true)).detach();
        auto product = torch::matmul(torch::exp(x - xShift), torch::exp(y - yShift));
        return torch::log(product) + xShift + yShift;
    }

    TEST_CASE("Block masks")
    {
        auto options = torch::TensorOptions().dtype(torch::kFloat64);

        SUBCASE("blockDiagonalMask() places blocks on the diagonal")
        {
            auto mask = blockDiagonalMask({2, 1}, 3, options);
            CHECK(mask.sizes().vec() == std::vector<int64_t>{6, 3});
            auto expected = torch::tensor({1., 0., 0.,
                                           1., 0., 0.,
                                           0., 1., 0.,
                                           0., 1., 0.,
                                           0., 0., 1.,
                                           0., 0., 1.}, options).view({6, 3});
            CHECK(torch::equal(mask, expected));
        }

        SUBCASE("blockLowerMask() fills strictly lower blocks")
        {
            auto mask = blockLowerMask({1, 2}, 3, options);
            CHECK(mask.sizes().vec() == std::vector<int64_t>{3, 6});
            auto expected = torch::tensor({0., 0., 0., 0., 0., 0.,
                                           1., 1., 0., 0., 0., 0.,
                                           1., 1., 1., 1., 0., 0.}, options).view({3, 6});
            CHECK(torch::equal(mask, expected));
        }

        SUBCASE("Masks never overlap")
        {
            auto diagonal = blockDiagonalMask({3, 3}, 4, options);
            auto lower = blockLowerMask({3, 3}, 4, options);
            CHECK((diagonal * lower).sum().item().toDouble() == 0);
            // Strictly upper blocks stay free.
            CHECK((diagonal + lower).sum().item().toDouble() == doctest::Approx(9 * 4 + 9 * 6));
        }
    }

    TEST_CASE("glorotUniform()")
    {
        auto options = torch::TensorOptions().dtype(torch::kFloat64);
        auto weights = glorotUniform(Key(3), 20, 30, options);
        auto limit = std::sqrt(6.0 / 50.0);

        CHECK(weights.sizes().vec() == std::vector<int64_t>{20, 30});
        CHECK(weights.abs().max().item().toDouble() <= limit);
        CHECK(torch::equal(weights, glorotUniform(Key(3), 20, 30, options)));
    }

    TEST_CASE("logMatMulExp()")
    {
        auto options = torch::TensorOptions().dtype(torch::kFloat64);

        SUBCASE("Matches matrix product of random positive matrices")
        {
            auto a = torch::rand({3, 4}, Key(0).generator(), options) + 0.1;
            auto b = torch::rand({4, 5}, Key(1).generator(), options) + 0.1;
            auto result = torch::exp(logMatMulExp(a.log(), b.log()));
            CHECK(torch::allclose(result, torch::matmul(a, b), 1e-10, 1e-12));
        }

        SUBCASE("Stable when entries span many orders of magnitude")
        {
            auto a = torch::tensor({1e30, 1e-30, 2.0, 1e-30, 1e30, 3.0}, options).view({2, 3});
            auto b = torch::tensor({1e-30, 1.0, 1e30, 5.0, 1.0, 1e-30}, options).view({3, 2});
            auto result = torch::exp(logMatMulExp(a.log(), b.log()));
            auto expected = torch::matmul(a, b);
            CHECK(torch::allclose(result, expected, 1e-10, 0));
        }

        SUBCASE("Finite where the direct product overflows")
        {
            auto a = torch::full({2, 2}, 800.0, options);
            auto b = torch::full({2, 2}, 900.0, options);
            auto result = logMatMulExp(a, b);
            CHECK(torch::isfinite(result).all().item<bool>());
            CHECK(result[0][0].item().toDouble() == doctest::Approx(1700 + std::log(2.0)));
        }

        SUBCASE("-inf entries behave as zeros")
        {
            auto inf = std::numeric_limits<double>::infinity();
            auto a = torch::tensor({0.0, -inf, -inf, 0.0}, options).view({2, 2});
            auto b = torch::tensor({std::log(2.0), std::log(3.0), std::log(5.0), std::log(7.0)}, options).view({2, 2});
            auto result = torch::exp(logMatMulExp(a, b));
            CHECK(torch::allclose(result, b.exp()));
        }

        SUBCASE("Broadcasts over leading dimensions")
        {
            auto a = torch::randn({6, 3, 1, 4}, Key(2).generator(), options);
            auto b = torch::randn({3, 4, 4}, Key(4).generator(), options);
            CHECK(logMatMulExp(a, b).sizes().vec() == std::vector<int64_t>{6, 3, 1, 4});
        }
    }
}
