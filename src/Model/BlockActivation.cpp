#include<cmath>
#include<limits>
#include<stdexcept>

#include<fmt/format.h>
#include<torch/torch.h>

#include"../../include/Model/BlockActivation.hpp"
#include"../../include/Types.hpp"
#include"../../include/Random/Key.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    BlockActivation::BlockActivation(int64_t nBlocks) : nBlocks(nBlocks)
    {
        if (nBlocks < 1)
        {
            throw std::invalid_argument(fmt::format("nBlocks must be positive; got {}.", nBlocks));
        }
    }

    torch::Tensor BlockActivation::toBlockDiagonal(const torch::Tensor &logDerivatives) const
    {
        auto features = logDerivatives.size(-1);
        if (features % nBlocks != 0)
        {
            throw std::invalid_argument(fmt::format(
                "Activation input of size {} does not split into {} blocks.", features, nBlocks));
        }
        auto blockSize = features / nBlocks;

        auto batchShape = logDerivatives.sizes().vec();
        batchShape.back() = nBlocks;
        batchShape.push_back(blockSize);
        auto perBlock = logDerivatives.reshape(batchShape);

        auto eye = torch::eye(blockSize, logDerivatives.options().dtype(torch::kBool));
        auto negativeInfinity = torch::full({}, -std::numeric_limits<double>::infinity(), logDerivatives.options());
        return torch::where(eye, torch::diag_embed(perBlock), negativeInfinity);
    }

    TanhBlock::TanhBlock(int64_t nBlocks) : BlockActivation(nBlocks) {}

    std::pair<torch::Tensor, torch::Tensor> TanhBlock::forward(const torch::Tensor &x)
    {
        auto logDerivatives = -2 * (x + torch::nn::functional::softplus(-2 * x) - std::log(2.0));
        return {torch::tanh(x), toBlockDiagonal(logDerivatives)};
    }

    TEST_CASE("TanhBlock")
    {
        TanhBlock activation(2);
        auto x = torch::randn({7, 6}, Key(0).generator(), defaultOptions());
        auto [y, logJacobian] = activation.forward(x);

        SUBCASE("Applies tanh")
        {
            CHECK(torch::allclose(y, torch::tanh(x)));
        }

        SUBCASE("Log Jacobian has block layout")
        {
            CHECK(logJacobian.sizes().vec() == std::vector<int64_t>{7, 2, 3, 3});
        }

        SUBCASE("Diagonal holds log(1 - tanh^2), off diagonal is -inf")
        {
            auto expected = torch::log(1 - torch::tanh(x).pow(2)).view({7, 2, 3});
            CHECK(torch::allclose(torch::diagonal(logJacobian, 0, -2, -1), expected, 1e-8, 1e-10));
            auto offDiagonal = logJacobian.masked_select(~torch::eye(3, torch::kBool));
            CHECK(torch::isneginf(offDiagonal).all().item<bool>());
        }

        SUBCASE("Stable where tanh saturates")
        {
            auto saturated = torch::tensor({-30.0, 30.0}, defaultOptions());
            auto [ignored, saturatedJacobian] = TanhBlock(1).forward(saturated);
            auto diagonal = torch::diagonal(saturatedJacobian, 0, -2, -1);
            CHECK(torch::isfinite(diagonal).all().item<bool>());
            // log(4) - 2|x| for large |x|
            CHECK(diagonal[0][0].item().toDouble() == doctest::Approx(std::log(4.0) - 60).epsilon(1e-9));
        }

        SUBCASE("Rejects inputs that do not split into blocks")
        {
            CHECK_THROWS_AS(TanhBlock(4).forward(torch::zeros({6}, defaultOptions())), std::invalid_argument);
        }
    }
}
