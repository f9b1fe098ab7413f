#include<cmath>
#include<stdexcept>

#include<fmt/format.h>
#include<torch/torch.h>

#include"../../include/Model/BlockAutoregressiveLinear.hpp"
#include"../../include/Model/modelUtils.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    /**
     * @brief Constructs a block autoregressive linear layer.
     *
     * **Initialisation:**
     * - The key is split in three (weight, bias, scale)
     * - Weight: Glorot uniform, multiplied by the union of the diagonal and lower masks
     * - Bias: U(-1/sqrt(outFeatures), 1/sqrt(outFeatures))
     * - Log scale: log(U(0, 1)), one entry per output row
     */
    BlockAutoregressiveLinearImpl::BlockAutoregressiveLinearImpl(const Key &key,
                                                                 int64_t nBlocks,
                                                                 std::pair<int64_t, int64_t> blockShape,
                                                                 torch::TensorOptions options) :
        nBlocks(nBlocks),
        blockShape(blockShape),
        inFeatures(blockShape.second * nBlocks),
        outFeatures(blockShape.first * nBlocks)
    {
        if (nBlocks < 1 || blockShape.first < 1 || blockShape.second < 1)
        {
            throw std::invalid_argument(fmt::format(
                "Block autoregressive layers need positive nBlocks and block shape; got nBlocks={}, block shape=({}, {}).",
                nBlocks, blockShape.first, blockShape.second));
        }

        auto keys = key.split(3);
        diagonalMask = register_buffer("diagonalMask", blockDiagonalMask(blockShape, nBlocks, options));
        lowerMask = register_buffer("lowerMask", blockLowerMask(blockShape, nBlocks, options));

        auto initialWeight = glorotUniform(keys[0], outFeatures, inFeatures, options) * (diagonalMask + lowerMask);
        auto initialBias = (torch::rand({outFeatures}, keys[1].generator(), options) - 0.5) *
                           (2 / std::sqrt(static_cast<double>(outFeatures)));
        auto initialLogScale = torch::log(torch::rand({outFeatures, 1}, keys[2].generator(), options));

        weight = register_parameter("weight", initialWeight);
        bias = register_parameter("bias", initialBias);
        logScale = register_parameter("logScale", initialLogScale);
    }

    torch::Tensor BlockAutoregressiveLinearImpl::normalisedWeights() const
    {
        auto masked = torch::exp(weight) * diagonalMask + weight * lowerMask;
        auto norms = masked.norm(2, {-1}, true);
        return torch::exp(logScale) * masked / norms;
    }

    /**
     * @brief Forward pass.
     *
     * The Jacobian of `y = W x + b` with respect to `x` is `W` itself. Because the flow is
     * built from block lower triangular matrices, only the diagonal blocks of `W` enter the
     * determinant, so those are gathered (row major, block by block) and returned in log
     * space. Diagonal entries are strictly positive by construction; an underflow gives
     * -inf rather than an error.
     */
    std::pair<torch::Tensor, torch::Tensor> BlockAutoregressiveLinearImpl::forward(const torch::Tensor &x)
    {
        auto weights = normalisedWeights();
        auto y = torch::matmul(x, weights.t()) + bias;
        auto jacobian = weights.masked_select(diagonalMask.to(torch::kBool))
                               .view({nBlocks, blockShape.first, blockShape.second});
        return {y, torch::log(jacobian)};
    }

    TEST_CASE("BlockAutoregressiveLinear")
    {
        auto layer = BlockAutoregressiveLinear(Key(0), 3, std::make_pair<int64_t, int64_t>(2, 4));

        SUBCASE("Feature sizes follow the block shape")
        {
            CHECK(layer->getInFeatures() == 12);
            CHECK(layer->getOutFeatures() == 6);
        }

        SUBCASE("Masks are buffers, not parameters")
        {
            CHECK(layer->parameters().size() == 3);
            CHECK(layer->buffers().size() == 2);
        }

        SUBCASE("Outputs have the expected shapes")
        {
            auto x = torch::randn({5, 12}, Key(1).generator(), defaultOptions());
            auto [y, logJacobian] = layer->forward(x);
            CHECK(y.sizes().vec() == std::vector<int64_t>{5, 6});
            CHECK(logJacobian.sizes().vec() == std::vector<int64_t>{3, 2, 4});
            CHECK(torch::isfinite(logJacobian).all().item<bool>());
        }

        SUBCASE("Block log Jacobian holds the diagonal blocks of the weight")
        {
            auto weights = layer->normalisedWeights();
            auto [y, logJacobian] = layer->forward(torch::zeros({12}, defaultOptions()));
            auto secondBlock = weights.slice(0, 2, 4).slice(1, 4, 8);
            CHECK(torch::allclose(logJacobian[1].exp(), secondBlock));
        }

        SUBCASE("Entries outside the autoregressive pattern are exactly zero")
        {
            auto free = 1 - layer->getDiagonalMask() - layer->getLowerMask();
            auto x = torch::randn({12}, Key(2).generator(), defaultOptions());
            layer->forward(x);
            CHECK((layer->normalisedWeights() * free).abs().max().item().toDouble() == 0);
        }

        SUBCASE("Masked entries stay zero after the raw weight is perturbed everywhere")
        {
            {
                torch::NoGradGuard guard;
                for (auto &parameter : layer->named_parameters())
                {
                    if (parameter.key() == "weight")
                    {
                        parameter.value().add_(torch::ones_like(parameter.value()));
                    }
                }
            }
            auto free = 1 - layer->getDiagonalMask() - layer->getLowerMask();
            layer->forward(torch::randn({12}, Key(3).generator(), defaultOptions()));
            CHECK((layer->normalisedWeights() * free).abs().max().item().toDouble() == 0);
        }

        SUBCASE("Rows are weight normalised")
        {
            auto weights = layer->normalisedWeights();
            auto scales = torch::Tensor();
            for (auto &parameter : layer->named_parameters())
            {
                if (parameter.key() == "logScale")
                {
                    scales = parameter.value().exp().squeeze(-1);
                }
            }
            CHECK(torch::allclose(weights.norm(2, {-1}), scales));
        }

        SUBCASE("Gradients never reach masked entries of the effective weight")
        {
            auto x = torch::randn({4, 12}, Key(4).generator(), defaultOptions());
            auto [y, logJacobian] = layer->forward(x);
            (y.sum() + logJacobian.sum()).backward();
            for (auto &parameter : layer->named_parameters())
            {
                if (parameter.key() == "weight")
                {
                    auto free = 1 - layer->getDiagonalMask() - layer->getLowerMask();
                    CHECK((parameter.value().grad() * free).abs().max().item().toDouble() == 0);
                }
            }
        }

        SUBCASE("Invalid construction throws")
        {
            CHECK_THROWS_AS(BlockAutoregressiveLinear(Key(0), 0, std::make_pair<int64_t, int64_t>(2, 2)),
                            std::invalid_argument);
            CHECK_THROWS_AS(BlockAutoregressiveLinear(Key(0), 2, std::make_pair<int64_t, int64_t>(0, 2)),
                            std::invalid_argument);
        }
    }
}
