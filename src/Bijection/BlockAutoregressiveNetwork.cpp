#include<stdexcept>

#include<fmt/format.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Bijection/BlockAutoregressiveNetwork.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Model/modelUtils.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    /**
     * @brief Builds the layer stack.
     *
     * **Block shapes** for nLayers = 4 and blockSize = (8, 8):
     * ```
     * layer 0: (8, 1)   dim     -> 8 * dim
     * layer 1: (8, 8)   8 * dim -> 8 * dim
     * layer 2: (8, 8)   8 * dim -> 8 * dim
     * layer 3: (1, 8)   8 * dim -> dim
     * ```
     */
    BlockAutoregressiveNetwork::BlockAutoregressiveNetwork(const Key &key,
                                                           int64_t dim,
                                                           int64_t nLayers,
                                                           std::pair<int64_t, int64_t> blockSize,
                                                           std::shared_ptr<BlockActivation> activation,
                                                           torch::TensorOptions options) :
        Bijection({dim}, std::nullopt),
        nLayers(nLayers),
        blockSize(blockSize),
        activation(std::move(activation))
    {
        if (nLayers < 2)
        {
            throw std::invalid_argument(fmt::format(
                "A block autoregressive network needs at least 2 layers; got {}.", nLayers));
        }
        if (dim < 1)
        {
            throw std::invalid_argument(fmt::format("dim must be positive; got {}.", dim));
        }
        if (blockSize.first < 1 || blockSize.first != blockSize.second)
        {
            throw std::invalid_argument(fmt::format(
                "Block size must be positive and square so consecutive layers agree; got ({}, {}).",
                blockSize.first, blockSize.second));
        }
        if (!this->activation)
        {
            this->activation = std::make_shared<TanhBlock>(dim);
        }
        else if (this->activation->getNumBlocks() != dim)
        {
            throw std::invalid_argument(fmt::format(
                "Activation was built for {} blocks but the flow has dimension {}.",
                this->activation->getNumBlocks(), dim));
        }
        register_module("activation", this->activation);

        std::vector<std::pair<int64_t, int64_t>> blockShapes;
        blockShapes.emplace_back(blockSize.first, 1);
        for (int64_t i = 0; i < nLayers - 2; ++i)
        {
            blockShapes.push_back(blockSize);
        }
        blockShapes.emplace_back(1, blockSize.second);

        auto layerKeys = key.split(nLayers);
        for (int64_t i = 0; i < nLayers; ++i)
        {
            layers.push_back(register_module("layer" + std::to_string(i),
                                             BlockAutoregressiveLinear(layerKeys[i], dim, blockShapes[i], options)));
        }

        spdlog::debug("Built block autoregressive network: dim={}, layers={}, block size=({}, {})",
                      dim, nLayers, blockSize.first, blockSize.second);
    }

    torch::Tensor BlockAutoregressiveNetwork::transform(const torch::Tensor &x, const torch::Tensor &condition)
    {
        checkShapes(x, condition);
        auto y = x;
        for (size_t i = 0; i < layers.size(); ++i)
        {
            y = layers[i]->forward(y).first;
            if (i + 1 < layers.size())
            {
                y = activation->forward(y).first;
            }
        }
        return y;
    }

    std::pair<torch::Tensor, torch::Tensor> BlockAutoregressiveNetwork::transformAndLogDet(const torch::Tensor &x,
                                                                                           const torch::Tensor &condition)
    {
        checkShapes(x, condition);
        std::vector<torch::Tensor> logJacobians;
        auto y = x;
        for (size_t i = 0; i < layers.size(); ++i)
        {
            auto [layerOutput, layerJacobian] = layers[i]->forward(y);
            y = layerOutput;
            logJacobians.push_back(layerJacobian);
            if (i + 1 < layers.size())
            {
                auto [activated, activationJacobian] = activation->forward(y);
                y = activated;
                logJacobians.push_back(activationJacobian);
            }
        }

        // Chain rule: J = J_last @ ... @ J_first, composed right to left in log space.
        auto logJacobian = logJacobians.back();
        for (auto it = std::next(logJacobians.rbegin()); it != logJacobians.rend(); ++it)
        {
            logJacobian = logMatMulExp(logJacobian, *it);
        }
        return {y, expandToBatch(sumTrailing(logJacobian, 3), x)};
    }

    torch::Tensor BlockAutoregressiveNetwork::inverse(const torch::Tensor &, const torch::Tensor &)
    {
        throw NotImplementedError(
            "BlockAutoregressiveNetwork has no analytic inverse; inversion would require numerical root finding.");
    }

    std::pair<torch::Tensor, torch::Tensor> BlockAutoregressiveNetwork::inverseAndLogDet(const torch::Tensor &,
                                                                                         const torch::Tensor &)
    {
        throw NotImplementedError(
            "BlockAutoregressiveNetwork has no analytic inverse; inversion would require numerical root finding.");
    }

    namespace
    {
        // Central finite difference Jacobian of a map R^d -> R^d at a single point.
        torch::Tensor finiteDifferenceJacobian(Bijection &bijection, const torch::Tensor &x, double eps)
        {
            torch::NoGradGuard guard;
            auto dim = x.size(0);
            auto jacobian = torch::zeros({dim, dim}, x.options());
            for (int64_t j = 0; j < dim; ++j)
            {
                auto step = torch::zeros_like(x);
                step[j] = eps;
                jacobian.select(1, j).copy_((bijection.transform(x + step) - bijection.transform(x - step)) / (2 * eps));
            }
            return jacobian;
        }
    }

    TEST_CASE("BlockAutoregressiveNetwork")
    {
        auto options = defaultOptions();
        BlockAutoregressiveNetwork flow(Key(0), 4, 3);

        SUBCASE("Maps dim to dim with a log determinant per batch element")
        {
            auto x = torch::randn({6, 4}, Key(1).generator(), options);
            auto [y, logDet] = flow.transformAndLogDet(x);
            CHECK(y.sizes().vec() == std::vector<int64_t>{6, 4});
            CHECK(logDet.sizes().vec() == std::vector<int64_t>{6});
            CHECK(torch::isfinite(logDet).all().item<bool>());
            CHECK(torch::allclose(flow.transform(x), y));
        }

        SUBCASE("Unbatched input gives a scalar log determinant")
        {
            auto [y, logDet] = flow.transformAndLogDet(torch::randn({4}, Key(2).generator(), options));
            CHECK(y.sizes().vec() == std::vector<int64_t>{4});
            CHECK(logDet.dim() == 0);
        }

        SUBCASE("Log determinant matches the finite difference Jacobian")
        {
            auto x = torch::randn({5, 4}, Key(3).generator(), options);
            auto logDet = flow.transformAndLogDet(x).second.detach();
            for (int64_t i = 0; i < x.size(0); ++i)
            {
                auto jacobian = finiteDifferenceJacobian(flow, x[i], 1e-6);
                auto expected = std::get<1>(torch::linalg_slogdet(jacobian));
                CHECK(logDet[i].item().toDouble() == doctest::Approx(expected.item().toDouble()).epsilon(1e-5));
            }
        }

        SUBCASE("Jacobian is lower triangular")
        {
            auto jacobian = finiteDifferenceJacobian(flow, torch::randn({4}, Key(4).generator(), options), 1e-6);
            CHECK(torch::triu(jacobian, 1).abs().max().item().toDouble() < 1e-8);
            CHECK((torch::diagonal(jacobian) > 0).all().item<bool>());
        }

        SUBCASE("Deeper networks with other block sizes still match finite differences")
        {
            BlockAutoregressiveNetwork deep(Key(5), 3, 5, {4, 4});
            auto x = torch::randn({3}, Key(6).generator(), options);
            auto logDet = deep.transformAndLogDet(x).second.item().toDouble();
            auto expected = std::get<1>(torch::linalg_slogdet(finiteDifferenceJacobian(deep, x, 1e-6)));
            CHECK(logDet == doctest::Approx(expected.item().toDouble()).epsilon(1e-5));
        }

        SUBCASE("Masked weights stay exactly zero outside the autoregressive pattern")
        {
            flow.transformAndLogDet(torch::randn({2, 4}, Key(7).generator(), options));
            for (const auto &layer : flow.getLayers())
            {
                auto free = 1 - layer->getDiagonalMask() - layer->getLowerMask();
                CHECK((layer->normalisedWeights() * free).abs().max().item().toDouble() == 0);
            }
        }

        SUBCASE("Outputs and log determinant are differentiable with respect to every parameter")
        {
            auto x = torch::randn({8, 4}, Key(8).generator(), options);
            auto [y, logDet] = flow.transformAndLogDet(x);
            (y.sum() + logDet.sum()).backward();
            for (const auto &parameter : flow.named_parameters())
            {
                INFO(parameter.key());
                CHECK(parameter.value().grad().defined());
            }
        }

        SUBCASE("Inversion is unsupported")
        {
            auto y = torch::zeros({4}, options);
            CHECK_THROWS_AS(flow.inverse(y), NotImplementedError);
            CHECK_THROWS_AS(flow.inverseAndLogDet(y), NotImplementedError);
        }

        SUBCASE("Invalid construction throws")
        {
            CHECK_THROWS_AS(BlockAutoregressiveNetwork(Key(0), 4, 1), std::invalid_argument);
            CHECK_THROWS_AS(BlockAutoregressiveNetwork(Key(0), 0, 3), std::invalid_argument);
            CHECK_THROWS_AS(BlockAutoregressiveNetwork(Key(0), 4, 3, {4, 6}), std::invalid_argument);
            CHECK_THROWS_AS(BlockAutoregressiveNetwork(Key(0), 4, 3, {8, 8}, std::make_shared<TanhBlock>(3)),
                            std::invalid_argument);
        }

        SUBCASE("Wrong input dimension is a shape error")
        {
            CHECK_THROWS_AS(flow.transform(torch::zeros({3}, options)), ShapeError);
        }
    }
}
