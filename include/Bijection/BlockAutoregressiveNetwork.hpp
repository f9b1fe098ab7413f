#pragma once

#ifndef TORCHFLOWS_BLOCKAUTOREGRESSIVENETWORK_HPP
#define TORCHFLOWS_BLOCKAUTOREGRESSIVENETWORK_HPP

#include<memory>
#include<utility>
#include<vector>

#include<torch/torch.h>

#include"Bijection.hpp"
#include"../Model/BlockActivation.hpp"
#include"../Model/BlockAutoregressiveLinear.hpp"
#include"../Random/Key.hpp"

namespace TorchFlows
{
    /**
     * @class BlockAutoregressiveNetwork
     * @brief Block neural autoregressive flow (BNAF) bijection.
     *
     * Stacks `nLayers` BlockAutoregressiveLinear layers with an activation after every
     * layer but the last. Block shapes taper from `(blockSize.first, 1)` through
     * `blockSize` to `(1, blockSize.second)`, so the network maps R^dim to R^dim and
     * output `i` depends on inputs `0..i` only.
     *
     * The Jacobian of the whole network is block lower triangular, and its determinant is
     * the product over blocks of the composed diagonal blocks. Each layer reports its
     * diagonal blocks in log space; they are multiplied right to left with logMatMulExp
     * and the resulting (dim, 1, 1) tensor is summed.
     *
     * The inverse has no closed form and is not provided: inverse() and
     * inverseAndLogDet() throw NotImplementedError. The condition is accepted for
     * interface compatibility and ignored.
     */
    class BlockAutoregressiveNetwork : public Bijection
    {
    private:
        int64_t nLayers;
        std::pair<int64_t, int64_t> blockSize;
        std::vector<BlockAutoregressiveLinear> layers;
        std::shared_ptr<BlockActivation> activation;
    public:
        /**
         * @param key Random key, split once per layer
         * @param dim Dimension of the flow
         * @param nLayers Number of linear layers (>= 2)
         * @param blockSize Block shape of the hidden layers. Consecutive layers must agree
         *                  on the hidden width, so both entries must be equal.
         * @param activation Activation placed between layers; TanhBlock(dim) if null
         *
         * @throws std::invalid_argument for nLayers < 2, dim < 1, non-positive or unequal
         *         block sizes, or an activation built for a different number of blocks
         */
        BlockAutoregressiveNetwork(const Key &key,
                                   int64_t dim,
                                   int64_t nLayers = 3,
                                   std::pair<int64_t, int64_t> blockSize = {8, 8},
                                   std::shared_ptr<BlockActivation> activation = nullptr,
                                   torch::TensorOptions options = defaultOptions());

        torch::Tensor transform(const torch::Tensor &x, const torch::Tensor &condition = {}) override;

        std::pair<torch::Tensor, torch::Tensor> transformAndLogDet(const torch::Tensor &x,
                                                                   const torch::Tensor &condition = {}) override;

        /// @throws NotImplementedError always
        torch::Tensor inverse(const torch::Tensor &y, const torch::Tensor &condition = {}) override;

        /// @throws NotImplementedError always
        std::pair<torch::Tensor, torch::Tensor> inverseAndLogDet(const torch::Tensor &y,
                                                                 const torch::Tensor &condition = {}) override;

        inline int64_t getNumLayers() const
        {
            return nLayers;
        }

        inline const std::vector<BlockAutoregressiveLinear> &getLayers() const
        {
            return layers;
        }
    };
}

#endif //TORCHFLOWS_BLOCKAUTOREGRESSIVENETWORK_HPP
