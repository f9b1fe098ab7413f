#pragma once

#ifndef TORCHFLOWS_BLOCKAUTOREGRESSIVELINEAR_HPP
#define TORCHFLOWS_BLOCKAUTOREGRESSIVELINEAR_HPP

#include<utility>

#include<torch/nn.h>
#include<torch/torch.h>

#include"../Random/Key.hpp"
#include"../Types.hpp"

namespace TorchFlows
{
    /**
     * @brief Block autoregressive linear layer (https://arxiv.org/abs/1904.04676).
     *
     * `BlockAutoregressiveLinearImpl` is a linear layer whose weight matrix is split into
     * `nBlocks x nBlocks` blocks of shape `blockShape`. Only the diagonal blocks and the
     * blocks strictly below them may be non zero, so output block `b` depends on input
     * blocks `0..b` only.
     *
     * The raw weight is the trainable parameter; the masks are registered as buffers and
     * applied again on every forward pass, so entries outside the autoregressive pattern
     * are exactly zero whatever an optimizer does to the raw weight.
     *
     * Besides the output, forward() returns the log of the diagonal blocks of the
     * normalised weight, which is all a block autoregressive flow needs to assemble its
     * log determinant.
     */
    class BlockAutoregressiveLinearImpl : public torch::nn::Module
    {
    private:
        int64_t nBlocks;
        std::pair<int64_t, int64_t> blockShape; ///< (rows, cols) of each block
        int64_t inFeatures;
        int64_t outFeatures;

        torch::Tensor weight;       ///< Raw weight, shape (outFeatures, inFeatures)
        torch::Tensor bias;         ///< Shape (outFeatures)
        torch::Tensor logScale;     ///< Log of the per row weight norm, shape (outFeatures, 1)
        torch::Tensor diagonalMask; ///< Block diagonal mask (buffer)
        torch::Tensor lowerMask;    ///< Strictly lower block mask (buffer)
    public:
        /**
         * @brief Constructs the layer.
         *
         * @param key Random key used for weight, bias and scale initialisation
         * @param nBlocks Number of diagonal blocks (dimension of the flow)
         * @param blockShape (rows, cols) of every block. `inFeatures = cols * nBlocks` and
         *                   `outFeatures = rows * nBlocks`.
         * @param options Tensor options of the parameters (default double precision)
         *
         * @throws std::invalid_argument if nBlocks or a block dimension is not positive
         */
        BlockAutoregressiveLinearImpl(const Key &key,
                                      int64_t nBlocks,
                                      std::pair<int64_t, int64_t> blockShape,
                                      torch::TensorOptions options = defaultOptions());

        /**
         * @brief Weight normalised, masked weight matrix.
         *
         * Diagonal block entries are exponentiated (strictly positive), strictly lower
         * entries keep their sign, every row is divided by its Euclidean norm and
         * multiplied by `exp(logScale)`.
         */
        torch::Tensor normalisedWeights() const;

        /**
         * @brief Applies the layer.
         *
         * @param x Tensor of shape (..., inFeatures)
         * @return Output of shape (..., outFeatures) and the block log Jacobian of shape
         *         (nBlocks, rows, cols)
         */
        std::pair<torch::Tensor, torch::Tensor> forward(const torch::Tensor &x);

        inline int64_t getInFeatures() const
        {
            return inFeatures;
        }

        inline int64_t getOutFeatures() const
        {
            return outFeatures;
        }

        inline int64_t getNumBlocks() const
        {
            return nBlocks;
        }

        inline std::pair<int64_t, int64_t> getBlockShape() const
        {
            return blockShape;
        }

        inline const torch::Tensor &getDiagonalMask() const
        {
            return diagonalMask;
        }

        inline const torch::Tensor &getLowerMask() const
        {
            return lowerMask;
        }
    };
    TORCH_MODULE(BlockAutoregressiveLinear);
}

#endif //TORCHFLOWS_BLOCKAUTOREGRESSIVELINEAR_HPP
