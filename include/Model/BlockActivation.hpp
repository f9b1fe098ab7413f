#pragma once

#ifndef TORCHFLOWS_BLOCKACTIVATION_HPP
#define TORCHFLOWS_BLOCKACTIVATION_HPP

#include<utility>

#include<torch/nn.h>
#include<torch/torch.h>

namespace TorchFlows
{
    /**
     * @brief Element-wise activation that also reports its Jacobian in block form.
     *
     * Derived classes apply a monotonic nonlinearity and return the log of its derivative
     * as a tensor of shape (..., nBlocks, d, d): the diagonal holds the log derivative of
     * each coordinate, arranged block by block, and every off diagonal entry is -inf
     * (a structural zero in log space). This is the layout BlockAutoregressiveLinear uses,
     * so the two can be composed with logMatMulExp.
     */
    class BlockActivation : public torch::nn::Module
    {
    protected:
        int64_t nBlocks;

        /**
         * @brief Arranges per coordinate log derivatives as block diagonal log Jacobians.
         *
         * @param logDerivatives Tensor of shape (..., nBlocks * d)
         * @return Tensor of shape (..., nBlocks, d, d), -inf off the diagonal
         */
        torch::Tensor toBlockDiagonal(const torch::Tensor &logDerivatives) const;
    public:
        explicit BlockActivation(int64_t nBlocks);

        virtual ~BlockActivation() = default;

        /**
         * @param x Tensor of shape (..., nBlocks * d)
         * @return The activation of x and the block log Jacobian
         */
        virtual std::pair<torch::Tensor, torch::Tensor> forward(const torch::Tensor &x) = 0;

        inline int64_t getNumBlocks() const
        {
            return nBlocks;
        }
    };

    /**
     * @brief Tanh activation for block autoregressive flows.
     *
     * The log derivative `log(1 - tanh(x)^2)` is evaluated as
     * `-2 * (x + softplus(-2x) - log 2)`, which stays accurate where tanh saturates.
     */
    class TanhBlock : public BlockActivation
    {
    public:
        explicit TanhBlock(int64_t nBlocks);

        std::pair<torch::Tensor, torch::Tensor> forward(const torch::Tensor &x) override;
    };
}

#endif //TORCHFLOWS_BLOCKACTIVATION_HPP
