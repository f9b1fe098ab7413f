#pragma once

#ifndef TORCHFLOWS_EXP_HPP
#define TORCHFLOWS_EXP_HPP

#include<torch/torch.h>

#include"Bijection.hpp"

namespace TorchFlows
{
    /**
     * @class Exp
     * @brief Element-wise exponential `y = exp(x)`, mapping the real line onto (0, inf).
     *
     * Inverting a non-positive value gives -inf or NaN, which distributions report as a
     * log density of -inf.
     */
    class Exp : public Bijection
    {
    public:
        explicit Exp(Shape shape = {});

        std::pair<torch::Tensor, torch::Tensor> transformAndLogDet(const torch::Tensor &x,
                                                                   const torch::Tensor &condition = {}) override;

        std::pair<torch::Tensor, torch::Tensor> inverseAndLogDet(const torch::Tensor &y,
                                                                 const torch::Tensor &condition = {}) override;
    };
}

#endif //TORCHFLOWS_EXP_HPP
