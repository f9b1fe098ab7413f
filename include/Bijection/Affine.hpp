#pragma once

#ifndef TORCHFLOWS_AFFINE_HPP
#define TORCHFLOWS_AFFINE_HPP

#include<torch/torch.h>

#include"Bijection.hpp"

namespace TorchFlows
{
    /**
     * @class Affine
     * @brief Element-wise affine bijection `y = x * scale + loc`.
     *
     * `loc` and `scale` are broadcast together and their broadcast shape is the shape of
     * the bijection. The scale must be strictly positive; it is stored as its logarithm so
     * it stays positive under gradient updates.
     */
    class Affine : public Bijection
    {
    private:
        torch::Tensor loc;
        torch::Tensor logScale;
    public:
        /**
         * @throws std::invalid_argument if any scale entry is not strictly positive
         */
        Affine(const torch::Tensor &loc, const torch::Tensor &scale);

        explicit Affine(double loc = 0, double scale = 1);

        torch::Tensor transform(const torch::Tensor &x, const torch::Tensor &condition = {}) override;

        std::pair<torch::Tensor, torch::Tensor> transformAndLogDet(const torch::Tensor &x,
                                                                   const torch::Tensor &condition = {}) override;

        torch::Tensor inverse(const torch::Tensor &y, const torch::Tensor &condition = {}) override;

        std::pair<torch::Tensor, torch::Tensor> inverseAndLogDet(const torch::Tensor &y,
                                                                 const torch::Tensor &condition = {}) override;

        inline torch::Tensor getLoc() const
        {
            return loc;
        }

        inline torch::Tensor getScale() const
        {
            return torch::exp(logScale);
        }
    };

    /**
     * @class Scale
     * @brief Element-wise scaling `y = x * scale` with a strictly positive scale.
     */
    class Scale : public Bijection
    {
    private:
        torch::Tensor logScale;
    public:
        /**
         * @throws std::invalid_argument if any scale entry is not strictly positive
         */
        explicit Scale(const torch::Tensor &scale);

        std::pair<torch::Tensor, torch::Tensor> transformAndLogDet(const torch::Tensor &x,
                                                                   const torch::Tensor &condition = {}) override;

        std::pair<torch::Tensor, torch::Tensor> inverseAndLogDet(const torch::Tensor &y,
                                                                 const torch::Tensor &condition = {}) override;

        inline torch::Tensor getScale() const
        {
            return torch::exp(logScale);
        }
    };
}

#endif //TORCHFLOWS_AFFINE_HPP
