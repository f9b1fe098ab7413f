#pragma once

#ifndef TORCHFLOWS_SPECIALIZECONDITION_HPP
#define TORCHFLOWS_SPECIALIZECONDITION_HPP

#include<memory>
#include<utility>
#include<vector>

#include<torch/torch.h>

#include"Distribution.hpp"

namespace TorchFlows
{
    /**
     * @class SpecializeCondition
     * @brief Fixes the condition of a conditional distribution.
     *
     * The result is unconditional: every method implicitly uses the condition given at
     * construction. With `stopGradient` the condition is detached on every use, so
     * training the wrapped distribution never changes it.
     */
    class SpecializeCondition : public Distribution
    {
    private:
        std::shared_ptr<Distribution> distribution;
        torch::Tensor condition;
        bool stopGradient;

        /// The stored condition repeated n times, shape (n, *condShape).
        torch::Tensor repeatedCondition(int64_t n) const;
    protected:
        torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &) override;

        torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &) override;

        std::pair<torch::Tensor, torch::Tensor> sampleAndLogProbabilityFlat(const std::vector<Key> &keys,
                                                                            const torch::Tensor &) override;

        torch::TensorOptions sampleOptions() const override;
    public:
        /**
         * @param distribution Conditional distribution to specialise
         * @param condition A single condition of shape `distribution->condShape()`
         * @param stopGradient Whether to detach the condition on every use
         *
         * @throws std::invalid_argument if the distribution is null
         * @throws ShapeError if the condition shape differs from the conditioning shape
         */
        SpecializeCondition(std::shared_ptr<Distribution> distribution,
                            const torch::Tensor &condition,
                            bool stopGradient = true);

        torch::Tensor getCondition() const;

        inline const std::shared_ptr<Distribution> &getDistribution() const
        {
            return distribution;
        }
    };
}

#endif //TORCHFLOWS_SPECIALIZECONDITION_HPP
