#pragma once

#ifndef TORCHFLOWS_TRANSFORMED_HPP
#define TORCHFLOWS_TRANSFORMED_HPP

#include<memory>
#include<utility>
#include<vector>

#include<torch/torch.h>

#include"../Bijection/Bijection.hpp"
#include"Distribution.hpp"

namespace TorchFlows
{
    /**
     * @class Transformed
     * @brief Distribution of y = f(z) for a base distribution z ~ p and a bijection f.
     *
     * **Density:**
     * - log q(y) = log p(f^-1(y)) + log|det J_{f^-1}(y)|, evaluated with one inverse pass;
     * - sampleAndLogProbability() instead uses log p(z) - log|det J_f(z)| and needs no
     *   inverse, which makes it the only route for bijections without one.
     *
     * When both the base and the bijection are conditional they share the same condition,
     * so their conditioning shapes must agree.
     */
    class Transformed : public Distribution
    {
    private:
        std::shared_ptr<Distribution> base;
        std::shared_ptr<Bijection> bijection;
    protected:
        torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) override;

        torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) override;

        std::pair<torch::Tensor, torch::Tensor> sampleAndLogProbabilityFlat(const std::vector<Key> &keys,
                                                                            const torch::Tensor &condition) override;

        torch::TensorOptions sampleOptions() const override;
    public:
        /**
         * @throws std::invalid_argument if either pointer is null, the base shape differs
         *         from the bijection shape or both declare different conditioning shapes
         */
        Transformed(std::shared_ptr<Distribution> base, std::shared_ptr<Bijection> bijection);

        inline const std::shared_ptr<Distribution> &getBase() const
        {
            return base;
        }

        inline const std::shared_ptr<Bijection> &getBijection() const
        {
            return bijection;
        }
    };

    /**
     * @brief Flattens nested transformed distributions into a single one.
     *
     * The bijections of every nested Transformed layer are collected into one flat Chain
     * over the innermost base distribution. Sampling and density evaluation are unchanged.
     *
     * @return `distribution` itself when its base is not a Transformed distribution
     */
    std::shared_ptr<Transformed> mergeTransforms(const std::shared_ptr<Transformed> &distribution);
}

#endif //TORCHFLOWS_TRANSFORMED_HPP
