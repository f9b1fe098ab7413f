#pragma once

#ifndef TORCHFLOWS_STANDARD_HPP
#define TORCHFLOWS_STANDARD_HPP

#include<vector>

#include<torch/torch.h>

#include"Distribution.hpp"

namespace TorchFlows
{
    /**
     * @class StandardDistribution
     * @brief Common base of the parameter free, unconditional base distributions.
     *
     * Every element of the distribution is independent, so log densities are sums of
     * element-wise terms over the event dimensions. Samples are drawn key by key, one
     * LibTorch generator per output element.
     */
    class StandardDistribution : public Distribution
    {
    protected:
        torch::TensorOptions options; ///< dtype and device of sampled tensors

        /// One U[0, 1) draw of shape `shape()` per key, stacked to (N, *shape).
        torch::Tensor uniformFlat(const std::vector<Key> &keys) const;

        /// One N(0, 1) draw of shape `shape()` per key, stacked to (N, *shape).
        torch::Tensor normalFlat(const std::vector<Key> &keys) const;

        /// Sums element-wise log densities of shape (N, *shape) to (N).
        torch::Tensor sumEvent(const torch::Tensor &logDensities) const;

        torch::TensorOptions sampleOptions() const override;
    public:
        StandardDistribution(Shape shape, torch::TensorOptions options);
    };

    /**
     * @class StandardNormal
     * @brief Independent N(0, 1) elements.
     */
    class StandardNormal : public StandardDistribution
    {
    protected:
        torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) override;

        torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) override;
    public:
        explicit StandardNormal(Shape shape = {}, torch::TensorOptions options = defaultOptions());
    };

    /**
     * @class StandardUniform
     * @brief Independent U[0, 1] elements. Log density is -inf outside the unit interval.
     */
    class StandardUniform : public StandardDistribution
    {
    protected:
        torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) override;

        torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) override;
    public:
        explicit StandardUniform(Shape shape = {}, torch::TensorOptions options = defaultOptions());
    };

    /**
     * @class StandardGumbel
     * @brief Independent Gumbel(0, 1) elements, sampled as -log(-log(u)).
     */
    class StandardGumbel : public StandardDistribution
    {
    protected:
        torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) override;

        torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) override;
    public:
        explicit StandardGumbel(Shape shape = {}, torch::TensorOptions options = defaultOptions());
    };

    /**
     * @class StandardCauchy
     * @brief Independent Cauchy(0, 1) elements, sampled as tan(pi * (u - 1/2)).
     */
    class StandardCauchy : public StandardDistribution
    {
    protected:
        torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) override;

        torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) override;
    public:
        explicit StandardCauchy(Shape shape = {}, torch::TensorOptions options = defaultOptions());
    };

    /**
     * @class StandardLaplace
     * @brief Independent Laplace(0, 1) elements.
     */
    class StandardLaplace : public StandardDistribution
    {
    protected:
        torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) override;

        torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) override;
    public:
        explicit StandardLaplace(Shape shape = {}, torch::TensorOptions options = defaultOptions());
    };

    /**
     * @class StandardExponential
     * @brief Independent Exponential(1) elements. Log density is -inf for negative values.
     */
    class StandardExponential : public StandardDistribution
    {
    protected:
        torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) override;

        torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) override;
    public:
        explicit StandardExponential(Shape shape = {}, torch::TensorOptions options = defaultOptions());
    };

    /**
     * @class StandardStudentT
     * @brief Independent Student's t elements with per-element degrees of freedom.
     *
     * The shape of the distribution is the shape of `df`. Degrees of freedom are trainable
     * and stored as their logarithm.
     *
     * Sampling uses t = z / sqrt(2 g / df) with z ~ N(0, 1) and g ~ Gamma(df / 2, 1).
     */
    class StandardStudentT : public StandardDistribution
    {
    private:
        torch::Tensor logDf;
    protected:
        torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) override;

        torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) override;
    public:
        /**
         * @throws std::invalid_argument if any degree of freedom is not strictly positive
         */
        explicit StandardStudentT(const torch::Tensor &df);

        inline torch::Tensor getDf() const
        {
            return torch::exp(logDf);
        }
    };
}

#endif //TORCHFLOWS_STANDARD_HPP
