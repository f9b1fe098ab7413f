#pragma once

#ifndef TORCHFLOWS_DISTRIBUTION_HPP
#define TORCHFLOWS_DISTRIBUTION_HPP

#include<utility>
#include<vector>

#include<torch/nn.h>
#include<torch/torch.h>

#include"../Random/Key.hpp"
#include"../Types.hpp"

namespace TorchFlows
{
    class Transformed;
    class SpecializeCondition;

    /**
     * @class Distribution
     * @brief Abstract base class for probability distributions.
     *
     * A distribution is defined mathematically for a single point of shape `shape()` and,
     * if conditional, a single condition of shape `condShape()`. The public methods add
     * batching on top of that definition:
     *
     * - input trailing dimensions are validated against the declared shapes;
     * - leading dimensions of the input, the condition and the requested sample shape
     *   are broadcast together;
     * - every batch element is evaluated independently, and every sampled element gets
     *   its own child of the supplied key;
     * - NaN log probabilities are reported as -inf.
     *
     * Derived classes implement the *Flat hooks, which receive inputs with exactly one
     * leading batch dimension of size N.
     *
     * @see Transformed
     * @see StandardNormal
     */
    class Distribution : public torch::nn::Module
    {
        friend class Transformed;
        friend class SpecializeCondition;
    protected:
        Shape eventShape;             ///< Shape of a single sample
        OptionalShape conditionShape; ///< Shape of a single condition, std::nullopt if unconditional

        /**
         * @brief Log density of N points.
         *
         * @param x Tensor of shape (N, *shape)
         * @param condition Tensor of shape (N, *condShape), undefined if unconditional
         * @return Tensor of shape (N)
         */
        virtual torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) = 0;

        /**
         * @brief Draws one point per key.
         *
         * @param keys N keys, one per output element
         * @param condition Tensor of shape (N, *condShape), undefined if unconditional
         * @return Tensor of shape (N, *shape)
         */
        virtual torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) = 0;

        /**
         * @brief Draws one point per key together with its log density.
         *
         * The default implementation evaluates logProbabilityFlat on the samples.
         */
        virtual std::pair<torch::Tensor, torch::Tensor> sampleAndLogProbabilityFlat(const std::vector<Key> &keys,
                                                                                    const torch::Tensor &condition);

        /**
         * @brief dtype and device of sampled tensors, used for empty sample shapes.
         *
         * The default is defaultOptions().
         */
        virtual torch::TensorOptions sampleOptions() const;

        /**
         * @brief Validates a condition argument and returns its leading (batch) shape.
         *
         * Unconditional distributions ignore the condition and return an empty shape.
         *
         * @throws ShapeError if a conditional distribution gets no condition or a condition
         *         with the wrong trailing dimensions
         */
        Shape conditionBatchShape(const torch::Tensor &condition) const;

        /**
         * @brief Computes the sample key shape, checks the condition and splits the key.
         */
        std::pair<Shape, std::vector<Key>> sampleKeys(const Key &key,
                                                      const Shape &sampleShape,
                                                      const torch::Tensor &condition) const;

        /**
         * @brief Broadcasts a condition to `batchShape + condShape` and flattens the batch.
         *
         * Returns an undefined tensor for unconditional distributions.
         */
        torch::Tensor flattenCondition(const torch::Tensor &condition, const Shape &batchShape) const;
    public:
        Distribution(Shape shape, OptionalShape condShape);

        virtual ~Distribution() = default;

        inline const Shape &shape() const
        {
            return eventShape;
        }

        inline const OptionalShape &condShape() const
        {
            return conditionShape;
        }

        /**
         * @brief Evaluates the log probability density.
         *
         * @param x Points of shape (*batch, *shape)
         * @param condition Conditions of shape (*conditionBatch, *condShape); required iff
         *                  the distribution is conditional
         * @return Tensor of shape broadcast(batch, conditionBatch); NaN is mapped to -inf
         *
         * @throws ShapeError on mismatched trailing dimensions or unbroadcastable batches
         */
        torch::Tensor logProbability(const torch::Tensor &x, const torch::Tensor &condition = {});

        /**
         * @brief Samples from the distribution.
         *
         * @param key Random key; split into one child per sampled element
         * @param sampleShape Leading sample shape
         * @param condition Conditions of shape (*conditionBatch, *condShape); required iff
         *                  the distribution is conditional
         * @return Tensor of shape sampleShape + conditionBatch + shape
         */
        torch::Tensor sample(const Key &key, const Shape &sampleShape = {}, const torch::Tensor &condition = {});

        /**
         * @brief Samples and returns the log probability of each sample.
         *
         * For transformed distributions this avoids the inverse pass.
         *
         * @return (samples of shape sampleShape + conditionBatch + shape,
         *          log probabilities of shape sampleShape + conditionBatch)
         */
        std::pair<torch::Tensor, torch::Tensor> sampleAndLogProbability(const Key &key,
                                                                        const Shape &sampleShape = {},
                                                                        const torch::Tensor &condition = {});
    };
}

#endif //TORCHFLOWS_DISTRIBUTION_HPP
