#pragma once

#ifndef TORCHFLOWS_OBJECTIVE_HPP
#define TORCHFLOWS_OBJECTIVE_HPP

#include<functional>
#include<memory>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"../Distribution/Distribution.hpp"
#include"../Random/Key.hpp"

namespace TorchFlows
{
    /**
     * @brief A single scalar produced by a training update, e.g. the loss.
     */
    struct UpdateDatum
    {
        std::string name; ///< Metric name, "loss" or "gradient_norm"
        float value;      ///< Metric value
    };

    /// Unnormalised log density evaluated on a batch of points, returns the batch shape.
    using LogDensity = std::function<torch::Tensor(const torch::Tensor &)>;

    /**
     * @class Objective
     * @brief Base class of the training objectives.
     *
     * An objective owns an Adam optimizer over every parameter of a distribution and
     * performs one gradient step per update() call. Gradients are clipped to a maximum
     * global norm before the step. Training loops stay with the caller:
     *
     * @code
     * VariationalObjective objective(flow, target, Key(0));
     * for (int step = 0; step < 100; ++step)
     * {
     *     auto data = objective.update();
     * }
     * @endcode
     */
    class Objective
    {
    protected:
        std::shared_ptr<Distribution> distribution;
        double maxGradNorm;
        std::unique_ptr<torch::optim::Adam> optimizer;

        /**
         * @brief Backpropagates `loss`, clips gradients and steps the optimizer.
         *
         * @return {"loss", "gradient_norm"}, the norm measured before clipping
         */
        std::vector<UpdateDatum> step(const torch::Tensor &loss);
    public:
        /**
         * @throws std::invalid_argument if the distribution is null, has no parameters or
         *         if learningRate or maxGradNorm is not positive
         */
        Objective(std::shared_ptr<Distribution> distribution, double learningRate, double maxGradNorm);

        virtual ~Objective() = 0;

        inline const std::shared_ptr<Distribution> &getDistribution() const
        {
            return distribution;
        }
    };

    /**
     * @class VariationalObjective
     * @brief Fits a distribution to an unnormalised target density by minimising the
     *        negative evidence lower bound.
     *
     * The loss is mean(log q(x) - target(x)) over `samplesPerStep` reparameterised samples
     * x ~ q, drawn with sampleAndLogProbability() so the flow never needs an inverse.
     * The stored key is split on every update.
     */
    class VariationalObjective : public Objective
    {
    private:
        LogDensity target;
        Key key;
        int64_t samplesPerStep;
    public:
        /**
         * @throws std::invalid_argument if the target is empty or samplesPerStep < 1
         */
        VariationalObjective(std::shared_ptr<Distribution> distribution,
                             LogDensity target,
                             Key key,
                             double learningRate = 5e-4,
                             int64_t samplesPerStep = 500,
                             double maxGradNorm = 0.5);

        /**
         * @brief Monte Carlo estimate of the negative ELBO using samples drawn from `key`.
         */
        torch::Tensor loss(const Key &key);

        std::vector<UpdateDatum> update();
    };

    /**
     * @class MaximumLikelihoodObjective
     * @brief Fits a distribution to samples by minimising the mean negative log likelihood.
     */
    class MaximumLikelihoodObjective : public Objective
    {
    public:
        explicit MaximumLikelihoodObjective(std::shared_ptr<Distribution> distribution,
                                            double learningRate = 5e-4,
                                            double maxGradNorm = 0.5);

        /**
         * @brief -mean(log p(x | condition)).
         */
        torch::Tensor loss(const torch::Tensor &x, const torch::Tensor &condition = {});

        /**
         * @brief One optimizer step on the batch `x`.
         *
         * @param x Batch of points of shape (*batch, *shape)
         * @param condition Conditions for conditional distributions
         */
        std::vector<UpdateDatum> update(const torch::Tensor &x, const torch::Tensor &condition = {});
    };
}

#endif //TORCHFLOWS_OBJECTIVE_HPP
