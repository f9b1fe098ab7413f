#pragma once

#ifndef TORCHFLOWS_BIJECTION_HPP
#define TORCHFLOWS_BIJECTION_HPP

#include<utility>

#include<torch/nn.h>
#include<torch/torch.h>

#include"../Types.hpp"

namespace TorchFlows
{
    /**
     * @class Bijection
     * @brief Abstract base class for invertible transformations.
     *
     * A bijection maps between two spaces of equal shape and reports the log of the
     * absolute determinant of its Jacobian in both directions. Methods are defined for a
     * single point of shape `shape()` (and a condition of shape `condShape()` for
     * conditional bijections) and accept any number of leading batch dimensions, which
     * are processed independently. Log determinants come back with the batch shape.
     *
     * The condition argument is an undefined tensor for unconditional use; unconditional
     * bijections ignore it.
     *
     * Bijections are torch::nn::Module instances so that their trainable tensors are
     * reachable through parameters().
     *
     * @see Chain
     * @see BlockAutoregressiveNetwork
     */
    class Bijection : public torch::nn::Module
    {
    protected:
        Shape eventShape;          ///< Shape of a single unbatched input
        OptionalShape conditionShape; ///< Shape of the conditioning variable, if any

        /**
         * @brief Checks the trailing dimensions of an input and, for conditional
         *        bijections, of the condition.
         *
         * @throws ShapeError on mismatch
         */
        void checkShapes(const torch::Tensor &x, const torch::Tensor &condition) const;

        /**
         * @brief Expands a log determinant of a single point to the batch shape of x.
         */
        torch::Tensor expandToBatch(const torch::Tensor &logDet, const torch::Tensor &x) const;
    public:
        Bijection(Shape shape, OptionalShape condShape);

        virtual ~Bijection() = default;

        inline const Shape &shape() const
        {
            return eventShape;
        }

        inline const OptionalShape &condShape() const
        {
            return conditionShape;
        }

        /**
         * @brief Applies the forward transformation.
         *
         * The default implementation discards the log determinant of transformAndLogDet().
         */
        virtual torch::Tensor transform(const torch::Tensor &x, const torch::Tensor &condition = {});

        /**
         * @brief Applies the forward transformation and computes log|det J(x)|.
         *
         * @return (y, logDet) with logDet of the batch shape of x
         */
        virtual std::pair<torch::Tensor, torch::Tensor> transformAndLogDet(const torch::Tensor &x,
                                                                           const torch::Tensor &condition = {}) = 0;

        /**
         * @brief Applies the inverse transformation.
         *
         * The default implementation discards the log determinant of inverseAndLogDet().
         */
        virtual torch::Tensor inverse(const torch::Tensor &y, const torch::Tensor &condition = {});

        /**
         * @brief Applies the inverse transformation and computes log|det J^{-1}(y)|.
         *
         * @return (x, logDet) with logDet of the batch shape of y
         */
        virtual std::pair<torch::Tensor, torch::Tensor> inverseAndLogDet(const torch::Tensor &y,
                                                                         const torch::Tensor &condition = {}) = 0;
    };
}

#endif //TORCHFLOWS_BIJECTION_HPP
