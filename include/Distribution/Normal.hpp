#pragma once

#ifndef TORCHFLOWS_NORMAL_HPP
#define TORCHFLOWS_NORMAL_HPP

#include<torch/torch.h>

#include"Transformed.hpp"

namespace TorchFlows
{
    /**
     * @class Normal
     * @brief Independent normal elements, built as an Affine transform of StandardNormal.
     *
     * `loc` and `scale` broadcast to the shape of the distribution.
     */
    class Normal : public Transformed
    {
    public:
        /**
         * @throws std::invalid_argument if any scale entry is not strictly positive
         */
        Normal(const torch::Tensor &loc, const torch::Tensor &scale);

        explicit Normal(double loc = 0, double scale = 1);

        torch::Tensor getLoc() const;

        torch::Tensor getScale() const;
    };

    /**
     * @class LogNormal
     * @brief exp(X) for a normally distributed X, built as Chain{Affine, Exp} over StandardNormal.
     */
    class LogNormal : public Transformed
    {
    public:
        /**
         * @param loc Mean of the underlying normal
         * @param scale Standard deviation of the underlying normal
         */
        LogNormal(const torch::Tensor &loc, const torch::Tensor &scale);

        explicit LogNormal(double loc = 0, double scale = 1);

        torch::Tensor getLoc() const;

        torch::Tensor getScale() const;
    };

    /**
     * @class MultivariateNormal
     * @brief Multivariate normal with full covariance.
     *
     * The covariance is factorised once as L L^T and the distribution is the
     * TriangularAffine(loc, L) transform of a StandardNormal of shape (dim,).
     */
    class MultivariateNormal : public Transformed
    {
    public:
        /**
         * @param loc Mean, broadcastable to (dim,)
         * @param covariance Symmetric positive definite matrix of shape (dim, dim)
         * @throws std::invalid_argument if the covariance is not square, not symmetric or
         *         not positive definite
         */
        MultivariateNormal(const torch::Tensor &loc, const torch::Tensor &covariance);

        torch::Tensor getLoc() const;

        torch::Tensor getCovariance() const;
    };
}

#endif //TORCHFLOWS_NORMAL_HPP
