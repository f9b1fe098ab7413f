#pragma once

#ifndef TORCHFLOWS_TRIANGULARAFFINE_HPP
#define TORCHFLOWS_TRIANGULARAFFINE_HPP

#include<torch/torch.h>

#include"Bijection.hpp"

namespace TorchFlows
{
    /**
     * @class TriangularAffine
     * @brief Affine bijection `y = L x + loc` with a lower triangular `L`.
     *
     * `L` must have a strictly positive diagonal. It is stored as an unconstrained matrix
     * whose strictly lower part is selected on every use, plus the log of the diagonal,
     * so the triangular structure and positivity survive training.
     *
     * Used by MultivariateNormal with `L` the Cholesky factor of the covariance.
     */
    class TriangularAffine : public Bijection
    {
    private:
        torch::Tensor loc;         ///< Shape (dim)
        torch::Tensor lower;       ///< Raw (dim, dim) matrix, only the strictly lower part is used
        torch::Tensor logDiagonal; ///< Shape (dim)
    public:
        /**
         * @param loc Location, scalar or shape (dim)
         * @param arr Lower triangular matrix of shape (dim, dim)
         *
         * @throws std::invalid_argument if arr is not square, not lower triangular, has a
         *         non-positive diagonal, or loc does not broadcast to (dim)
         */
        TriangularAffine(const torch::Tensor &loc, const torch::Tensor &arr);

        /**
         * @brief The lower triangular matrix `L`.
         */
        torch::Tensor getMatrix() const;

        inline torch::Tensor getLoc() const
        {
            return loc;
        }

        std::pair<torch::Tensor, torch::Tensor> transformAndLogDet(const torch::Tensor &x,
                                                                   const torch::Tensor &condition = {}) override;

        std::pair<torch::Tensor, torch::Tensor> inverseAndLogDet(const torch::Tensor &y,
                                                                 const torch::Tensor &condition = {}) override;
    };
}

#endif //TORCHFLOWS_TRIANGULARAFFINE_HPP
