#pragma once

#ifndef TORCHFLOWS_FAMILIES_HPP
#define TORCHFLOWS_FAMILIES_HPP

#include<torch/torch.h>

#include"Transformed.hpp"

namespace TorchFlows
{
    /**
     * @class Uniform
     * @brief Independent U[minval, maxval] elements.
     * @throws std::invalid_argument if any maxval <= minval
     */
    class Uniform : public Transformed
    {
    public:
        Uniform(const torch::Tensor &minval, const torch::Tensor &maxval);

        torch::Tensor getMinval() const;

        torch::Tensor getMaxval() const;
    };

    /**
     * @class Gumbel
     * @brief Independent Gumbel elements with location `loc` and scale `scale`.
     */
    class Gumbel : public Transformed
    {
    public:
        Gumbel(const torch::Tensor &loc, const torch::Tensor &scale);

        torch::Tensor getLoc() const;

        torch::Tensor getScale() const;
    };

    /**
     * @class Cauchy
     * @brief Independent Cauchy elements with location `loc` and scale `scale`.
     */
    class Cauchy : public Transformed
    {
    public:
        Cauchy(const torch::Tensor &loc, const torch::Tensor &scale);

        torch::Tensor getLoc() const;

        torch::Tensor getScale() const;
    };

    /**
     * @class StudentT
     * @brief Independent Student's t elements; `df`, `loc` and `scale` broadcast together.
     */
    class StudentT : public Transformed
    {
    public:
        /**
         * @throws std::invalid_argument on non-positive degrees of freedom or scale
         */
        StudentT(const torch::Tensor &df, const torch::Tensor &loc, const torch::Tensor &scale);

        torch::Tensor getDf() const;

        torch::Tensor getLoc() const;

        torch::Tensor getScale() const;
    };

    /**
     * @class Laplace
     * @brief Independent Laplace elements with location `loc` and scale `scale`.
     */
    class Laplace : public Transformed
    {
    public:
        Laplace(const torch::Tensor &loc, const torch::Tensor &scale);

        torch::Tensor getLoc() const;

        torch::Tensor getScale() const;
    };

    /**
     * @class Exponential
     * @brief Independent exponential elements, StandardExponential scaled by 1 / rate.
     */
    class Exponential : public Transformed
    {
    public:
        /**
         * @throws std::invalid_argument if any rate is not strictly positive
         */
        explicit Exponential(const torch::Tensor &rate);

        torch::Tensor getRate() const;
    };
}

#endif //TORCHFLOWS_FAMILIES_HPP
