#pragma once

#ifndef TORCHFLOWS_TYPES_HPP
#define TORCHFLOWS_TYPES_HPP

#include<optional>
#include<string>
#include<vector>

#include<torch/torch.h>

namespace TorchFlows
{
    /// Shape of a single unbatched sample (or of a conditioning variable).
    using Shape = std::vector<int64_t>;

    /// Conditioning shape; std::nullopt for unconditional distributions and bijections.
    using OptionalShape = std::optional<Shape>;

    /**
     * @brief Tensor options used when the library creates tensors without a template.
     *
     * All distributions and bijections built from plain scalars use double precision.
     */
    inline torch::TensorOptions defaultOptions()
    {
        return torch::TensorOptions().dtype(torch::kFloat64);
    }

    /**
     * @brief Formats a shape as a tuple, e.g. "(2, 3)" or "()".
     */
    std::string shapeToString(const Shape &shape);

    std::string shapeToString(const OptionalShape &shape);

    /**
     * @brief Number of elements held by a tensor of the given shape.
     */
    int64_t shapeNumel(const Shape &shape);

    /**
     * @brief Concatenates two shapes.
     */
    Shape concatShapes(const Shape &leading, const Shape &trailing);

    /**
     * @brief Checks that the trailing dimensions of `tensor` equal `expected`.
     *
     * @param name Name of the argument used in the error message.
     * @throws ShapeError if the tensor is undefined, has too few dimensions or the
     *         trailing dimensions differ.
     */
    void checkTrailingShape(const torch::Tensor &tensor, const Shape &expected, const std::string &name);

    /**
     * @brief Returns the leading (batch) dimensions of `tensor` given its trailing event shape.
     *
     * Assumes checkTrailingShape has succeeded.
     */
    Shape leadingShape(const torch::Tensor &tensor, const Shape &trailing);

    /**
     * @brief Numpy style broadcast of two shapes.
     *
     * @throws ShapeError if the shapes are not broadcast compatible.
     */
    Shape broadcastShapes(const Shape &first, const Shape &second);

    /**
     * @brief Merges conditioning shapes.
     *
     * Returns std::nullopt if every shape is std::nullopt, otherwise the single
     * shape shared by all non-null entries.
     *
     * @throws std::invalid_argument if two non-null shapes differ.
     */
    OptionalShape mergeConditionShapes(const std::vector<OptionalShape> &shapes);

    /**
     * @brief Sums the last `n` dimensions of a tensor. Returns the tensor itself for n == 0.
     */
    torch::Tensor sumTrailing(const torch::Tensor &tensor, int64_t n);
}

#endif //TORCHFLOWS_TYPES_HPP
