#ifndef TORCHFLOWS_MODELUTILS_HPP
#define TORCHFLOWS_MODELUTILS_HPP

#include<utility>

#include<torch/torch.h>

#include"../Random/Key.hpp"

namespace TorchFlows
{
    /**
     * @brief Block diagonal mask.
     *
     * Returns a `(rows * nBlocks) x (cols * nBlocks)` matrix with `nBlocks` blocks of ones
     * of shape `blockShape` on the diagonal and zeros elsewhere.
     *
     * @param blockShape (rows, cols) of every block
     * @param nBlocks Number of diagonal blocks
     * @param options Tensor options of the returned mask
     */
    torch::Tensor blockDiagonalMask(std::pair<int64_t, int64_t> blockShape,
                                    int64_t nBlocks,
                                    torch::TensorOptions options);

    /**
     * @brief Strictly lower block triangular mask.
     *
     * Ones in every block whose block-row index is greater than its block-column index,
     * zeros on and above the diagonal blocks. Together with blockDiagonalMask this is the
     * sparsity pattern of an autoregressive weight matrix.
     */
    torch::Tensor blockLowerMask(std::pair<int64_t, int64_t> blockShape,
                                 int64_t nBlocks,
                                 torch::TensorOptions options);

    /**
     * @brief Variance scaling (Glorot/Xavier uniform) initialisation of a 2d weight.
     *
     * Draws from U(-limit, limit) with `limit = sqrt(6 / (fanIn + fanOut))`, where
     * `fanOut = rows` and `fanIn = cols`.
     *
     * @param key Random key for the draw
     * @param rows Number of output features
     * @param cols Number of input features
     */
    torch::Tensor glorotUniform(const Key &key, int64_t rows, int64_t cols, torch::TensorOptions options);

    /**
     * @brief Numerically stable `log(exp(x) @ exp(y))`.
     *
     * Computes the matrix product of two matrices stored as element-wise logarithms
     * without leaving the log domain.
     *
     * **Algorithm Overview:**
     * - Shift every row of `x` by its maximum and every column of `y` by its maximum
     * - Exponentiate, multiply, take the logarithm
     * - Add both shifts back
     *
     * The shifts are detached: they cancel analytically, so they carry no gradient.
     * Leading dimensions broadcast as for torch::matmul.
     *
     * @param x Tensor of shape (..., n, k) holding log values
     * @param y Tensor of shape (..., k, m) holding log values
     * @return Tensor of shape (..., n, m)
     */
    torch::Tensor logMatMulExp(const torch::Tensor &x, const torch::Tensor &y);
}

#endif //TORCHFLOWS_MODELUTILS_HPP
