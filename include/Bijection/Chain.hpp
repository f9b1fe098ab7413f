#pragma once

#ifndef TORCHFLOWS_CHAIN_HPP
#define TORCHFLOWS_CHAIN_HPP

#include<memory>
#include<vector>

#include<torch/torch.h>

#include"Bijection.hpp"

namespace TorchFlows
{
    /**
     * @class Chain
     * @brief Composition of bijections applied in order.
     *
     * Forward applies `bijections[0]` first; the inverse runs the sequence backwards
     * through each bijection's inverse. Log determinants are summed.
     *
     * All members must share the same shape. Conditioning shapes are merged: every
     * conditional member must declare the same condShape, and the condition is passed to
     * every member.
     */
    class Chain : public Bijection
    {
    private:
        std::vector<std::shared_ptr<Bijection>> bijections;
    public:
        /**
         * @throws std::invalid_argument if the list is empty, a member is null, shapes
         *         differ, or conditioning shapes conflict
         */
        explicit Chain(std::vector<std::shared_ptr<Bijection>> bijections);

        torch::Tensor transform(const torch::Tensor &x, const torch::Tensor &condition = {}) override;

        std::pair<torch::Tensor, torch::Tensor> transformAndLogDet(const torch::Tensor &x,
                                                                   const torch::Tensor &condition = {}) override;

        torch::Tensor inverse(const torch::Tensor &y, const torch::Tensor &condition = {}) override;

        std::pair<torch::Tensor, torch::Tensor> inverseAndLogDet(const torch::Tensor &y,
                                                                 const torch::Tensor &condition = {}) override;

        /**
         * @brief Splices nested chains into a single flat chain.
         *
         * The result applies exactly the same bijections in the same order and shares
         * them (and their parameters) with this chain.
         */
        std::shared_ptr<Chain> mergeChains() const;

        inline size_t size() const
        {
            return bijections.size();
        }

        inline const std::shared_ptr<Bijection> &operator[](size_t index) const
        {
            return bijections.at(index);
        }

        inline const std::vector<std::shared_ptr<Bijection>> &getBijections() const
        {
            return bijections;
        }
    };
}

#endif //TORCHFLOWS_CHAIN_HPP
