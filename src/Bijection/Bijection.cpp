#include<torch/torch.h>

#include"../../include/Bijection/Bijection.hpp"

namespace TorchFlows
{
    Bijection::Bijection(Shape shape, OptionalShape condShape) :
        eventShape(std::move(shape)),
        conditionShape(std::move(condShape))
    {
    }

    void Bijection::checkShapes(const torch::Tensor &x, const torch::Tensor &condition) const
    {
        checkTrailingShape(x, eventShape, "x");
        if (conditionShape)
        {
            checkTrailingShape(condition, *conditionShape, "condition");
        }
    }

    torch::Tensor Bijection::expandToBatch(const torch::Tensor &logDet, const torch::Tensor &x) const
    {
        return logDet.expand(leadingShape(x, eventShape));
    }

    torch::Tensor Bijection::transform(const torch::Tensor &x, const torch::Tensor &condition)
    {
        return transformAndLogDet(x, condition).first;
    }

    torch::Tensor Bijection::inverse(const torch::Tensor &y, const torch::Tensor &condition)
    {
        return inverseAndLogDet(y, condition).first;
    }
}
