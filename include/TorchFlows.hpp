#pragma once

#include"Errors.hpp"
#include"Types.hpp"

#include"Random/Key.hpp"

#include"Model/BlockActivation.hpp"
#include"Model/BlockAutoregressiveLinear.hpp"
#include"Model/modelUtils.hpp"

#include"Bijection/Affine.hpp"
#include"Bijection/Bijection.hpp"
#include"Bijection/BlockAutoregressiveNetwork.hpp"
#include"Bijection/Chain.hpp"
#include"Bijection/Exp.hpp"
#include"Bijection/TriangularAffine.hpp"

#include"Distribution/Distribution.hpp"
#include"Distribution/Families.hpp"
#include"Distribution/Normal.hpp"
#include"Distribution/SpecializeCondition.hpp"
#include"Distribution/Standard.hpp"
#include"Distribution/Transformed.hpp"

#include"Train/Objective.hpp"
