#pragma once

#include "Core/Error.hpp"
#include "Core/Step.hpp"
#include "Core/Bound.hpp"
#include "Core/Range.hpp"
#include "Core/Index.hpp"
#include "Core/Slice.hpp"

// Serialization pulls in cereal. Include Exrange/Core/Serialize.hpp when needed
