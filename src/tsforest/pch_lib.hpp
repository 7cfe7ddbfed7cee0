#pragma once

// STD C/C++
#include "pch_std.hpp"

// MLPACK (brings ARMADILLO)
#include <mlpack/core.hpp>

// JSONCPP
#include <json/json.h>
