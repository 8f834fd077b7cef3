#pragma once

// This is the single entry-point for the ndfourier library.
// Include this file to get access to all the core functionality.

#include "ndfourier/debug.hpp"
#include "ndfourier/dtype.hpp"
#include "ndfourier/error.hpp"
#include "ndfourier/fourier.hpp"
#include "ndfourier/normalize.hpp"
#include "ndfourier/output.hpp"
#include "ndfourier/shape.hpp"
#include "ndfourier/storage.hpp"
#include "ndfourier/tensor.hpp"
