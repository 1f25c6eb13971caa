#pragma once

// Common helpers used across the pipeline
#include "utils/logging.hpp"
#include "utils/errors.hpp"
#include "utils/time.hpp"
#include "utils/math.hpp"
#include "utils/camera.hpp"
