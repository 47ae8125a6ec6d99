#pragma once

#include "country.h"
#include "datastore.h"
#include "disease.h"
#include "exception.h"
#include "forward_type.h"
#include "interval.h"
#include "poco.h"
#include "string_util.h"

namespace haq {
/// \brief Top-level namespace for HealthAQ Core C++ API
namespace core {}
} // namespace haq
