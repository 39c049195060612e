#pragma once

#include "common/constants.hpp"
#include "common/error_codes.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "core/bar_options.hpp"
#include "core/progress_bar.hpp"
#include "group/progress_group.hpp"
#include "iter/progress_range.hpp"
#include "term/output_sink.hpp"

namespace livebar {

using core::BarOptions;
using core::ProgressBar;
using group::GroupOptions;
using group::ProgressGroup;
using common::BarError;
using common::BarErrorCode;

}
