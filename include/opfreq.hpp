#pragma once

#include "opfreq/analysis.hpp"
#include "opfreq/cli.hpp"
#include "opfreq/config.hpp"
#include "opfreq/discovery.hpp"
#include "opfreq/format.hpp"
#include "opfreq/report.hpp"
#include "opfreq/utils.hpp"
