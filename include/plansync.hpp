#pragma once

#include "plansync/config.hpp"
#include "plansync/failure.hpp"
#include "plansync/format.hpp"
#include "plansync/harness.hpp"
#include "plansync/literal.hpp"
#include "plansync/patcher.hpp"
#include "plansync/reconcile.hpp"
#include "plansync/strategy.hpp"
#include "plansync/utils.hpp"
