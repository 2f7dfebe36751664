#pragma once

#include "txasm/base58.hpp"
#include "txasm/builder.hpp"
#include "txasm/codec.hpp"
#include "txasm/compute_budget.hpp"
#include "txasm/config.hpp"
#include "txasm/error.hpp"
#include "txasm/fee_calculator.hpp"
#include "txasm/instruction.hpp"
#include "txasm/keys.hpp"
#include "txasm/optimizer.hpp"
#include "txasm/transaction.hpp"
