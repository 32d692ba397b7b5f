#pragma once

#include <string>
#include <vector>

#include "consensus/amount.h"
#include "primitives/transaction.h"

#include "common.hpp"

namespace ordguard {

std::string FormatAmount(CAmount amount);

// Virtual size the way Bitcoin Core weighs a transaction: witness bytes count a quarter
size_t GetVirtualSize(const CMutableTransaction& tx);

template <typename T>
void LogTx(const T& tx);

}
