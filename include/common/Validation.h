#pragma once

#include <vector>
#include "common/Types.h"

namespace tradepulse {

// Throws InputValidationError when timestamps decrease or an OHLCV field is
// not a finite number. OHLC ordering (high >= low ...) is left to the feed.
void validateCandles(const std::vector<Candle>& candles);

// Same check for parallel price windows handed to the leverage evaluator.
void validatePriceWindow(const std::vector<double>& closes,
                         const std::vector<double>& highs,
                         const std::vector<double>& lows);

} // namespace tradepulse
