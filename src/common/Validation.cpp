#include "common/Validation.h"
#include "common/Errors.h"

#include <cmath>
#include <string>

namespace tradepulse {

namespace {
bool isFinite(double v) {
    return std::isfinite(v);
}

void requireFinite(const std::vector<double>& values, const char* name) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!isFinite(values[i])) {
            throw InputValidationError(std::string("non-finite ") + name +
                                       " at index " + std::to_string(i));
        }
    }
}
}

void validateCandles(const std::vector<Candle>& candles) {
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        if (!isFinite(c.open) || !isFinite(c.high) || !isFinite(c.low) ||
            !isFinite(c.close) || !isFinite(c.volume)) {
            throw InputValidationError("candle " + std::to_string(i) +
                                       " has a missing or non-finite OHLCV field");
        }
        if (i > 0 && c.timestamp < candles[i - 1].timestamp) {
            throw InputValidationError("candle timestamps decrease at index " +
                                       std::to_string(i) + " (" +
                                       std::to_string(candles[i - 1].timestamp) + " -> " +
                                       std::to_string(c.timestamp) + ")");
        }
    }
}

void validatePriceWindow(const std::vector<double>& closes,
                         const std::vector<double>& highs,
                         const std::vector<double>& lows) {
    if (highs.size() != closes.size() || lows.size() != closes.size()) {
        throw InputValidationError("price window length mismatch: closes=" +
                                   std::to_string(closes.size()) +
                                   " highs=" + std::to_string(highs.size()) +
                                   " lows=" + std::to_string(lows.size()));
    }
    requireFinite(closes, "close");
    requireFinite(highs, "high");
    requireFinite(lows, "low");
}

} // namespace tradepulse
