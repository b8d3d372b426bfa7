#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace tradepulse {
namespace data {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    // Rows keep file order; ordering is checked by validateCandles()
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array of objects
    // Keys: timestamp|t, open|o, high|h, low|l, close|c, volume|v
    // Objects without a timestamp are skipped
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Picks loadJSON for *.json, loadCSV otherwise
    static std::vector<Candle> load(const std::string& file_path);
};

} // namespace data
} // namespace tradepulse
