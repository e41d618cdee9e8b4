#pragma once

#include "candle.hpp"
#include <vector>
#include <optional>
#include <cstddef>

namespace patterns {

/// Read-only view of `size` consecutive candles ending at a confirming index.
/// Index 0 is the oldest candle of the window, size()-1 the confirming candle.
/// A window that would start before the first candle cannot be created.
class CandleWindow {
public:
    /// Window of `size` candles ending at `end_index` (inclusive), or nullopt if it does not fit.
    static std::optional<CandleWindow> endingAt(const std::vector<Candle>& candles,
                                                std::size_t end_index,
                                                std::size_t size) {
        if (size == 0 || end_index >= candles.size() || end_index + 1 < size)
            return std::nullopt;
        return CandleWindow(candles.data() + (end_index + 1 - size), size);
    }

    std::size_t size() const { return size_; }

    const Candle& operator[](std::size_t i) const { return first_[i]; }

    /// Confirming candle.
    const Candle& last() const { return first_[size_ - 1]; }

    /// k = 0 is the confirming candle, k = 1 the one before it, ...
    const Candle& back(std::size_t k) const { return first_[size_ - 1 - k]; }

private:
    CandleWindow(const Candle* first, std::size_t size)
        : first_(first), size_(size) {}

    const Candle* first_;
    std::size_t size_;
};

} // namespace patterns
