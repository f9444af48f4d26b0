//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <string>
#include <sstream>
#include <iomanip>

namespace core::utils {
    constexpr int LINE_ITEM_PRECISION = 2;
    constexpr int PAYABLE_TOTAL_PRECISION = 3;

    /**
     * @brief Fixed-point rendering with exactly `precision` decimals, zeros kept.
     */
    inline std::string formatFixed(double value, int precision) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        std::string result = oss.str();

        // "-0.00" for tiny negative rounding noise
        if (!result.empty() && result.front() == '-' && result.find_first_not_of("-0.") == std::string::npos) {
            result.erase(0, 1);
        }
        return result;
    }

    inline std::string formatLineItem(double amount) {
        return formatFixed(amount, LINE_ITEM_PRECISION);
    }

    inline std::string formatPayableTotal(double amount) {
        return formatFixed(amount, PAYABLE_TOTAL_PRECISION);
    }
} // namespace core::utils
