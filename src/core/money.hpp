/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.hpp
 * ============================================================================
 */

#ifndef TALLY_MONEY_HPP
#define TALLY_MONEY_HPP

#include <optional>
#include <string>
#include "model.hpp"

namespace tally {

    /**
     * @brief Parses a bank-formatted amount into micro-units.
     * Accepts "$", surrounding whitespace, a leading sign and accounting
     * parentheses "(4.50)". At most 6 fractional digits.
     * With decimal_separator '.' the group separator is ',' ("1,234.56");
     * with ',' it is '.' ("1.234,56"). Groups must hold exactly three digits.
     * @return std::nullopt when the text is empty, not a number, or out of range.
     */
    std::optional<money_micro> parse_money(const std::string& text, char decimal_separator = '.');

    // "-4.50", "1234.00", "0.123456": at least two decimals, trailing zeros beyond that dropped.
    std::string format_money(money_micro micros);

} // namespace tally

#endif // TALLY_MONEY_HPP
