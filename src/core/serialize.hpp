/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: serialize.hpp
 * ============================================================================
 * * DESCRIPTION:
 * nlohmann::json conversions for the records the HTTP service returns and
 * for the row-error list kept on each import run.
 * Money travels as a decimal string ("-4.50") plus the raw micro-units.
 * ============================================================================
 */

#ifndef TALLY_SERIALIZE_HPP
#define TALLY_SERIALIZE_HPP

#include <nlohmann/json.hpp>
#include "model.hpp"

namespace tally {

    void to_json(nlohmann::json& j, const Account& a);
    void to_json(nlohmann::json& j, const Transaction& t);
    void to_json(nlohmann::json& j, const RowError& e);
    void from_json(const nlohmann::json& j, RowError& e);
    void to_json(nlohmann::json& j, const ImportRun& r);

} // namespace tally

#endif // TALLY_SERIALIZE_HPP
