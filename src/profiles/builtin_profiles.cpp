/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: builtin_profiles.cpp
 * ============================================================================
 * * DESCRIPTION:
 * Export layouts shipped with the engine. Order matters: it is the order
 * detection tries them in.
 * ============================================================================
 */

#include "ProfileRegistry.hpp"

namespace tally {
namespace profiles {

namespace {

BankProfile chase(const std::string& id, const std::string& account, const std::string& hint) {
    BankProfile p;
    p.id = id;
    p.institution = "Chase";
    p.account_name = account;
    p.signature = {"Transaction Date", "Post Date", "Description", "Category", "Type", "Amount"};
    p.filename_hint = hint;
    p.columns.date = "Transaction Date";
    p.columns.description = "Description";
    p.columns.amount = "Amount";
    p.columns.type = "Type";
    p.columns.memo = "Memo";
    p.columns.category = "Category";
    p.date_formats = {"%m/%d/%Y", "%Y-%m-%d"};
    // Chase lists purchases and card payments with a positive amount.
    p.sign = SignConvention::TypeColumn;
    p.debit_types = {"sale", "payment"};
    p.combine_memo = true;
    return p;
}

BankProfile capital_one() {
    BankProfile p;
    p.id = "capital_one";
    p.institution = "Capital One";
    p.account_name = "Capital One";
    p.signature = {"Transaction Date", "Posted Date", "Card No.", "Description", "Category", "Debit", "Credit"};
    p.columns.date = "Transaction Date";
    p.columns.description = "Description";
    p.columns.debit = "Debit";
    p.columns.credit = "Credit";
    p.columns.category = "Category";
    p.date_formats = {"%m/%d/%Y", "%Y-%m-%d"};
    p.sign = SignConvention::DebitCredit;
    return p;
}

BankProfile pnc() {
    BankProfile p;
    p.id = "pnc";
    p.institution = "PNC Bank";
    p.account_name = "PNC Checking";
    p.signature = {"Date", "Description", "Withdrawals", "Deposits", "Category", "Balance"};
    p.columns.date = "Date";
    p.columns.description = "Description";
    p.columns.debit = "Withdrawals";
    p.columns.credit = "Deposits";
    p.columns.category = "Category";
    p.date_formats = {"%m/%d/%Y", "%Y-%m-%d"};
    p.sign = SignConvention::DebitCredit;
    return p;
}

BankProfile generic(const std::string& default_account) {
    BankProfile p;
    p.id = "generic";
    p.institution = "Generic";
    p.account_name = default_account;
    p.signature = {"Date", "Description", "Amount"};
    p.columns.date = "Date";
    p.columns.description = "Description";
    p.columns.amount = "Amount";
    p.columns.category = "Category";
    p.columns.account = "Account";
    p.date_formats = {"%Y-%m-%d", "%m/%d/%Y"};
    p.sign = SignConvention::Signed;
    return p;
}

} // namespace

std::vector<BankProfile> builtin_profiles(const std::string& default_account) {
    return {
        chase("chase_star_wars", "Chase Star Wars", "star_wars"),
        chase("chase_sw", "Chase SW", ""),
        capital_one(),
        pnc(),
        generic(default_account)
    };
}

} // namespace profiles
} // namespace tally
