#pragma once

#include <string_view>

namespace sqlsandbox::ast {

// libpg_query JSON node types and fields
inline constexpr std::string_view kStmts      = "stmts";
inline constexpr std::string_view kStmt       = "stmt";
inline constexpr std::string_view kSelectStmt = "SelectStmt";
inline constexpr std::string_view kRangeVar   = "RangeVar";
inline constexpr std::string_view kRelname    = "relname";
inline constexpr std::string_view kJoinExpr   = "JoinExpr";
inline constexpr std::string_view kFuncCall   = "FuncCall";
inline constexpr std::string_view kFuncname   = "funcname";
inline constexpr std::string_view kSubLink    = "SubLink";
inline constexpr std::string_view kRangeSubselect = "RangeSubselect";
inline constexpr std::string_view kRangeFunction  = "RangeFunction";
inline constexpr std::string_view kIntoClause = "intoClause";
inline constexpr std::string_view kString     = "String";
inline constexpr std::string_view kSval       = "sval";   // libpg_query >= 15
inline constexpr std::string_view kStr        = "str";    // libpg_query 13

inline constexpr std::string_view kUnknownParseError = "Unknown parse error";

} // namespace sqlsandbox::ast
