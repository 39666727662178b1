#pragma once

#include <string_view>

namespace querygate::ast::keys {

// libpg_query JSON node types and field names (shared by builder and parser)

// ---- Top level ----
inline constexpr std::string_view kStmts      = "stmts";
inline constexpr std::string_view kStmt       = "stmt";
inline constexpr std::string_view kSelectStmt = "SelectStmt";

// ---- SelectStmt ----
inline constexpr std::string_view kDistinctClause = "distinctClause";
inline constexpr std::string_view kTargetList     = "targetList";
inline constexpr std::string_view kFromClause     = "fromClause";
inline constexpr std::string_view kWhereClause    = "whereClause";
inline constexpr std::string_view kGroupClause    = "groupClause";
inline constexpr std::string_view kHavingClause   = "havingClause";
inline constexpr std::string_view kSortClause     = "sortClause";
inline constexpr std::string_view kLimitCount     = "limitCount";
inline constexpr std::string_view kLimitOffset    = "limitOffset";
inline constexpr std::string_view kLimitOption    = "limitOption";
inline constexpr std::string_view kWithClause     = "withClause";
inline constexpr std::string_view kIntoClause     = "intoClause";
inline constexpr std::string_view kLockingClause  = "lockingClause";
inline constexpr std::string_view kValuesLists    = "valuesLists";
inline constexpr std::string_view kWindowClause   = "windowClause";
inline constexpr std::string_view kOp             = "op";
inline constexpr std::string_view kAll            = "all";
inline constexpr std::string_view kLarg           = "larg";
inline constexpr std::string_view kRarg           = "rarg";

// ---- Table references ----
inline constexpr std::string_view kRangeVar       = "RangeVar";
inline constexpr std::string_view kRelname        = "relname";
inline constexpr std::string_view kSchemaname     = "schemaname";
inline constexpr std::string_view kCatalogname    = "catalogname";
inline constexpr std::string_view kInh            = "inh";            // absent for FROM ONLY
inline constexpr std::string_view kAlias          = "Alias";
inline constexpr std::string_view kAliasFld       = "alias";
inline constexpr std::string_view kAliasname      = "aliasname";
inline constexpr std::string_view kColnames       = "colnames";
inline constexpr std::string_view kJoinExpr       = "JoinExpr";
inline constexpr std::string_view kJointype       = "jointype";
inline constexpr std::string_view kQuals          = "quals";
inline constexpr std::string_view kUsingClause    = "usingClause";
inline constexpr std::string_view kIsNatural      = "isNatural";
inline constexpr std::string_view kRangeSubselect = "RangeSubselect";
inline constexpr std::string_view kSubquery       = "subquery";
inline constexpr std::string_view kLateral        = "lateral";

// ---- Expressions ----
inline constexpr std::string_view kResTarget      = "ResTarget";
inline constexpr std::string_view kName           = "name";
inline constexpr std::string_view kVal            = "val";
inline constexpr std::string_view kColumnRef      = "ColumnRef";
inline constexpr std::string_view kFields         = "fields";
inline constexpr std::string_view kAStar          = "A_Star";
inline constexpr std::string_view kAConst         = "A_Const";
inline constexpr std::string_view kAExpr          = "A_Expr";
inline constexpr std::string_view kKind           = "kind";
inline constexpr std::string_view kLexpr          = "lexpr";
inline constexpr std::string_view kRexpr          = "rexpr";
inline constexpr std::string_view kBoolExpr       = "BoolExpr";
inline constexpr std::string_view kBoolop         = "boolop";
inline constexpr std::string_view kArgs           = "args";
inline constexpr std::string_view kArg            = "arg";
inline constexpr std::string_view kNullTest       = "NullTest";
inline constexpr std::string_view kNulltesttype   = "nulltesttype";
inline constexpr std::string_view kBooleanTest    = "BooleanTest";
inline constexpr std::string_view kBooltesttype   = "booltesttype";
inline constexpr std::string_view kFuncCall       = "FuncCall";
inline constexpr std::string_view kFuncname       = "funcname";
inline constexpr std::string_view kAggStar        = "agg_star";
inline constexpr std::string_view kAggDistinct    = "agg_distinct";
inline constexpr std::string_view kAggOrder       = "agg_order";
inline constexpr std::string_view kAggFilter      = "agg_filter";
inline constexpr std::string_view kAggWithinGroup = "agg_within_group";
inline constexpr std::string_view kFuncVariadic   = "func_variadic";
inline constexpr std::string_view kOver           = "over";
inline constexpr std::string_view kWindowDef      = "WindowDef";
inline constexpr std::string_view kPartitionClause = "partitionClause";
inline constexpr std::string_view kOrderClause    = "orderClause";
inline constexpr std::string_view kFrameOptions   = "frameOptions";
inline constexpr std::string_view kRefname        = "refname";
inline constexpr std::string_view kTypeCast       = "TypeCast";
inline constexpr std::string_view kTypeName       = "TypeName";
inline constexpr std::string_view kTypeNameFld    = "typeName";
inline constexpr std::string_view kNames          = "names";
inline constexpr std::string_view kTypmods        = "typmods";
inline constexpr std::string_view kArrayBounds    = "arrayBounds";
inline constexpr std::string_view kCaseExpr       = "CaseExpr";
inline constexpr std::string_view kCaseWhen       = "CaseWhen";
inline constexpr std::string_view kExpr           = "expr";
inline constexpr std::string_view kResult         = "result";
inline constexpr std::string_view kDefresult      = "defresult";
inline constexpr std::string_view kCoalesceExpr   = "CoalesceExpr";
inline constexpr std::string_view kMinMaxExpr     = "MinMaxExpr";
inline constexpr std::string_view kSubLink        = "SubLink";
inline constexpr std::string_view kSubLinkType    = "subLinkType";
inline constexpr std::string_view kTestexpr       = "testexpr";
inline constexpr std::string_view kOperName       = "operName";
inline constexpr std::string_view kSubselect      = "subselect";
inline constexpr std::string_view kSQLValueFunction = "SQLValueFunction";
inline constexpr std::string_view kTypmod         = "typmod";
inline constexpr std::string_view kAArrayExpr     = "A_ArrayExpr";
inline constexpr std::string_view kElements       = "elements";
inline constexpr std::string_view kSortBy         = "SortBy";
inline constexpr std::string_view kNode           = "node";
inline constexpr std::string_view kSortbyDir      = "sortby_dir";
inline constexpr std::string_view kSortbyNulls    = "sortby_nulls";
inline constexpr std::string_view kWithClauseType = "WithClause";
inline constexpr std::string_view kCtes           = "ctes";
inline constexpr std::string_view kCommonTableExpr = "CommonTableExpr";
inline constexpr std::string_view kCtename        = "ctename";
inline constexpr std::string_view kCtequery       = "ctequery";
inline constexpr std::string_view kList           = "List";
inline constexpr std::string_view kItems          = "items";

// ---- Scalar values ----
inline constexpr std::string_view kString   = "String";
inline constexpr std::string_view kInteger  = "Integer";
inline constexpr std::string_view kFloat    = "Float";
inline constexpr std::string_view kBoolean  = "Boolean";
inline constexpr std::string_view kBitString = "BitString";
inline constexpr std::string_view kNull     = "Null";
inline constexpr std::string_view kSval     = "sval";
inline constexpr std::string_view kStr      = "str";
inline constexpr std::string_view kIval     = "ival";
inline constexpr std::string_view kFval     = "fval";
inline constexpr std::string_view kBoolval  = "boolval";
inline constexpr std::string_view kBsval    = "bsval";
inline constexpr std::string_view kIsnull   = "isnull";

// Common error messages
inline constexpr std::string_view kUnknownParseError = "Unknown parse error";

} // namespace querygate::ast::keys
