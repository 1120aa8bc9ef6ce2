#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "context.hpp"
#include "dialect.hpp"
#include "cursor.hpp"
#include "db.hpp"
#include "logging_cursor.hpp"
#include "field.hpp"
#include "sequence.hpp"
#include "constraints.hpp"
#include "sql_schema.hpp"
#include "record.hpp"
#include "table.hpp"
#include "view.hpp"
#include "record_list.hpp"
#include "query.hpp"
#include "query_result.hpp"
#include "transaction.hpp"
#include "serialize_json.hpp"

#endif // __cplusplus
