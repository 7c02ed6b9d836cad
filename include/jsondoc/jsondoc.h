#pragma once

#include <jsondoc/core/Decimal.h>
#include <jsondoc/core/Key.h>
#include <jsondoc/core/Path.h>
#include <jsondoc/core/Value.h>
#include <jsondoc/core/Registry.h>
#include <jsondoc/core/Fragment.h>
#include <jsondoc/core/bridge.h>
#include <jsondoc/parser/json.h>
#include <jsondoc/schema/Schema.h>
#include <jsondoc/schema/SchemaValidator.h>
#include <jsondoc/fmt_support.h>
#include <jsondoc/support/logging.h>

/////////////////////////////////////////////////////////////////////////////
/// jsondoc initialization macro
/// This macro must be instantiated once in a program before using
/// jsondoc::* services.
/////////////////////////////////////////////////////////////////////////////
#define JSONDOC_INIT \
    JSONDOC_INIT_REGISTRY;
