#ifndef SEQL_H_
#define SEQL_H_

// SEQL - lazy, pull-based sequence adapters for C++23.
// Every adapter takes a sequence (a range or a cursor) and returns a cursor
// that pulls from its source only when it is itself pulled.

#include "seql_core.h"
#include "seql_stages.h"
#include "seql_zip.h"

#endif //SEQL_H_
