// PCREKit - Public Header
// Safe, reusable sessions over the PCRE2 matching engine
// Copyright (c) 2026 greenteng.com

#ifndef PCREKIT_H
#define PCREKIT_H

#include "version.h"
#include "pcrekit_config.h"
#include "pcrekit_error.h"
#include "pcrekit_match.h"
#include "pcrekit_iter.h"
#include "pcrekit_regex.h"

#endif // PCREKIT_H
