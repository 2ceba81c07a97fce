#pragma once

// TEMPO - human-readable Period and Instant text codecs
//
// Period:  "1y2w3d4h5m6.007008009s" <-> seconds + nanoseconds
// Instant: "2018-10-11T03:23:38+00:00" <-> absolute time + fixed offset
//
// All fallible operations return tempo::expected<T, InvalidSpecification>.

#include "tempo/error.hpp"
#include "tempo/expected.hpp"
#include "tempo/instant.hpp"
#include "tempo/json.hpp"
#include "tempo/log.hpp"
#include "tempo/period.hpp"
#include "tempo/timeout.hpp"
