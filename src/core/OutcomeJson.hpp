#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "FetchTypes.hpp"

namespace PageFetch {

// url, ok, then status/bytes/content_type/elapsed_ms/attempts on success or
// error/message/attempts (and status when known) on failure.
nlohmann::json ToJson(const FetchOutcome& outcome);

// Compact single-line form. Invalid UTF-8 in any string is replaced with U+FFFD.
std::string ToJsonLine(const FetchOutcome& outcome);

}
