#include "OutcomeJson.hpp"

namespace PageFetch {

nlohmann::json ToJson(const FetchOutcome& outcome) {
    nlohmann::json line;
    line["url"] = outcome.Url();
    line["ok"] = outcome.IsOk();
    if (outcome.IsOk()) {
        const auto& result = outcome.Result();
        line["status"] = result.status_code;
        line["bytes"] = result.content.size();
        line["content_type"] = result.content_type;
        line["elapsed_ms"] = result.elapsed.count();
        line["attempts"] = result.attempts;
        if (result.effective_url != result.url) line["effective_url"] = result.effective_url;
    } else {
        const auto& error = outcome.Error();
        line["error"] = ToString(error.kind);
        line["message"] = error.message;
        line["attempts"] = error.attempts;
        if (error.status_code) line["status"] = *error.status_code;
    }
    return line;
}

std::string ToJsonLine(const FetchOutcome& outcome) {
    return ToJson(outcome).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
