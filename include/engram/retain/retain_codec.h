#pragma once

#include <string>
#include <vector>
#include <engram/core/types.h>
#include <engram/retain/retain_pipeline.h>

namespace engram::retain {

// JSON payload of a retain_batch operation; times are epoch milliseconds
std::string encodeRetainItems(const std::vector<RetainItem>& items);
Result<std::vector<RetainItem>> decodeRetainItems(const std::string& payload);

// JSON summary stored as the result of a completed retain_batch operation
std::string encodeBatchResult(const RetainBatchResult& result);

} // namespace engram::retain
