
#pragma once
#include "status.hpp"
#include <string>
#include <vector>

// Append-only outcome logs, one stream per check
class LogStore {
public:
    virtual ~LogStore() = default;

    virtual Status append(const std::string& stream_id, const std::string& record) = 0;
    virtual Result<std::vector<std::string>> list_active_streams() = 0;
    virtual Status compress(const std::string& stream_id, const std::string& archive_id) = 0;
    virtual Status truncate(const std::string& stream_id) = 0;
};
