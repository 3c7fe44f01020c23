
#pragma once
#include "log_store.hpp"
#include "status.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

struct RotationReport {
    Status status;
    size_t streams = 0;
    size_t rotated = 0;
    size_t failed = 0;
};

// Compresses each active log stream into an archive, then empties it.
// A stream is only truncated after its own compression succeeded.
class LogRotator {
public:
    using Clock = std::function<int64_t()>;

    explicit LogRotator(LogStore& store, Clock clock = Clock());

    RotationReport rotate();

    static std::string archive_id_for(const std::string& stream_id, int64_t now_millis);

private:
    bool rotate_stream(const std::string& stream_id);

    LogStore& store_;
    Clock clock_;
};
