
#pragma once

#include "check_registry.hpp"
#include "config.hpp"
#include <sw/redis++/redis++.h>
#include <memory>
#include <string>
#include <unordered_map>

// Checks stored as one Redis hash per check, ids indexed in a set
class RedisCheckRegistry : public CheckRegistry {
public:
    explicit RedisCheckRegistry(const Config& config);

    Result<std::vector<Check>> list_checks() override;
    Status write_check(const Check& check) override;

    bool check_health();

    // Builds a Check from hash fields; unparsable values are left at their
    // defaults so validation rejects the record later.
    static Check decode(const std::string& id, const std::unordered_map<std::string, std::string>& fields);

private:
    std::string key_for(const std::string& id) const;

    Config config_;
    std::unique_ptr<sw::redis::Redis> redis_;
};
