/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "rwork/types.hpp"

namespace rwork {

class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Remote store of job records. The worker does its own filtering, so
// fetchAll() returns every job regardless of owner or status.
class JobSource {
public:
    virtual ~JobSource() = default;

    [[nodiscard]] virtual std::vector<Job> fetchAll() = 0;

    // Overwrites the mutable fields of a job. No check against the previous
    // state is made. Throws RegistryError on failure.
    virtual void update(const JobId& id, int progress, Status status,
                        const std::string& timeEstimate) = 0;
};

}
