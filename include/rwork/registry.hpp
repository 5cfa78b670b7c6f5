/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "rwork/job_source.hpp"
#include "rwork/types.hpp"

namespace rwork {

enum class SubmissionError : uint8_t {
    None = 0,
    IoError,
    InvalidContent,
    WorkspaceError
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Job registry kept in a directory tree:
//   <root>/writing/<id>/   submissions being staged
//   <root>/jobs/<id>/      published jobs (request.txt + status.txt)
class Registry final : public JobSource {
public:
    explicit Registry(const std::filesystem::path& root, bool createIfMissing = true);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) noexcept = default;
    Registry& operator=(Registry&&) noexcept = default;

    [[nodiscard]] SubmitResult submit(const std::string& worker, const std::string& mapPath,
                                      const std::string& sequencePath, const std::string& configPath);

    [[nodiscard]] std::vector<Job> fetchAll() override;
    void update(const JobId& id, int progress, Status status,
                const std::string& timeEstimate) override;

    [[nodiscard]] std::optional<Job> get(const JobId& id) const;
    [[nodiscard]] bool exists(const JobId& id) const noexcept;

    // External reset of a job back to ready_to_start.
    void requeue(const JobId& id);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;

    [[nodiscard]] bool createLayout(bool createIfMissing) noexcept;
    [[nodiscard]] static JobId generateId();
    [[nodiscard]] std::filesystem::path jobPath(const JobId& id) const;
    [[nodiscard]] std::optional<Job> readJob(const std::filesystem::path& dir) const;
    void writeStatus(const std::filesystem::path& dir, int progress, Status status,
                     const std::string& timeEstimate) const;
};

}
