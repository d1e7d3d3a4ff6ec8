/**
 * @file dataset_mount.hpp
 * @brief Process-wide read-only view of the externally mounted dataset.
 * @author Dimitris Kafetzis
 *
 * The object-storage bucket is mounted on the host by the deployment layer.
 * SharedDatasetMount is opened once at start-up, injected into the backend
 * and the executor, and never torn down before process exit. The core only
 * ever reads through it.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace sandbox_runner {

class SharedDatasetMount {
public:
    /**
     * @brief Validate and open the dataset directory.
     *
     * Fails if the path is missing or not a directory. A writable host
     * mount is accepted (sandboxes still only see it read-only) but
     * reported through read_only().
     */
    static Result<std::shared_ptr<const SharedDatasetMount>> open(
        const std::filesystem::path& host_path, std::string mount_name);

    [[nodiscard]] const std::filesystem::path& host_path() const noexcept { return host_path_; }
    [[nodiscard]] const std::string& mount_name() const noexcept { return mount_name_; }

    /// True when the host filesystem itself is mounted read-only.
    [[nodiscard]] bool read_only() const noexcept { return read_only_; }

    /// Path at which sandboxed code sees the dataset.
    [[nodiscard]] std::filesystem::path path_in(const std::filesystem::path& workdir) const {
        return workdir / mount_name_;
    }

private:
    SharedDatasetMount(std::filesystem::path host_path, std::string mount_name, bool read_only)
        : host_path_(std::move(host_path))
        , mount_name_(std::move(mount_name))
        , read_only_(read_only) {}

    std::filesystem::path host_path_;
    std::string mount_name_;
    bool read_only_;
};

using DatasetHandle = std::shared_ptr<const SharedDatasetMount>;

}  // namespace sandbox_runner
