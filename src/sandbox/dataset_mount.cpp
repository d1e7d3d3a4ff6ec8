/**
 * @file dataset_mount.cpp
 * @brief SharedDatasetMount implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/dataset_mount.hpp"

#include <sys/statvfs.h>

namespace sandbox_runner {

Result<std::shared_ptr<const SharedDatasetMount>> SharedDatasetMount::open(
    const std::filesystem::path& host_path, std::string mount_name) {
    if (mount_name.empty() || mount_name.find('/') != std::string::npos
        || mount_name == "." || mount_name == "..") {
        return Error{ErrorKind::Validation, "Invalid dataset mount name: " + mount_name};
    }

    std::error_code ec;
    auto canonical = std::filesystem::canonical(host_path, ec);
    if (ec) {
        return Error{ErrorKind::Provision,
                     "Dataset path unavailable: " + host_path.string() + " (" + ec.message() + ")"};
    }
    if (!std::filesystem::is_directory(canonical, ec)) {
        return Error{ErrorKind::Provision, "Dataset path is not a directory: " + canonical.string()};
    }

    struct statvfs info{};
    bool read_only = ::statvfs(canonical.c_str(), &info) == 0 && (info.f_flag & ST_RDONLY) != 0;

    return std::shared_ptr<const SharedDatasetMount>(
        new SharedDatasetMount(std::move(canonical), std::move(mount_name), read_only));
}

}  // namespace sandbox_runner
