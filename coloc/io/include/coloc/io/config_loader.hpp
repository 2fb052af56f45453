#pragma once

/// @file config_loader.hpp
/// @brief Loading the controller configuration from JSON.
/// @ingroup io_loaders

#include <coloc/core/colocation.hpp>
#include <coloc/core/job.hpp>
#include <coloc/core/types.hpp>
#include <coloc/host/runner_settings.hpp>

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace coloc::io {

/// @brief Everything needed to start one controller run.
/// @ingroup io_loaders
struct RunConfig {
    core::ControllerConfig controller;
    core::JobCatalog jobs;
    host::RunnerSettings runner;
    /// Window over which each utilization sample is measured.
    core::Duration sample_interval{core::duration_from_milliseconds(200)};
};

/// @brief Load a run configuration from a JSON file.
///
/// @param path          Filesystem path of the configuration.
/// @param online_cores  Core count used when the file has no `cores` field.
///
/// @throws LoaderError  If the file cannot be read, is not valid JSON, or
///                      fails validation.
///
/// @see load_config_from_string
[[nodiscard]] RunConfig load_config(const std::filesystem::path& path, uint32_t online_cores);

/// @brief Load a run configuration from a JSON string.
///
/// Missing fields take their defaults: `cores` is @p online_cores, the
/// service is `memcached` with home core 0 and shared core 1, `slots` is one
/// slot made of every non-home core, `restore` equals `low`, and a job's
/// `threads` is left unset so that it follows the size of its slot.
///
/// @throws LoaderError  If the JSON is malformed or the configuration is
///                      inconsistent (see core::ControllerConfig::validate).
[[nodiscard]] RunConfig load_config_from_string(std::string_view json, uint32_t online_cores);

} // namespace coloc::io
