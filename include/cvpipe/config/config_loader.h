#pragma once

#include <filesystem>

#include <cvpipe/config/config_helpers.h>
#include <cvpipe/core/types.h>
#include <cvpipe/pipeline/pipeline_config.h>

namespace cvpipe::config {

/**
 * @brief Overlay a config file onto a base PipelineConfig
 *
 * Recognised sections are [extraction], [pipeline] and [scoring]; unknown keys are
 * logged at debug level and ignored. A malformed value fails the whole load with
 * InvalidArgument naming "section.key".
 *
 * @return The merged config, FileNotFound when the file cannot be read
 */
Result<pipeline::PipelineConfig> loadPipelineConfig(const std::filesystem::path& path,
                                                    pipeline::PipelineConfig base = {});

/**
 * @brief Same as loadPipelineConfig, over already parsed sections
 * @param baseDir Directory relative file references (job_description_file) resolve against
 */
Result<pipeline::PipelineConfig> applyConfigSections(const ConfigSections& sections,
                                                     pipeline::PipelineConfig base,
                                                     const std::filesystem::path& baseDir = {});

} // namespace cvpipe::config
