/**
 * @file settings_loader.h
 * @brief Builds EngineSettings from defaults, a YAML file and the environment.
 * @details Layers are applied in that order; each later layer only overrides keys it
 *          actually provides. Malformed values are logged and skipped so the previous
 *          layer's value stays in effect.
 */
#ifndef CAPTUREHUB_SETTINGS_LOADER_H
#define CAPTUREHUB_SETTINGS_LOADER_H

#include "device_engine_settings.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace capturehub {
namespace config {

/** Returns the value of an environment variable, or nullopt when unset. */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_environment();

/** @brief /etc/capturehub, $HOME/.config/capturehub, then ./.capturehub (config.yaml in each). */
std::vector<std::string> default_config_search_paths();

/**
 * @brief Applies a YAML document to `settings`.
 * @return false if the document could not be parsed at all.
 */
bool apply_yaml_text(const std::string& yaml_text, EngineSettings& settings);

/** @brief Applies a YAML file. @return false if it cannot be read or parsed. */
bool apply_config_file(const std::string& path, EngineSettings& settings);

/**
 * @brief Applies CAPTUREHUB_* overrides.
 * @details Recognized: CAPTUREHUB_LOG_LEVEL, CAPTUREHUB_STORAGE_PATH and, for each of
 *          LOCAL and NETWORK, CAPTUREHUB_<D>_SCAN_INTERVAL, _DISCOVERY_METHODS (comma list),
 *          _DISCOVERY_ENABLED, _PROBE_INTERVAL, _PROBE_FAILURE_THRESHOLD, _REMOVAL_GRACE_CYCLES.
 */
void apply_environment(const EnvLookup& env, EngineSettings& settings);

/**
 * @brief Full load: defaults, then the first existing file (explicit path first), then env.
 * @details An explicit path that cannot be loaded is reported and skipped.
 */
EngineSettings load_engine_settings(const std::string& explicit_path = "",
                                    const EnvLookup& env = process_environment());

} // namespace config
} // namespace capturehub

#endif // CAPTUREHUB_SETTINGS_LOADER_H
