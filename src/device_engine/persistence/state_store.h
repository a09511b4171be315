#ifndef CAPTUREHUB_STATE_STORE_H
#define CAPTUREHUB_STATE_STORE_H

#include "../device_types.h"

#include <string>
#include <vector>

namespace capturehub {
namespace devices {
namespace persistence {

/**
 * @class StateStore
 * @brief Saves and restores the manually added devices of one domain as YAML.
 * @details The file lives at `<storage_path>/<domain>.yaml` and is replaced atomically through a
 *          temporary file. Credentials are written only when `persist_credentials` is set. Status
 *          is never persisted; restored devices start as unknown.
 */
class StateStore {
public:
    StateStore(std::string storage_path, std::string domain, bool persist_credentials);

    std::string file_path() const;

    /** @return false (after logging) if the file could not be written. */
    bool save(const std::vector<DeviceInfo>& devices) const;

    /**
     * @brief Reads the stored devices. A missing file yields an empty list; malformed entries
     *        are logged and skipped.
     */
    std::vector<DeviceInfo> load() const;

private:
    std::string storage_path_;
    std::string domain_;
    bool persist_credentials_;
};

} // namespace persistence
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_STATE_STORE_H
