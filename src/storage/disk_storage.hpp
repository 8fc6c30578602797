#pragma once
#include <atomic>
#include <string>
#include "storage.hpp"

namespace Ferret {
namespace Storage {

/**
 * One file per key under base_path. Keys are used verbatim as file names
 * and must not contain path separators.
 */
class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    bool                       save(const std::string& key, const std::string& content) override;
    std::optional<std::string> load(const std::string& key) const override;
    bool                       remove(const std::string& key) override;
    std::vector<std::string>   keys() const override;
    size_t                     total_bytes() const override;
    void                       clear() override;

    const std::string& base_path() const {
        return base_path_;
    }

private:
    std::string                 base_path_;
    std::atomic<unsigned long>  tmp_counter_{0};

    static constexpr const char* TMP_SUFFIX = ".tmp";
};

}  // namespace Storage
}  // namespace Ferret
