#pragma once
#include <optional>
#include <string>
#include <vector>

namespace Ferret {
namespace Storage {

class Storage {
public:
    virtual ~Storage() = default;

    // Writes must be atomic: a reader sees either the old value or the new one.
    virtual bool                       save(const std::string& key, const std::string& content) = 0;
    virtual std::optional<std::string> load(const std::string& key) const                       = 0;
    virtual bool                       remove(const std::string& key)                           = 0;
    virtual std::vector<std::string>   keys() const                                             = 0;
    virtual size_t                     total_bytes() const                                      = 0;
    virtual void                       clear()                                                  = 0;
};

}  // namespace Storage
}  // namespace Ferret
