#pragma once

#include "../instance.hpp"
#include <string>
#include <vector>

namespace instman {

// Durable storage for instance records. Every method throws StorageError
// when the backing store cannot be written.
class IInstanceStore {
public:
    virtual ~IInstanceStore() = default;

    virtual std::vector<Instance> load_all() = 0;
    virtual void save(const Instance& instance) = 0;
    virtual void remove(const std::string& id) = 0;
};

} // namespace instman
