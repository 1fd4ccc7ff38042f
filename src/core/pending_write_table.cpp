#include "csvsplit/pending_write_table.hpp"

#include <string>
#include <utility>

#include "csvsplit/errors.hpp"

namespace csvsplit {

PendingWrite& PendingWriteTable::insert(uint64_t id, PendingWrite write) {
    auto result = writes_.emplace(id, std::move(write));
    if (!result.second) {
        throw EngineError("Duplicate write id " + std::to_string(id));
    }
    return result.first->second;
}

PendingWrite PendingWriteTable::remove(uint64_t id) {
    auto it = writes_.find(id);
    if (it == writes_.end()) {
        throw EngineError("No pending write with id " + std::to_string(id));
    }

    PendingWrite write = std::move(it->second);
    writes_.erase(it);
    return write;
}

PendingWrite* PendingWriteTable::find(uint64_t id) {
    auto it = writes_.find(id);
    return it == writes_.end() ? nullptr : &it->second;
}

}  // namespace csvsplit
