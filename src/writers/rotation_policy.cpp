#include "csvsplit/rotation_policy.hpp"

#include <stdexcept>

namespace csvsplit {

RotationPolicy::RotationPolicy(size_t max_rows, std::optional<size_t> group_column)
    : max_rows_(max_rows), group_column_(group_column) {
    if (max_rows == 0) {
        throw std::invalid_argument("max_rows must be greater than zero");
    }
}

bool RotationPolicy::continues_run(const Record& record) const {
    if (!group_column_ || !has_key_) {
        return false;
    }
    const size_t column = *group_column_;
    return record.size() > column && record[column] == last_key_;
}

bool RotationPolicy::needs_rotation(const Record& record) const {
    return on_row_ >= max_rows_ && !continues_run(record);
}

void RotationPolicy::record_written(const Record& record) {
    on_row_++;

    if (!group_column_) {
        return;
    }

    // Rows too short to have the column start a keyless run
    const size_t column = *group_column_;
    if (record.size() > column) {
        last_key_.assign(record[column]);
        has_key_ = true;
    } else {
        has_key_ = false;
    }
}

}  // namespace csvsplit
