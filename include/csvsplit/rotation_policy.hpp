#ifndef CSVSPLIT_ROTATION_POLICY_HPP
#define CSVSPLIT_ROTATION_POLICY_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "record.hpp"

namespace csvsplit {

/**
 * Decides where output files end.
 *
 * A file is closed before the record that would exceed max_rows, unless a
 * grouping column is configured and the record continues the current run
 * (same value in that column as the previous record). Runs are therefore
 * never split; a file can hold more than max_rows rows to keep a run whole.
 * The input is assumed to be sorted by the grouping column.
 */
class RotationPolicy {
public:
    /**
     * @param max_rows Rows per file before a rotation is considered (> 0)
     * @param group_column Zero-based column whose runs must stay together
     */
    RotationPolicy(size_t max_rows, std::optional<size_t> group_column);

    /**
     * Whether record must go to a new file.
     */
    bool needs_rotation(const Record& record) const;

    /**
     * Account for record being written to the current file.
     */
    void record_written(const Record& record);

    /**
     * A new file was started.
     */
    void start_file() { on_row_ = 0; }

    size_t rows_in_file() const { return on_row_; }
    size_t max_rows() const { return max_rows_; }
    const std::optional<size_t>& group_column() const { return group_column_; }

private:
    bool continues_run(const Record& record) const;

    size_t max_rows_;
    std::optional<size_t> group_column_;
    size_t on_row_ = 0;
    bool has_key_ = false;
    std::string last_key_;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_ROTATION_POLICY_HPP
