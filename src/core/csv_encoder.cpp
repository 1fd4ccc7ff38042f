#include "csvsplit/record.hpp"

#include <cstring>

namespace csvsplit {

bool CsvEncoder::needs_quoting(std::string_view field, bool only_field) const {
    if (field.empty()) {
        return only_field;
    }
    for (char c : field) {
        if (c == dialect_.delimiter || c == dialect_.quote || c == '\n' || c == '\r') {
            return true;
        }
    }
    return false;
}

size_t CsvEncoder::encoded_size(const Record& record) const {
    const bool only_field = record.size() == 1;
    size_t size = record.empty() ? 0 : record.size() - 1;  // delimiters

    for (const auto& field : record) {
        size += field.size();
        if (needs_quoting(field, only_field)) {
            size += 2;
            for (char c : field) {
                if (c == dialect_.quote) {
                    size++;
                }
            }
        }
    }

    return size + 1;  // terminator
}

size_t CsvEncoder::encode(const Record& record, char* out) const {
    const bool only_field = record.size() == 1;
    char* cursor = out;

    for (size_t i = 0; i < record.size(); ++i) {
        if (i > 0) {
            *cursor++ = dialect_.delimiter;
        }

        const std::string& field = record[i];
        if (!needs_quoting(field, only_field)) {
            std::memcpy(cursor, field.data(), field.size());
            cursor += field.size();
            continue;
        }

        *cursor++ = dialect_.quote;
        for (char c : field) {
            if (c == dialect_.quote) {
                *cursor++ = dialect_.quote;
            }
            *cursor++ = c;
        }
        *cursor++ = dialect_.quote;
    }

    *cursor++ = dialect_.terminator;
    return static_cast<size_t>(cursor - out);
}

void CsvEncoder::append(const Record& record, std::string& out) const {
    const size_t start = out.size();
    out.resize(start + encoded_size(record));
    encode(record, &out[start]);
}

}  // namespace csvsplit
