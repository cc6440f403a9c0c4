#ifndef CORE_WRITER_HPP
#define CORE_WRITER_HPP

#include <fstream>
#include <memory>
#include <ostream>
#include <string>

#include "../../config/config.hpp"
#include "../../utils/errors.hpp"
#include "../record.hpp"

namespace core::writer {
class Writer {
public:
    virtual ~Writer() = default;

    virtual Err Begin() = 0;
    virtual Err Write(const AccessRecord &record) = 0;
    virtual Err Finish() = 0;
};

std::unique_ptr<Writer> MakeWriter(config::OutputFormat format,
                                   std::ostream &out);

// Opens `path` for writing, creating missing parent directories.
Err OpenOutput(const std::string &path, std::ofstream &file);

// Text of one column as exported, empty for missing values.
std::string FieldText(const AccessRecord &record, Column column);
}  // namespace core::writer

#endif
