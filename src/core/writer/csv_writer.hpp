#ifndef CORE_WRITER_CSV_WRITER_HPP
#define CORE_WRITER_CSV_WRITER_HPP

#include <string>
#include <string_view>

#include "writer.hpp"

namespace core::writer {
// RFC 4180 style: minimal quoting, doubled quotes, CRLF line endings.
class CsvWriter : public Writer {
public:
    explicit CsvWriter(std::ostream &out) : out_(out) {}

    Err Begin() override;
    Err Write(const AccessRecord &record) override;
    Err Finish() override;

    static std::string Escape(std::string_view field);

private:
    std::ostream &out_;
};
}  // namespace core::writer

#endif
