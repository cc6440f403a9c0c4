#include "csv_writer.hpp"

#include "../../utils/logger.hpp"

namespace core::writer {
std::string CsvWriter::Escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }

    std::string res = "\"";
    for (char c : field) {
        if (c == '"') res.push_back('"');
        res.push_back(c);
    }
    res.push_back('"');
    return res;
}

Err CsvWriter::Begin() {
    for (usize i = 0; i < ColumnName.size(); i++) {
        if (i) out_ << ',';
        out_ << ColumnName[i];
    }
    out_ << "\r\n";
    return out_ ? Err::Ok : Err::OutputWriteFailed;
}

Err CsvWriter::Write(const AccessRecord &record) {
    for (usize i = 0; i < static_cast<usize>(Column::Count); i++) {
        if (i) out_ << ',';
        out_ << Escape(FieldText(record, static_cast<Column>(i)));
    }
    out_ << "\r\n";
    if (!out_) {
        logger::Error("CSV write failed");
        return Err::OutputWriteFailed;
    }
    return Err::Ok;
}

Err CsvWriter::Finish() {
    out_.flush();
    return out_ ? Err::Ok : Err::OutputWriteFailed;
}
}  // namespace core::writer
